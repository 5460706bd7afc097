/*
 * Copyright (C) 2026 acerthyracer
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#include "scene_walker.h"

#include "logger.h"
#include "scene_query.h"

#include <exception>

const char* ProviderLocation_Name(ProviderLocation location) {
    switch (location) {
        case ProviderLocation::OnOptic:                   return "OnOptic";
        case ProviderLocation::InDescendants:             return "InDescendants";
        case ProviderLocation::InAncestors:               return "InAncestors";
        case ProviderLocation::SameVariantUnderScopeRoot: return "SameVariantUnderScopeRoot";
        default:                                          return "Unknown";
    }
}

LookupResult<ProviderHit> SceneWalker_FindProvider(const SceneNode& optic, const ProviderBinding& binding) {
    if (!binding.type) return std::unexpected(LookupError::NoBinding);
    const auto& type = *binding.type;

    try {
        if (const Component* c = SceneQuery_OnNode(optic, type))
            return ProviderHit{c, ProviderLocation::OnOptic};
        if (const Component* c = SceneQuery_InDescendants(optic, type))
            return ProviderHit{c, ProviderLocation::InDescendants};
        if (const Component* c = SceneQuery_InAncestors(optic, type))
            return ProviderHit{c, ProviderLocation::InAncestors};

        // Some scopes keep the camera data on a sibling node of the optic's variant
        const SceneNode& root = Hierarchy_FindScopeRoot(optic);
        const Component* match = nullptr;
        SceneQuery_ForEachComponent(root, [&](const Component& c) {
            if (!binding.Matches(c)) return true;
            if (!Hierarchy_IsSameVariant(c.Owner(), optic)) return true;
            match = &c;
            return false;
        });
        if (match) return ProviderHit{match, ProviderLocation::SameVariantUnderScopeRoot};
    } catch (const std::exception& ex) {
        LOG_DEBUG("[SceneWalker] Provider lookup failed: {}", ex.what());
        return std::unexpected(LookupError::QueryFailed);
    }

    return std::unexpected(LookupError::NoMatch);
}
