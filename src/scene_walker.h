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
#pragma once
#include <cstdint>

#include "error_types.h"
#include "provider_registry.h"
#include "scene_graph.h"

enum class ProviderLocation : uint8_t {
    OnOptic,
    InDescendants,
    InAncestors,
    SameVariantUnderScopeRoot,
};

const char* ProviderLocation_Name(ProviderLocation location);

struct ProviderHit {
    const Component* component = nullptr;
    ProviderLocation location = ProviderLocation::OnOptic;
};

// Camera-data provider instance belonging to the optic's own variant.
// Search order: optic node, descendants, ancestors, then every instance
// under the scope root whose variant node equals the optic's. A provider
// from another variant is never returned (LookupError::NoMatch).
// Host query exceptions surface as LookupError::QueryFailed.
LookupResult<ProviderHit> SceneWalker_FindProvider(const SceneNode& optic, const ProviderBinding& binding);
