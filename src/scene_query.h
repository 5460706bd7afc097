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
#include <functional>
#include <string_view>

#include "scene_graph.h"

// ----------------------------------------------------------------------------
// Component queries. Unless stated otherwise each returns the first match.
// ----------------------------------------------------------------------------

// Component of exactly this shape on the node itself
const Component* SceneQuery_OnNode(const SceneNode& node, const cpp26::reflect::TypeInfo& type);
// Depth-first over descendants (node itself excluded)
const Component* SceneQuery_InDescendants(const SceneNode& node, const cpp26::reflect::TypeInfo& type);
// Nearest ancestor first (node itself excluded)
const Component* SceneQuery_InAncestors(const SceneNode& node, const cpp26::reflect::TypeInfo& type);

// Visits every component under root (root included), depth-first.
// Stops when the visitor returns false.
void SceneQuery_ForEachComponent(const SceneNode& root,
                                 const std::function<bool(const Component&)>& visitor);

// First component implementing capability T on the node or its ancestors
template <typename T>
const T* SceneQuery_CapabilityInSelfOrAncestors(const SceneNode& node) {
    for (const SceneNode* n = &node; n; n = n->Parent()) {
        for (std::size_t i = 0; i < n->ComponentCount(); ++i) {
            if (const T* cap = dynamic_cast<const T*>(n->ComponentAt(i))) return cap;
        }
    }
    return nullptr;
}

// First component implementing capability T on the node or its descendants
template <typename T>
const T* SceneQuery_CapabilityInSelfOrDescendants(const SceneNode& node) {
    const T* found = nullptr;
    SceneQuery_ForEachComponent(node, [&found](const Component& c) {
        found = dynamic_cast<const T*>(&c);
        return found == nullptr;
    });
    return found;
}

// ----------------------------------------------------------------------------
// Hierarchy naming contract
// ----------------------------------------------------------------------------

bool Hierarchy_HasPrefixNoCase(std::string_view name, std::string_view prefix);

// Nearest ancestor (node excluded) named with the scope-root prefix, or the
// hierarchy top when none is marked.
const SceneNode& Hierarchy_FindScopeRoot(const SceneNode& node);

// Nearest node (node included) carrying the variant marker, nullptr if none
const SceneNode* Hierarchy_FindVariant(const SceneNode& node);

// Both nodes resolve to the same variant node. Two marker-less nodes match.
bool Hierarchy_IsSameVariant(const SceneNode& a, const SceneNode& b);
