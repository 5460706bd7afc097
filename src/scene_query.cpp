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
#include "scene_query.h"
#include "scopeview_config.h"

#include <cctype>
#include <vector>

namespace {

bool MatchesType(const Component* c, const cpp26::reflect::TypeInfo& type) {
    return c && &c->Type() == &type;
}

char LowerAscii(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool EqualsNoCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (LowerAscii(a[i]) != LowerAscii(b[i])) return false;
    }
    return true;
}

bool IsVariantNode(const SceneNode& node) {
    std::string_view name = node.Name();
    return Hierarchy_HasPrefixNoCase(name, hierarchy_config::kVariantPrefix) ||
           EqualsNoCase(name, hierarchy_config::kVariantExact);
}

} // anonymous namespace

const Component* SceneQuery_OnNode(const SceneNode& node, const cpp26::reflect::TypeInfo& type) {
    for (size_t i = 0; i < node.ComponentCount(); ++i) {
        const Component* c = node.ComponentAt(i);
        if (MatchesType(c, type)) return c;
    }
    return nullptr;
}

const Component* SceneQuery_InDescendants(const SceneNode& node, const cpp26::reflect::TypeInfo& type) {
    // Explicit stack, pushed in reverse so children are visited in order
    std::vector<const SceneNode*> stack;
    for (size_t i = node.ChildCount(); i > 0; --i) {
        if (const SceneNode* child = node.Child(i - 1)) stack.push_back(child);
    }
    while (!stack.empty()) {
        const SceneNode* current = stack.back();
        stack.pop_back();
        if (const Component* c = SceneQuery_OnNode(*current, type)) return c;
        for (size_t i = current->ChildCount(); i > 0; --i) {
            if (const SceneNode* child = current->Child(i - 1)) stack.push_back(child);
        }
    }
    return nullptr;
}

const Component* SceneQuery_InAncestors(const SceneNode& node, const cpp26::reflect::TypeInfo& type) {
    for (const SceneNode* p = node.Parent(); p; p = p->Parent()) {
        if (const Component* c = SceneQuery_OnNode(*p, type)) return c;
    }
    return nullptr;
}

void SceneQuery_ForEachComponent(const SceneNode& root,
                                 const std::function<bool(const Component&)>& visitor) {
    std::vector<const SceneNode*> stack{&root};
    while (!stack.empty()) {
        const SceneNode* current = stack.back();
        stack.pop_back();
        for (size_t i = 0; i < current->ComponentCount(); ++i) {
            const Component* c = current->ComponentAt(i);
            if (c && !visitor(*c)) return;
        }
        for (size_t i = current->ChildCount(); i > 0; --i) {
            if (const SceneNode* child = current->Child(i - 1)) stack.push_back(child);
        }
    }
}

bool Hierarchy_HasPrefixNoCase(std::string_view name, std::string_view prefix) {
    if (name.size() < prefix.size()) return false;
    return EqualsNoCase(name.substr(0, prefix.size()), prefix);
}

const SceneNode& Hierarchy_FindScopeRoot(const SceneNode& node) {
    const SceneNode* root = &node;
    while (const SceneNode* parent = root->Parent()) {
        root = parent;
        if (Hierarchy_HasPrefixNoCase(parent->Name(), hierarchy_config::kScopeRootPrefix)) break;
    }
    return *root;
}

const SceneNode* Hierarchy_FindVariant(const SceneNode& node) {
    for (const SceneNode* p = &node; p; p = p->Parent()) {
        if (IsVariantNode(*p)) return p;
    }
    return nullptr;
}

bool Hierarchy_IsSameVariant(const SceneNode& a, const SceneNode& b) {
    return Hierarchy_FindVariant(a) == Hierarchy_FindVariant(b);
}
