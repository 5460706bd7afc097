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
#include <functional>
#include <optional>
#include <string_view>

#include "cpp26/reflection.h"
#include "error_types.h"
#include "scene_graph.h"

// Loaded behaviour types the host can enumerate. Implementations may throw
// std::exception for types that fail to load; the registry isolates that.
class ITypeCatalog {
public:
    virtual ~ITypeCatalog() = default;

    virtual const cpp26::reflect::TypeInfo* FindByName(std::string_view name) const = 0;
    // Visits types in load order until the visitor returns false
    virtual void ForEachType(const std::function<bool(const cpp26::reflect::TypeInfo&)>& visitor) const = 0;
};

// Catalog over every struct registered through the REFLECT_* macros
class ReflectedTypeCatalog : public ITypeCatalog {
public:
    const cpp26::reflect::TypeInfo* FindByName(std::string_view name) const override;
    void ForEachType(const std::function<bool(const cpp26::reflect::TypeInfo&)>& visitor) const override;
};

// Camera-data shape matched at runtime plus its resolved field accessors.
// Only fov is guaranteed; the others are null when the shape lacks them.
struct ProviderBinding {
    const cpp26::reflect::TypeInfo* type = nullptr;
    const cpp26::reflect::FieldInfo* fov = nullptr;
    const cpp26::reflect::FieldInfo* nearClip = nullptr;
    const cpp26::reflect::FieldInfo* farClip = nullptr;
    const cpp26::reflect::FieldInfo* cullingMask = nullptr;
    const cpp26::reflect::FieldInfo* cullingScale = nullptr;

    // Binding for a shape exposing a float FOV field, nullopt otherwise
    static std::optional<ProviderBinding> FromType(const cpp26::reflect::TypeInfo& type);

    bool Matches(const Component& component) const;

    LookupResult<float> ReadFov(const Component& component) const;
    LookupResult<float> ReadNearClip(const Component& component) const;
    LookupResult<float> ReadFarClip(const Component& component) const;
    LookupResult<int> ReadCullingMask(const Component& component) const;
    LookupResult<float> ReadCullingScale(const Component& component) const;
};

enum class DiscoveryMethod : uint8_t {
    None,       // Not found (or not searched yet)
    KnownName,  // Matched one of the well-known shape names
    Scan,       // First type with FOV + near + far fields
    Adopted,    // Supplied later by the structural FOV scan
};

const char* DiscoveryMethod_Name(DiscoveryMethod method);

class ProviderRegistry {
public:
    explicit ProviderRegistry(const ITypeCatalog& catalog);

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    // Runs discovery on the first call only; afterwards returns the cached
    // result. nullptr means no shape is known.
    const ProviderBinding* Resolve();

    // Secondary binding found by the structural scan. Accepted only while
    // no binding is held. Never triggers or repeats discovery.
    bool Adopt(const ProviderBinding& binding);

    bool HasSearched() const { return m_searched; }
    DiscoveryMethod Method() const { return m_method; }

private:
    void Discover();
    bool TryKnownNames();
    bool TryScan();

    const ITypeCatalog& m_catalog;
    std::optional<ProviderBinding> m_binding;
    DiscoveryMethod m_method = DiscoveryMethod::None;
    bool m_searched = false;
};
