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
#include "provider_registry.h"

#include "logger.h"
#include "scopeview_config.h"

#include <exception>

using cpp26::reflect::FieldInfo;
using cpp26::reflect::FieldType;
using cpp26::reflect::TypeInfo;

namespace {

// Reads any numeric field as float (far clip may be authored as int/double)
LookupResult<float> ReadScalar(const FieldInfo* field, const Component& component) {
    if (!field) return std::unexpected(LookupError::FieldMissing);
    const void* obj = component.Instance();
    switch (field->type) {
        case FieldType::Float:  return field->getFloat(obj);
        case FieldType::Double: return static_cast<float>(field->getDouble(obj));
        case FieldType::Int:    return static_cast<float>(field->getInt(obj));
        default:                return std::unexpected(LookupError::FieldMissing);
    }
}

} // anonymous namespace

// ============================================================================
// ReflectedTypeCatalog
// ============================================================================

const TypeInfo* ReflectedTypeCatalog::FindByName(std::string_view name) const {
    return cpp26::reflect::TypeRegistry::Get().findByName(name);
}

void ReflectedTypeCatalog::ForEachType(const std::function<bool(const TypeInfo&)>& visitor) const {
    cpp26::reflect::TypeRegistry::Get().forEach(visitor);
}

// ============================================================================
// ProviderBinding
// ============================================================================

std::optional<ProviderBinding> ProviderBinding::FromType(const TypeInfo& type) {
    const FieldInfo* fov = type.getField(shape_config::kFovField, FieldType::Float);
    if (!fov) return std::nullopt;

    ProviderBinding b;
    b.type = &type;
    b.fov = fov;
    b.nearClip = type.getField(shape_config::kNearClipField);
    b.farClip = type.getField(shape_config::kFarClipField);
    b.cullingMask = type.getField(shape_config::kCullingMaskField, FieldType::Int);
    b.cullingScale = type.getField(shape_config::kCullingScaleField);
    return b;
}

bool ProviderBinding::Matches(const Component& component) const {
    return type && &component.Type() == type;
}

LookupResult<float> ProviderBinding::ReadFov(const Component& component) const {
    if (!Matches(component)) return std::unexpected(LookupError::FieldMissing);
    return fov->getFloat(component.Instance());
}

LookupResult<float> ProviderBinding::ReadNearClip(const Component& component) const {
    if (!Matches(component)) return std::unexpected(LookupError::FieldMissing);
    return ReadScalar(nearClip, component);
}

LookupResult<float> ProviderBinding::ReadFarClip(const Component& component) const {
    if (!Matches(component)) return std::unexpected(LookupError::FieldMissing);
    return ReadScalar(farClip, component);
}

LookupResult<int> ProviderBinding::ReadCullingMask(const Component& component) const {
    if (!Matches(component) || !cullingMask) return std::unexpected(LookupError::FieldMissing);
    return cullingMask->getInt(component.Instance());
}

LookupResult<float> ProviderBinding::ReadCullingScale(const Component& component) const {
    if (!Matches(component)) return std::unexpected(LookupError::FieldMissing);
    return ReadScalar(cullingScale, component);
}

// ============================================================================
// ProviderRegistry
// ============================================================================

const char* DiscoveryMethod_Name(DiscoveryMethod method) {
    switch (method) {
        case DiscoveryMethod::None:      return "None";
        case DiscoveryMethod::KnownName: return "KnownName";
        case DiscoveryMethod::Scan:      return "Scan";
        case DiscoveryMethod::Adopted:   return "Adopted";
        default:                         return "Unknown";
    }
}

ProviderRegistry::ProviderRegistry(const ITypeCatalog& catalog) : m_catalog(catalog) {}

const ProviderBinding* ProviderRegistry::Resolve() {
    if (!m_searched) {
        m_searched = true;
        if (!m_binding) Discover();
    }
    return m_binding ? &*m_binding : nullptr;
}

bool ProviderRegistry::Adopt(const ProviderBinding& binding) {
    if (m_binding || !binding.type || !binding.fov) return false;
    m_binding = binding;
    m_method = DiscoveryMethod::Adopted;
    LOG_INFO("[ProviderRegistry] Adopted camera-data shape from structural scan: {}", binding.type->name);
    return true;
}

void ProviderRegistry::Discover() {
    if (TryKnownNames()) return;

    LOG_DEBUG("[ProviderRegistry] Named lookup failed, scanning loaded types...");
    if (TryScan()) return;

    LOG_INFO("[ProviderRegistry] Camera-data shape NOT found, FOV falls back to zoom handler / manual config");
}

bool ProviderRegistry::TryKnownNames() {
    for (const char* name : shape_config::kKnownShapeNames) {
        try {
            const TypeInfo* type = m_catalog.FindByName(name);
            if (!type) continue;

            if (auto binding = ProviderBinding::FromType(*type)) {
                m_binding = *binding;
                m_method = DiscoveryMethod::KnownName;
                LOG_INFO("[ProviderRegistry] Found camera-data shape: {}", type->name);
                return true;
            }
        } catch (const std::exception& ex) {
            LOG_DEBUG("[ProviderRegistry] Lookup of '{}' failed: {}", name, ex.what());
        }
    }
    return false;
}

bool ProviderRegistry::TryScan() {
    try {
        m_catalog.ForEachType([this](const TypeInfo& type) {
            // First match wins: float FOV + float near clip + any far clip
            if (!type.getField(shape_config::kFovField, FieldType::Float)) return true;
            if (!type.getField(shape_config::kNearClipField, FieldType::Float)) return true;
            if (!type.getField(shape_config::kFarClipField)) return true;

            m_binding = ProviderBinding::FromType(type);
            m_method = DiscoveryMethod::Scan;
            LOG_INFO("[ProviderRegistry] Discovered camera-data shape via scan: {} (far clip {})", type.name,
                     cpp26::reflect::FieldType_Name(m_binding->farClip->type));
            return false;
        });
    } catch (const std::exception& ex) {
        LOG_WARN("[ProviderRegistry] Type scan aborted: {}", ex.what());
    }
    return m_binding.has_value();
}
