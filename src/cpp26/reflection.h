/*
 * Copyright (C) 2026 acerthyracer
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */
#pragma once

// ============================================================================
// C++26 POLYFILL: Field Reflection
// ============================================================================
// Macro-based reflection used for two things:
//   - generic TOML (de)serialization of config sections
//   - runtime shape discovery: host content registers its component structs
//     and the provider registry matches them by declared field names
//
// Usage:
//   REFLECT_STRUCT_BEGIN(MyData)
//     REFLECT_FIELD(float, FieldOfView, "Optic")
//     REFLECT_FIELD(int, OpticCullingMask, "Optic")
//   REFLECT_STRUCT_END()
//
// When std::meta ships:
//   Use actual reflection instead of X-macros
// ============================================================================

#include <cstddef>
#include <functional>
#include <mutex>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cpp26::reflect {

// ============================================================================
// FIELD METADATA
// ============================================================================

enum class FieldType { Int, Float, Double, Bool, Unknown };

template <typename T> constexpr FieldType getFieldType() {
  if constexpr (std::is_same_v<T, int>)
    return FieldType::Int;
  else if constexpr (std::is_same_v<T, float>)
    return FieldType::Float;
  else if constexpr (std::is_same_v<T, double>)
    return FieldType::Double;
  else if constexpr (std::is_same_v<T, bool>)
    return FieldType::Bool;
  else
    return FieldType::Unknown;
}

constexpr const char* FieldType_Name(FieldType t) {
  switch (t) {
    case FieldType::Int:    return "int";
    case FieldType::Float:  return "float";
    case FieldType::Double: return "double";
    case FieldType::Bool:   return "bool";
    default:                return "unknown";
  }
}

struct FieldInfo {
  std::string_view name;
  std::string_view category;
  FieldType type = FieldType::Unknown;
  std::size_t size = 0;

  // Accessor functions (set at registration, only the ones matching `type`)
  std::function<void(void* obj, int val)> setInt;
  std::function<int(const void* obj)> getInt;
  std::function<void(void* obj, float val)> setFloat;
  std::function<float(const void* obj)> getFloat;
  std::function<double(const void* obj)> getDouble;
  std::function<void(void* obj, bool val)> setBool;
  std::function<bool(const void* obj)> getBool;
};

// ============================================================================
// TYPE DESCRIPTOR
// ============================================================================

struct TypeInfo {
  std::string_view name;
  std::vector<FieldInfo> fields;

  const FieldInfo* getField(std::string_view fieldName) const {
    for (const auto& f : fields) {
      if (f.name == fieldName) return &f;
    }
    return nullptr;
  }

  // Field with the given name AND type, nullptr otherwise
  const FieldInfo* getField(std::string_view fieldName, FieldType type) const {
    const FieldInfo* f = getField(fieldName);
    return (f && f->type == type) ? f : nullptr;
  }
};

// ============================================================================
// TYPE REGISTRY (all reflected structs, in registration order)
// ============================================================================

class TypeRegistry {
public:
  static TypeRegistry& Get() {
    static TypeRegistry instance;
    return instance;
  }

  TypeRegistry(const TypeRegistry&) = delete;
  TypeRegistry& operator=(const TypeRegistry&) = delete;

  void add(const TypeInfo* info) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const TypeInfo* t : m_types) {
      if (t == info) return;
    }
    m_types.push_back(info);
  }

  const TypeInfo* findByName(std::string_view name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const TypeInfo* t : m_types) {
      if (t->name == name) return t;
    }
    return nullptr;
  }

  template <typename Func> void forEach(Func&& func) const {
    std::vector<const TypeInfo*> snapshot;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      snapshot = m_types;
    }
    for (const TypeInfo* t : snapshot) {
      if (!func(*t)) return;
    }
  }

private:
  TypeRegistry() = default;

  mutable std::mutex m_mutex;
  std::vector<const TypeInfo*> m_types;
};

// ============================================================================
// STRUCT REGISTRY
// ============================================================================

template <typename T> struct StructInfo {
  static TypeInfo& info() {
    static TypeInfo instance;
    return instance;
  }

  static std::size_t fieldCount() { return info().fields.size(); }

  static std::size_t registerField(FieldInfo field) {
    info().fields.push_back(std::move(field));
    return info().fields.size() - 1;
  }

  static const FieldInfo* getField(std::string_view fieldName) { return info().getField(fieldName); }
};

// ============================================================================
// REFLECTION REGISTRATION HELPER
// ============================================================================

template <typename StructT, typename FieldT> struct FieldRegistrar {
  FieldRegistrar(std::string_view name, std::string_view category, FieldT StructT::* memberPtr) {
    FieldInfo info;
    info.name = name;
    info.category = category;
    info.type = getFieldType<FieldT>();
    info.size = sizeof(FieldT);

    // Set up accessors based on type
    if constexpr (std::is_same_v<FieldT, int>) {
      info.setInt = [memberPtr](void* obj, int val) { static_cast<StructT*>(obj)->*memberPtr = val; };
      info.getInt = [memberPtr](const void* obj) -> int { return static_cast<const StructT*>(obj)->*memberPtr; };
    } else if constexpr (std::is_same_v<FieldT, float>) {
      info.setFloat = [memberPtr](void* obj, float val) { static_cast<StructT*>(obj)->*memberPtr = val; };
      info.getFloat = [memberPtr](const void* obj) -> float { return static_cast<const StructT*>(obj)->*memberPtr; };
    } else if constexpr (std::is_same_v<FieldT, double>) {
      info.getDouble = [memberPtr](const void* obj) -> double { return static_cast<const StructT*>(obj)->*memberPtr; };
    } else if constexpr (std::is_same_v<FieldT, bool>) {
      info.setBool = [memberPtr](void* obj, bool val) { static_cast<StructT*>(obj)->*memberPtr = val; };
      info.getBool = [memberPtr](const void* obj) -> bool { return static_cast<const StructT*>(obj)->*memberPtr; };
    }

    StructInfo<StructT>::registerField(std::move(info));
  }
};

// ============================================================================
// ITERATION HELPERS
// ============================================================================

template <typename T, typename Func> void forEachField(Func&& func) {
  for (const auto& f : StructInfo<T>::info().fields) {
    func(f);
  }
}

template <typename T, typename Func> void forEachFieldInCategory(std::string_view category, Func&& func) {
  for (const auto& f : StructInfo<T>::info().fields) {
    if (f.category == category) {
      func(f);
    }
  }
}

// ============================================================================
// MACROS FOR STRUCT DEFINITION
// ============================================================================

// Start reflecting a struct. StructName may be qualified; RegName is the
// identifier used for the registration namespace and the runtime type name.
#define REFLECT_STRUCT_BEGIN_AS(StructName, RegName)                                                                   \
  namespace reflect_##RegName##_impl {                                                                                 \
    using ReflectedType = StructName;                                                                                  \
    inline void registerFields() {                                                                                     \
      static bool registered = false;                                                                                  \
      if (registered) return;                                                                                          \
      registered = true;                                                                                               \
      ::cpp26::reflect::StructInfo<ReflectedType>::info().name = #RegName;

#define REFLECT_STRUCT_BEGIN(StructName) REFLECT_STRUCT_BEGIN_AS(StructName, StructName)

// REFLECT_FIELD(type, name, category)
#define REFLECT_FIELD(type, name, category)                                                                            \
  ::cpp26::reflect::FieldRegistrar<ReflectedType, type>(#name, category, &ReflectedType::name);

// Simpler macro without category (uses empty string)
#define REFLECT_FIELD_SIMPLE(type, name) REFLECT_FIELD(type, name, "")

// End struct reflection: registers the struct with the TypeRegistry
#define REFLECT_STRUCT_END()                                                                                           \
  ::cpp26::reflect::TypeRegistry::Get().add(&::cpp26::reflect::StructInfo<ReflectedType>::info());                    \
  }                                                                                                                    \
  inline struct Initializer {                                                                                          \
    Initializer() { registerFields(); }                                                                                \
  } _init;                                                                                                             \
  }

// ============================================================================
// FORCED REGISTRATION (call at module init)
// ============================================================================

#define REFLECT_INIT(RegName) reflect_##RegName##_impl::registerFields();

// Runtime type name of a reflected struct ("" until registered)
template <typename T> std::string_view typeName() { return StructInfo<T>::info().name; }

} // namespace cpp26::reflect
