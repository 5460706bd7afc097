/*
 * Copyright (C) 2026 acerthyracer
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */
#include "config_manager.h"
#include "logger.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <toml++/toml.hpp>

// ============================================================================
// REFLECTION HELPERS
// ============================================================================

namespace {

template <typename T>
void SerializeStruct(toml::table& tbl, const T& obj, const char* sectionName) {
  toml::table section;
  cpp26::reflect::forEachField<T>([&](const cpp26::reflect::FieldInfo& field) {
    if (field.type == cpp26::reflect::FieldType::Int) {
      section.insert_or_assign(field.name, field.getInt(&obj));
    } else if (field.type == cpp26::reflect::FieldType::Float) {
      section.insert_or_assign(field.name, static_cast<double>(field.getFloat(&obj)));
    } else if (field.type == cpp26::reflect::FieldType::Bool) {
      section.insert_or_assign(field.name, field.getBool(&obj));
    }
  });
  tbl.insert_or_assign(sectionName, std::move(section));
}

template <typename T>
void DeserializeStruct(const toml::table& tbl, T& obj, const char* sectionName) {
  const auto* section = tbl.get_as<toml::table>(sectionName);
  if (!section) return;

  cpp26::reflect::forEachField<T>([&](const cpp26::reflect::FieldInfo& field) {
    const toml::node* val = section->get(field.name);
    if (!val) return;

    if (field.type == cpp26::reflect::FieldType::Int) {
      if (val->is_integer()) {
        field.setInt(&obj, static_cast<int>(val->as_integer()->get()));
      }
    } else if (field.type == cpp26::reflect::FieldType::Float) {
      if (val->is_floating_point()) {
        field.setFloat(&obj, static_cast<float>(val->as_floating_point()->get()));
      } else if (val->is_integer()) {
        field.setFloat(&obj, static_cast<float>(val->as_integer()->get()));
      }
    } else if (field.type == cpp26::reflect::FieldType::Bool) {
      if (val->is_boolean()) {
        field.setBool(&obj, val->as_boolean()->get());
      }
    }
  });
}

toml::table ToTable(const ScopeViewConfig& config) {
  toml::table tbl;
  SerializeStruct(tbl, config.zoom, "Zoom");
  SerializeStruct(tbl, config.render, "Render");
  SerializeStruct(tbl, config.stabilization, "Stabilization");
  SerializeStruct(tbl, config.system, "System");
  return tbl;
}

void FromTable(const toml::table& tbl, ScopeViewConfig& config) {
  DeserializeStruct(tbl, config.zoom, "Zoom");
  DeserializeStruct(tbl, config.render, "Render");
  DeserializeStruct(tbl, config.stabilization, "Stabilization");
  DeserializeStruct(tbl, config.system, "System");
}

} // anonymous namespace

void ClampConfig(ScopeViewConfig& config) {
  auto& z = config.zoom;
  z.scopedFov = std::clamp(z.scopedFov, 5.0f, 75.0f);
  z.defaultZoom = std::clamp(z.defaultZoom, 1.0f, 16.0f);
  z.scrollZoomSensitivity = std::clamp(z.scrollZoomSensitivity, 0.01f, 1.0f);
  z.scrollZoomMin = std::max(z.scrollZoomMin, 0.0f);
  z.scrollZoomMax = std::max(z.scrollZoomMax, 0.0f);

  config.render.lodBiasOverride = std::max(config.render.lodBiasOverride, 0.0f);
  config.render.maxLodLevelOverride = std::max(config.render.maxLodLevelOverride, 0);
  config.system.logVerbosity = std::clamp(config.system.logVerbosity, 0, 2);
}

int GetLogVerbosity() {
  return ConfigManager::Get().Snapshot().system.logVerbosity;
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

ConfigManager::ConfigManager() {
  InitConfigReflection();
}

ConfigManager &ConfigManager::Get() {
  static ConfigManager instance;
  return instance;
}

void ConfigManager::SetPath(const std::filesystem::path &path) {
  std::lock_guard<std::mutex> lock(m_configMutex);
  m_path = path;
  m_lastWriteTime = {};
}

bool ConfigManager::LoadFromString(const std::string &text, ScopeViewConfig &config) {
  InitConfigReflection();
  try {
    auto tbl = toml::parse(text);
    ScopeViewConfig parsed = config;
    FromTable(tbl, parsed);
    ClampConfig(parsed);
    config = parsed;
    return true;
  } catch (const std::exception &ex) {
    LOG_ERROR("[Config] Failed to parse TOML: {}", ex.what());
    return false;
  }
}

std::string ConfigManager::SaveToString(const ScopeViewConfig &config) {
  InitConfigReflection();
  std::ostringstream ss;
  ss << ToTable(config);
  return ss.str();
}

void ConfigManager::Load() {
  const auto path = m_path;

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    LOG_INFO("[Config] No config found at {}, writing defaults.", path.string());
    Save();
    return;
  }

  try {
    auto tbl = toml::parse_file(path.string());

    // Parse into a temporary config, then swap under lock to avoid tearing.
    ScopeViewConfig parsed = Snapshot();
    FromTable(tbl, parsed);
    ClampConfig(parsed);

    {
      std::lock_guard<std::mutex> lock(m_configMutex);
      m_config = parsed;
    }
    m_lastWriteTime = std::filesystem::last_write_time(path, ec);

    LOG_INFO("[Config] Loaded: autoFov={} scopedFov={:.1f} defaultZoom={:.1f} scrollZoom={} "
             "sens={:.2f} min={:.1f} max={:.1f} stabilize={}",
             parsed.zoom.autoFovFromScope, parsed.zoom.scopedFov, parsed.zoom.defaultZoom,
             parsed.zoom.enableScrollZoom, parsed.zoom.scrollZoomSensitivity,
             parsed.zoom.scrollZoomMin, parsed.zoom.scrollZoomMax, parsed.stabilization.enabled);
    if (parsed.render.lodBiasOverride > 0.0f || parsed.render.maxLodLevelOverride > 0) {
      LOG_WARN("[Config] Render overrides (lodBias={:.2f}, maxLOD={}) are not applied",
               parsed.render.lodBiasOverride, parsed.render.maxLodLevelOverride);
    }
  } catch (const std::exception &ex) {
    LOG_ERROR("[Config] Failed to parse {}: {}", path.string(), ex.what());
  }
}

void ConfigManager::Save() {
  // Take a snapshot under lock so we serialize a consistent state
  const ScopeViewConfig snapshot = Snapshot();

  std::ofstream file(m_path);
  if (!file) {
    LOG_ERROR("[Config] Cannot write {}", m_path.string());
    return;
  }
  file << ToTable(snapshot);
  file.close();

  std::error_code ec;
  m_lastWriteTime = std::filesystem::last_write_time(m_path, ec);
}

void ConfigManager::CheckHotReload() {
  std::error_code ec;
  if (!std::filesystem::exists(m_path, ec)) return;

  auto lastWrite = std::filesystem::last_write_time(m_path, ec);
  if (ec) {
    LOG_DEBUG("[Config] Hot-reload stat failed: {}", ec.message());
    return;
  }
  if (lastWrite > m_lastWriteTime) {
    LOG_INFO("[Config] Hot-reloading configuration...");
    Load();
  }
}

void ConfigManager::ResetToDefaults() {
  {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_config = ScopeViewConfig{};
  }
  Save();
}

ScopeViewConfig ConfigManager::Snapshot() const {
  std::lock_guard<std::mutex> lock(m_configMutex);
  return m_config;
}
