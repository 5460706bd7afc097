#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <type_traits>

#include "cpp26/reflection.h"
#include "scopeview_config.h"

struct ZoomConfig {
  bool autoFovFromScope = true;
  float scopedFov = 15.0f;            // Manual fallback FOV (degrees)
  float defaultZoom = 4.0f;           // Magnification when nothing is discovered
  bool enableScrollZoom = true;
  float scrollZoomSensitivity = 0.15f;
  float scrollZoomMin = 0.0f;         // Magnification units, 0 = native range
  float scrollZoomMax = 0.0f;
};

// Loaded and reported only. Scoped rendering always forces LOD level 0 and
// scales the saved bias by magnification.
struct RenderConfig {
  float lodBiasOverride = 0.0f;
  int maxLodLevelOverride = 0;
};

struct StabilizationConfig {
  bool enabled = true;
};

struct SystemConfig {
  int logVerbosity = 1;
};

struct ScopeViewConfig {
  ZoomConfig zoom;
  RenderConfig render;
  StabilizationConfig stabilization;
  SystemConfig system;
};

static_assert(std::is_trivially_copyable_v<ScopeViewConfig>,
              "ScopeViewConfig must be trivially copyable, no reference members");

REFLECT_STRUCT_BEGIN(ZoomConfig)
  REFLECT_FIELD(bool, autoFovFromScope, "Zoom")
  REFLECT_FIELD(float, scopedFov, "Zoom")
  REFLECT_FIELD(float, defaultZoom, "Zoom")
  REFLECT_FIELD(bool, enableScrollZoom, "Zoom")
  REFLECT_FIELD(float, scrollZoomSensitivity, "Zoom")
  REFLECT_FIELD(float, scrollZoomMin, "Zoom")
  REFLECT_FIELD(float, scrollZoomMax, "Zoom")
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(RenderConfig)
  REFLECT_FIELD(float, lodBiasOverride, "Render")
  REFLECT_FIELD(int, maxLodLevelOverride, "Render")
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(StabilizationConfig)
  REFLECT_FIELD(bool, enabled, "Stabilization")
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(SystemConfig)
  REFLECT_FIELD(int, logVerbosity, "System")
REFLECT_STRUCT_END()

inline void InitConfigReflection() {
  REFLECT_INIT(ZoomConfig)
  REFLECT_INIT(RenderConfig)
  REFLECT_INIT(StabilizationConfig)
  REFLECT_INIT(SystemConfig)
}

// Clamp every value into its documented range
void ClampConfig(ScopeViewConfig& config);

class ConfigManager {
public:
  static ConfigManager &Get();

  // Non-copyable, non-movable singleton
  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;
  ConfigManager(ConfigManager&&) = delete;
  ConfigManager& operator=(ConfigManager&&) = delete;

  void SetPath(const std::filesystem::path &path);
  const std::filesystem::path &Path() const { return m_path; }

  void Load();
  // Parses TOML text into config, starting from its current values.
  // Returns false (config untouched) on a parse error.
  static bool LoadFromString(const std::string &text, ScopeViewConfig &config);
  static std::string SaveToString(const ScopeViewConfig &config);

  void Save();
  void ResetToDefaults();
  void CheckHotReload();

  ScopeViewConfig Snapshot() const;
  // Unsynchronised access for the owning thread
  ScopeViewConfig &Data() { return m_config; }

private:
  ConfigManager();

  ScopeViewConfig m_config;
  mutable std::mutex m_configMutex;
  std::filesystem::path m_path{SCOPEVIEW_CONFIG_FILE};
  std::filesystem::file_time_type m_lastWriteTime{};
};
