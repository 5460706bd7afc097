#pragma once

// ============================================================================
// SCOPEVIEW CONFIGURATION
// ============================================================================
// Compile-time constants for optic FOV derivation, render-parameter scaling
// and lens stabilization. Runtime knobs live in config_manager.h.
// ============================================================================

#define SCOPEVIEW_VERSION "1.2"
#define SCOPEVIEW_LOG_FILE "scopeview.log"
#define SCOPEVIEW_CONFIG_FILE "scopeview.toml"

// -------------------------------
// Logging
// -------------------------------
#define ENABLE_LOGGING 1
#define LOG_VERBOSE 1          // Set to 1 for per-lookup diagnostic logging

namespace optic_config {

// Reference optic camera FOV (degrees). magnification = kReferenceFov / scopeFov
constexpr float kReferenceFov = 35.0f;

// Any discovered FOV at or below this is treated as "no value"
constexpr float kMinConfidentFov = 0.1f;
constexpr float kMaxPlausibleFov = 180.0f;

// Zoom handlers and camera data store the half angle
constexpr float kHalfAngleScale = 2.0f;

// Change thresholds for log-on-change and mode-switch detection
constexpr float kFovLogEpsilon = 0.01f;
constexpr float kModeSwitchEpsilon = 0.03f;

} // namespace optic_config

namespace hierarchy_config {

// Nearest ancestor with this prefix bounds hierarchy-wide searches
constexpr const char* kScopeRootPrefix = "scope_";
// Variant (magnification mode) markers: "mode_000", "mode_001", or bare "mode"
constexpr const char* kVariantPrefix = "mode_";
constexpr const char* kVariantExact = "mode";

} // namespace hierarchy_config

namespace shape_config {

// Well-known camera-data shape names, tried in order before the full scan
constexpr const char* kKnownShapeNames[] = {
    "EFT.CameraControl.ScopeCameraData",
    "ScopeCameraData",
    "EFT.ScopeCameraData",
};

constexpr const char* kFovField = "FieldOfView";
constexpr const char* kNearClipField = "NearClipPlane";
constexpr const char* kFarClipField = "FarClipPlane";
constexpr const char* kCullingMaskField = "OpticCullingMask";
constexpr const char* kCullingScaleField = "OpticCullingMaskScale";

} // namespace shape_config

namespace stabilizer_config {

constexpr float kTauPos = 0.05f;        // seconds
constexpr float kDeadzone = 0.0005f;    // camera-space units
constexpr float kMinDeltaTime = 0.000001f;

} // namespace stabilizer_config

namespace scroll_config {

constexpr float kMinScrollDelta = 0.01f;
constexpr float kBoundaryInset = 0.1f;
constexpr float kMinInsetRange = 0.01f;
constexpr float kMinUsableRange = 0.05f;

} // namespace scroll_config
