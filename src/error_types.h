#pragma once

#include <cstdint>
#include <expected>
#include <string_view>

// ============================================================================
// Typed Error Enums for std::expected Returns
// ============================================================================

enum class LookupError : uint8_t {
  NoBinding,    // No camera-data shape has been discovered
  NoMatch,      // No instance on the active optic's variant
  FieldMissing, // Shape lacks the requested field or its type is wrong
  OutOfRange,   // Value present but below confidence / outside plausible range
  QueryFailed,  // Host scene-graph query threw
};

constexpr std::string_view to_string(LookupError e) {
  switch (e) {
  case LookupError::NoBinding:    return "No camera-data shape bound";
  case LookupError::NoMatch:      return "No provider on the active optic variant";
  case LookupError::FieldMissing: return "Field missing or of unexpected type";
  case LookupError::OutOfRange:   return "Value outside confident range";
  case LookupError::QueryFailed:  return "Scene-graph query failed";
  }
  return "Unknown lookup error";
}

// ============================================================================
// Convenience Aliases
// ============================================================================

template<typename T>
using LookupResult = std::expected<T, LookupError>;
