#pragma once

/**
 * @file config.hpp
 * @brief Configuration constants for fixedwidth
 */

#include <cstddef>

namespace fixedwidth {
namespace config {

// ─────────────────────────────────────────────────────────────────────────────
// Reserved Names
// ─────────────────────────────────────────────────────────────────────────────

/// Prefix of auto-numbered filler columns (spacer_1, spacer_2, ...)
constexpr const char* kSpacerPrefix = "spacer";

/// Prefix reserved for repeated-section bookkeeping
constexpr const char* kRepeatPrefix = "repeat";

/// Maximum field, group or schema name length
constexpr size_t kMaxNameLength = 64;

// ─────────────────────────────────────────────────────────────────────────────
// Column Defaults
// ─────────────────────────────────────────────────────────────────────────────

/// Default padding character
constexpr const char* kDefaultPadding = " ";

/// Default alignment; right-aligned values are padded on the left
constexpr const char* kDefaultAlign = "right";

/// Default value type
constexpr const char* kDefaultType = "string";

// ─────────────────────────────────────────────────────────────────────────────
// Resolution
// ─────────────────────────────────────────────────────────────────────────────

/// Maximum depth of nested/referenced schemas walked by a single traversal
constexpr size_t kMaxSchemaDepth = 64;

}  // namespace config
}  // namespace fixedwidth
