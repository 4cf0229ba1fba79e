#pragma once

/**
 * @file utf8.hpp
 * @brief Codepoint-aware helpers for UTF-8 text
 *
 * Fixed-width layouts count characters, not bytes. All offsets and
 * lengths here are in codepoints. Malformed sequences count as one
 * codepoint per offending byte.
 */

#include <cstddef>
#include <string>
#include <string_view>

namespace fixedwidth {
namespace utf8 {

/// Number of codepoints in text
[[nodiscard]] size_t length(std::string_view text) noexcept;

/**
 * @brief Slice text by codepoint range
 * @param text UTF-8 text
 * @param start First codepoint
 * @param count Maximum number of codepoints
 * @return The slice; empty when start lies past the end
 */
[[nodiscard]] std::string_view slice(std::string_view text, size_t start,
                                     size_t count) noexcept;

/// Leftmost count codepoints
[[nodiscard]] std::string_view first(std::string_view text, size_t count) noexcept;

/// Rightmost count codepoints
[[nodiscard]] std::string_view last(std::string_view text, size_t count) noexcept;

/// Repeat a (single-codepoint) unit count times
[[nodiscard]] std::string repeat(std::string_view unit, size_t count);

/// Strip leading occurrences of unit
[[nodiscard]] std::string_view strip_leading(std::string_view text,
                                             std::string_view unit) noexcept;

/// Strip trailing occurrences of unit
[[nodiscard]] std::string_view strip_trailing(std::string_view text,
                                              std::string_view unit) noexcept;

}  // namespace utf8
}  // namespace fixedwidth
