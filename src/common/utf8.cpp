/**
 * @file utf8.cpp
 * @brief Codepoint helpers built on ICU's UTF-8 macros
 */

#include "common/utf8.hpp"

#include <cstdint>

#include <unicode/utf8.h>

namespace fixedwidth {
namespace utf8 {

namespace {

/// Byte offset of the codepoint at index `count`, clamped to the text end
size_t byte_offset(std::string_view text, size_t count) noexcept {
    const auto* s = reinterpret_cast<const uint8_t*>(text.data());
    const auto n = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (count > 0 && i < n) {
        U8_FWD_1(s, i, n);
        --count;
    }
    return static_cast<size_t>(i);
}

}  // namespace

size_t length(std::string_view text) noexcept {
    const auto* s = reinterpret_cast<const uint8_t*>(text.data());
    const auto n = static_cast<int32_t>(text.size());
    size_t count = 0;
    int32_t i = 0;
    while (i < n) {
        U8_FWD_1(s, i, n);
        ++count;
    }
    return count;
}

std::string_view slice(std::string_view text, size_t start, size_t count) noexcept {
    const size_t begin = byte_offset(text, start);
    std::string_view rest = text.substr(begin);
    return rest.substr(0, byte_offset(rest, count));
}

std::string_view first(std::string_view text, size_t count) noexcept {
    return text.substr(0, byte_offset(text, count));
}

std::string_view last(std::string_view text, size_t count) noexcept {
    const size_t total = length(text);
    if (count >= total) {
        return text;
    }
    return text.substr(byte_offset(text, total - count));
}

std::string repeat(std::string_view unit, size_t count) {
    std::string out;
    out.reserve(unit.size() * count);
    for (size_t i = 0; i < count; ++i) {
        out.append(unit);
    }
    return out;
}

std::string_view strip_leading(std::string_view text, std::string_view unit) noexcept {
    if (unit.empty()) {
        return text;
    }
    while (text.size() >= unit.size() && text.substr(0, unit.size()) == unit) {
        text.remove_prefix(unit.size());
    }
    return text;
}

std::string_view strip_trailing(std::string_view text, std::string_view unit) noexcept {
    if (unit.empty()) {
        return text;
    }
    while (text.size() >= unit.size() &&
           text.substr(text.size() - unit.size()) == unit) {
        text.remove_suffix(unit.size());
    }
    return text;
}

}  // namespace utf8
}  // namespace fixedwidth
