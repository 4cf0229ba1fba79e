#pragma once

/**
 * @file fixedwidth.hpp
 * @brief Main include header for fixedwidth
 *
 * Include this single header to declare, parse and format fixed-width
 * record layouts.
 */

#include "fixedwidth/column.hpp"
#include "fixedwidth/definition.hpp"
#include "fixedwidth/field_codec.hpp"
#include "fixedwidth/option_table.hpp"
#include "fixedwidth/record.hpp"
#include "fixedwidth/schema.hpp"
#include "fixedwidth/status.hpp"

namespace fixedwidth {

/**
 * @brief Get the version string of fixedwidth
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* version() noexcept {
    return "0.1.0";
}

constexpr int version_major() noexcept {
    return 0;
}

constexpr int version_minor() noexcept {
    return 1;
}

constexpr int version_patch() noexcept {
    return 0;
}

}  // namespace fixedwidth
