#pragma once

/**
 * @file field_codec.hpp
 * @brief Single-field codec contract
 *
 * A codec owns one fixed-width slot of a record. Schemas call it as a
 * black box: parse() receives the slot's text (possibly shorter than
 * length() at the end of a line), format() must produce exactly length()
 * codepoints.
 */

#include <cstddef>
#include <string>
#include <string_view>

#include "fixedwidth/record.hpp"
#include "fixedwidth/status.hpp"

namespace fixedwidth {

class OptionTable;

/**
 * @brief Base class for all field codecs
 */
class FieldCodec {
public:
    virtual ~FieldCodec() = default;

    /// Field name (record key)
    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    /// Width in codepoints
    [[nodiscard]] virtual size_t length() const noexcept = 0;

    /// Grouping label, empty when ungrouped
    [[nodiscard]] virtual const std::string& group() const noexcept = 0;

    /// Fillers occupy width but produce and consume no data
    [[nodiscard]] virtual bool is_filler() const noexcept { return false; }

    /**
     * @brief Decode a slot of text
     * @param text Slot contents, at most length() codepoints
     * @param out Decoded value
     */
    [[nodiscard]] virtual Status parse(std::string_view text, Value* out) const = 0;

    /**
     * @brief Encode a value
     * @param value Value to encode (NULL when the record has no such key)
     * @param out Exactly length() codepoints
     */
    [[nodiscard]] virtual Status format(const Value& value, std::string* out) const = 0;

    /**
     * @brief Options that receive values propagated from enclosing schemas
     * @return nullptr when the codec takes no inherited options
     */
    [[nodiscard]] virtual OptionTable* options() noexcept { return nullptr; }
};

}  // namespace fixedwidth
