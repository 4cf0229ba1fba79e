#pragma once

/**
 * @file column.hpp
 * @brief Default column codec
 */

#include <memory>
#include <string>

#include "fixedwidth/field_codec.hpp"
#include "fixedwidth/option_table.hpp"

namespace fixedwidth {

/**
 * @brief Column codec driven by its option table
 *
 * Options are read at parse/format time, so values inherited after
 * construction (padding, align, truncate, nil_blank) take effect.
 */
class Column : public FieldCodec {
    struct Token {
        explicit Token() = default;
    };

public:
    /// Use create(); the token keeps construction inside the class
    explicit Column(Token) {}

    /**
     * @brief Create a column
     * @param name Column name
     * @param length Width in codepoints
     * @param options Column options (see column_option_schema())
     * @param out Created column
     */
    [[nodiscard]] static Status create(std::string name, size_t length,
                                       const OptionMap& options,
                                       std::unique_ptr<Column>* out);

    /**
     * @brief Create a filler column
     * @param name Reserved filler name
     * @param length Width in codepoints
     * @param padding Pad character, empty for the default
     */
    [[nodiscard]] static Status create_filler(std::string name, size_t length,
                                              const std::string& padding,
                                              std::unique_ptr<Column>* out);

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }
    [[nodiscard]] size_t length() const noexcept override { return length_; }
    [[nodiscard]] const std::string& group() const noexcept override { return group_; }
    [[nodiscard]] bool is_filler() const noexcept override { return filler_; }

    [[nodiscard]] Status parse(std::string_view text, Value* out) const override;
    [[nodiscard]] Status format(const Value& value, std::string* out) const override;

    [[nodiscard]] OptionTable* options() noexcept override { return &options_; }
    [[nodiscard]] const OptionTable& option_table() const noexcept { return options_; }

    [[nodiscard]] const std::string& padding() const;
    [[nodiscard]] bool align_left() const;
    [[nodiscard]] const std::string& type() const;

private:
    [[nodiscard]] Status to_text(const Value& value, std::string* out) const;
    [[nodiscard]] Status parse_number(std::string_view raw, std::string_view text,
                                      Value* out) const;

    OptionTable options_;
    std::string name_;
    std::string group_;
    size_t length_ = 0;
    bool filler_ = false;
};

}  // namespace fixedwidth
