#pragma once

/**
 * @file definition.hpp
 * @brief Root catalog of top-level schemas
 *
 * A Definition owns the top-level schemas of one file layout and is the
 * last stop when a reference is resolved. Its options are inherited by
 * every top-level schema.
 */

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "fixedwidth/option_table.hpp"
#include "fixedwidth/record.hpp"
#include "fixedwidth/schema.hpp"
#include "fixedwidth/status.hpp"

namespace fixedwidth {

class Definition : public SchemaCatalog {
    struct Token {
        explicit Token() = default;
    };

public:
    /// Use create(); the token keeps construction inside the class
    explicit Definition(Token) {}

    /**
     * @brief Create a definition
     * @param name Definition name
     * @param options Default schema options (see schema_option_schema())
     * @param out Created definition
     */
    [[nodiscard]] static Status create(std::string name, const OptionMap& options,
                                       std::unique_ptr<Definition>* out);

    ~Definition() override;

    Definition(const Definition&) = delete;
    Definition& operator=(const Definition&) = delete;

    /**
     * @brief Declare a top-level schema
     * @param name Schema name, unique within the definition
     * @param builder Declares the schema's fields (may be empty)
     * @param options Schema options
     * @param out Optional pointer to the created schema
     */
    [[nodiscard]] Status add_schema(std::string name, const Schema::Builder& builder,
                                    const OptionMap& options = {},
                                    Schema** out = nullptr);

    // SchemaCatalog
    [[nodiscard]] std::vector<Schema*> lookup_by_name(std::string_view name) const override;
    [[nodiscard]] const OptionTable* options() const noexcept override { return &options_; }
    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    /// Top-level schema by name, nullptr if absent
    [[nodiscard]] Schema* schema(std::string_view name) const;

    /// Top-level schema names in declaration order
    [[nodiscard]] std::vector<std::string> schema_names() const;

    [[nodiscard]] std::vector<Status> errors() const;
    [[nodiscard]] Status validate() const;

    /**
     * @brief Select the schema a line belongs to
     * @return kNotFound when no top-level schema matches
     */
    [[nodiscard]] Status match_schema(std::string_view line, const Schema** out) const;

    /// Parse a line with the first matching schema
    [[nodiscard]] Status parse_line(std::string_view line, Record* out,
                                    std::string* schema_name = nullptr) const;

private:
    std::string name_;
    OptionTable options_;
    std::vector<std::unique_ptr<Schema>> schemas_;  ///< Declaration order
};

}  // namespace fixedwidth
