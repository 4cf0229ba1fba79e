#pragma once

/**
 * @file schema.hpp
 * @brief Fixed-width record schema
 *
 * A Schema is an ordered, named collection of fields. Fields are columns
 * (leaf codecs), nested schemas it owns, or references to schemas owned
 * elsewhere in the tree. References are resolved lazily by walking up the
 * parent chain; the root of the chain is a SchemaCatalog.
 *
 * Example usage:
 * @code
 * std::unique_ptr<fixedwidth::Definition> def;
 * auto status = fixedwidth::Definition::create("bank", {}, &def);
 * status = def->add_schema("header", [](fixedwidth::Schema& s) {
 *     auto st = s.add_column("id", 3);
 *     if (st.ok()) st = s.add_filler(1);
 *     if (st.ok()) st = s.add_column("code", 4);
 *     return st;
 * });
 * fixedwidth::Record record;
 * status = def->schema("header")->parse("A1  DEAD", &record);
 * @endcode
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "fixedwidth/column.hpp"
#include "fixedwidth/field_entry.hpp"
#include "fixedwidth/option_table.hpp"
#include "fixedwidth/record.hpp"
#include "fixedwidth/status.hpp"

namespace fixedwidth {

class Schema;

// ─────────────────────────────────────────────────────────────────────────────
// SchemaCatalog - root of the resolution chain
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Named schema catalog consulted by top-level schemas
 */
class SchemaCatalog {
public:
    virtual ~SchemaCatalog() = default;

    /// Candidate schemas registered under name (first match wins)
    [[nodiscard]] virtual std::vector<Schema*> lookup_by_name(std::string_view name) const = 0;

    /// Options inherited by top-level schemas, nullptr if none
    [[nodiscard]] virtual const OptionTable* options() const noexcept { return nullptr; }

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ResolvedField
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief A field after resolution: either a codec or a schema
 */
struct ResolvedField {
    FieldKind kind = FieldKind::COLUMN;  ///< Kind of the declared entry
    std::string key;                     ///< Record key
    FieldCodec* codec = nullptr;         ///< Set for columns
    Schema* schema = nullptr;            ///< Set for nested and referenced schemas
};

// ─────────────────────────────────────────────────────────────────────────────
// Schema
// ─────────────────────────────────────────────────────────────────────────────

class Schema {
    struct Token {
        explicit Token() = default;
    };

public:
    using Builder = std::function<Status(Schema&)>;
    using Trap = std::function<bool(std::string_view)>;

    /**
     * @brief Create a schema nested under another schema
     * @param name Schema name
     * @param options Schema options (see schema_option_schema())
     * @param parent Enclosing schema used for resolution and inheritance
     * @param out Created schema
     */
    [[nodiscard]] static Status create(std::string name, const OptionMap& options,
                                       Schema* parent, std::unique_ptr<Schema>* out);

    /// Create a top-level schema whose references resolve through a catalog
    [[nodiscard]] static Status create(std::string name, const OptionMap& options,
                                       SchemaCatalog* catalog,
                                       std::unique_ptr<Schema>* out);

    /// Create a detached schema (references can never resolve)
    [[nodiscard]] static Status create(std::string name, const OptionMap& options,
                                       std::unique_ptr<Schema>* out);

    /// Use create(); the token keeps construction inside the class
    Schema(Token, Schema* parent, SchemaCatalog* catalog);
    ~Schema();

    // Children hold back-pointers, so a schema never moves
    Schema(const Schema&) = delete;
    Schema& operator=(const Schema&) = delete;
    Schema(Schema&&) = delete;
    Schema& operator=(Schema&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Identity & Options
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] Schema* parent() const noexcept { return parent_; }
    [[nodiscard]] SchemaCatalog* catalog() const noexcept { return catalog_; }
    [[nodiscard]] const OptionTable& options() const noexcept { return options_; }

    /// Read a readable option
    [[nodiscard]] Status option(std::string_view name, Value* out) const {
        return options_.read(name, out);
    }

    [[nodiscard]] bool optional() const;
    [[nodiscard]] bool singular() const;
    [[nodiscard]] Status set_optional(bool optional);
    [[nodiscard]] Status set_singular(bool singular);

    /// Extra predicate a line must satisfy to match this schema
    void set_trap(Trap trap) { trap_ = std::move(trap); }
    [[nodiscard]] const Trap& trap() const noexcept { return trap_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Setup
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Run a builder against this schema
     * @return kSchemaError on a missing builder or recursive setup,
     *         otherwise the builder's status
     */
    [[nodiscard]] Status setup(const Builder& builder);

    /**
     * @brief Append a column
     * @param name Column name; keyed as `group.name` when grouped
     * @param length Width in codepoints
     * @param options Column options
     * @param out Optional pointer to the created column
     */
    [[nodiscard]] Status add_column(std::string name, size_t length,
                                    const OptionMap& options = {},
                                    Column** out = nullptr);

    /// Append a column backed by a custom codec
    [[nodiscard]] Status add_column(std::unique_ptr<FieldCodec> codec);

    /**
     * @brief Append an auto-named filler column (spacer_1, spacer_2, ...)
     * @param padding Pad character, empty for the default
     */
    [[nodiscard]] Status add_filler(size_t length, const std::string& padding = "");

    /**
     * @brief Append a nested schema built immediately
     * @param name Schema name, also its record key
     * @param builder Declares the nested schema's fields
     * @param options Nested schema options
     * @param out Optional pointer to the created schema
     */
    [[nodiscard]] Status add_nested_schema(std::string name, const Builder& builder,
                                           const OptionMap& options = {},
                                           Schema** out = nullptr);

    /// Append a reference resolved on first use
    [[nodiscard]] Status add_reference(ReferenceSpec spec);
    [[nodiscard]] Status add_reference(std::string schema_name);
    [[nodiscard]] Status add_reference(std::string store_name, std::string schema_name,
                                       OptionMap options = {});

    // ─────────────────────────────────────────────────────────────────────────
    // Fields & Resolution
    // ─────────────────────────────────────────────────────────────────────────

    /// Field identifiers in layout order
    [[nodiscard]] const std::vector<std::string>& fields() const noexcept { return fields_; }

    [[nodiscard]] const FieldEntry* entry(std::string_view field_name) const;

    /// Column codecs in layout order
    [[nodiscard]] std::vector<const FieldCodec*> columns() const;

    /// Nested schemas owned by this schema in layout order (references excluded)
    [[nodiscard]] std::vector<const Schema*> schemas() const;

    /**
     * @brief Resolve one of this schema's fields
     *
     * References are resolved through the parent chain on first use and
     * memoized; the resolving schema's options and the reference's own
     * options are then propagated into the target.
     */
    [[nodiscard]] Status lookup(std::string_view field_name, ResolvedField* out) const;

    /**
     * @brief Find a schema visible from this scope
     *
     * Checks this schema's own fields, then walks up the parent chain, and
     * finally asks the catalog at the root.
     */
    [[nodiscard]] Status find_schema(std::string_view name, Schema** out) const;

    /**
     * @brief Merge an option set into this schema and its whole subtree
     *
     * Existing values win; references not yet resolved queue the set.
     * An option set already applied to this schema is skipped.
     */
    [[nodiscard]] Status propagate(const OptionMap& options);

    // ─────────────────────────────────────────────────────────────────────────
    // Traversal
    // ─────────────────────────────────────────────────────────────────────────

    /// Total width in codepoints
    [[nodiscard]] Status length(size_t* out) const;

    /**
     * @brief Parse one record
     * @param line Raw line
     * @param out Parsed record
     * @param start Codepoint offset of this schema within the line
     */
    [[nodiscard]] Status parse(std::string_view line, Record* out,
                               size_t start = 0) const;

    /// Format a record into exactly length() codepoints
    [[nodiscard]] Status format(const Record& record, std::string* out) const;

    /// True when the line fits this schema and the trap (if any) accepts it
    [[nodiscard]] bool match(std::string_view line) const;

    /// Every resolution problem in this schema and its reference closure
    [[nodiscard]] std::vector<Status> errors() const;

    /// First problem reported by errors(), OK when there is none
    [[nodiscard]] Status validate() const;

    [[nodiscard]] bool valid() const { return errors().empty(); }

private:
    [[nodiscard]] static Status create_impl(std::string name, const OptionMap& options,
                                            Schema* parent, SchemaCatalog* catalog,
                                            std::unique_ptr<Schema>* out);

    using Stack = std::vector<const Schema*>;

    [[nodiscard]] Status check_new_key(const std::string& key) const;
    [[nodiscard]] Status check_column(const FieldCodec& codec, std::string* key) const;
    void append(std::string key, FieldEntry entry);

    [[nodiscard]] Status resolve(Reference& reference) const;
    [[nodiscard]] Status enter(Stack* stack) const;

    [[nodiscard]] Status length_impl(Stack* stack, size_t* out) const;
    [[nodiscard]] Status parse_impl(std::string_view line, size_t start, Stack* stack,
                                    Record* out) const;
    [[nodiscard]] Status format_impl(const Record& record, Stack* stack,
                                     std::string* out) const;
    void collect_errors(Stack* stack, std::vector<Status>* out) const;

    std::string name_;
    Schema* parent_ = nullptr;          ///< Non-owning
    SchemaCatalog* catalog_ = nullptr;  ///< Non-owning, set on top-level schemas
    OptionTable options_;
    Trap trap_;

    std::vector<std::string> fields_;                     ///< Layout order
    std::unordered_map<std::string, FieldEntry> entries_; ///< Identifier -> entry
    std::set<std::string> groups_;                        ///< Column group names
    size_t spacer_count_ = 0;
    bool in_setup_ = false;

    std::vector<OptionMap> applied_;  ///< Option sets already propagated

    /// Layout generation the cached length was computed at
    mutable std::optional<size_t> cached_length_;
    mutable uint64_t cached_generation_ = 0;
};

}  // namespace fixedwidth
