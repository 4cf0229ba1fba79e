#pragma once

/**
 * @file option_table.hpp
 * @brief Typed, validated option sets shared by schemas and columns
 *
 * Each owner type (schema, column) has one OptionSchema describing the
 * options it recognizes. An OptionTable is an instance of that schema:
 * construction applies transforms, validators, defaults and required
 * checks, and merge() propagates options between owners.
 */

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fixedwidth/record.hpp"
#include "fixedwidth/status.hpp"

namespace fixedwidth {

/// Raw option values keyed by option name
using OptionMap = std::map<std::string, Value, std::less<>>;

// ─────────────────────────────────────────────────────────────────────────────
// Option Specification
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Declaration of a single recognized option
 */
struct OptionSpec {
    using Transform = std::function<Value(const Value&)>;
    using Validator = std::function<bool(const Value&)>;

    std::string name;                   ///< Option name
    Transform transform;                ///< Applied before validation (optional)
    Validator validator;                ///< Accepts or rejects a value (optional)
    std::string expected;               ///< Description used in error messages
    std::optional<Value> default_value; ///< Filled when not provided
    bool required = false;              ///< Must be provided at construction
    bool readable = false;              ///< Exposed through read()
    bool writable = false;              ///< Mutable through set()
    bool inheritable = false;           ///< Takes part in merge()
};

/**
 * @brief Where a stored option value came from
 */
enum class OptionOrigin : uint8_t {
    DEFAULT,    // Filled from the spec default
    INHERITED,  // Adopted from another table through merge()
    EXPLICIT,   // Provided at construction or through set()
};

/**
 * @brief The set of options recognized by one owner type
 *
 * Built once per owner type and shared by every instance.
 */
class OptionSchema {
public:
    explicit OptionSchema(std::string owner) : owner_(std::move(owner)) {}

    /// Register an option
    OptionSchema& define(OptionSpec spec);

    /**
     * @brief Declare required, readable and writable options
     *
     * Names that were not defined are ignored.
     */
    OptionSchema& configure(const std::vector<std::string>& required,
                            const std::vector<std::string>& reader,
                            const std::vector<std::string>& writer);

    [[nodiscard]] const OptionSpec* find(std::string_view name) const noexcept;

    [[nodiscard]] const std::vector<OptionSpec>& specs() const noexcept {
        return specs_;
    }

    /// Owner type name used in error messages ("schema", "column")
    [[nodiscard]] const std::string& owner() const noexcept { return owner_; }

private:
    OptionSpec* find_mutable(std::string_view name) noexcept;

    std::string owner_;
    std::vector<OptionSpec> specs_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Merge Policy
// ─────────────────────────────────────────────────────────────────────────────

/// Which side wins when both tables hold a value
enum class MergePrefer : uint8_t { SELF, OTHER };

/// Whether spec defaults count as values during a merge
enum class MergeMissing : uint8_t {
    UNDEFINED,  // Defaults count as absent on both sides
    DEFINED,    // Defaults count as values
};

struct MergePolicy {
    MergePrefer prefer = MergePrefer::SELF;
    MergeMissing missing = MergeMissing::UNDEFINED;
};

// ─────────────────────────────────────────────────────────────────────────────
// OptionTable
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Validated option values for one schema or column
 */
class OptionTable {
public:
    OptionTable() = default;

    /**
     * @brief Build a table from provided values
     * @param schema Option schema of the owner type (must outlive the table)
     * @param provided Raw values; NULL values count as not provided
     * @param out Output table
     * @return kConfigError on unknown options, missing required options,
     *         or values rejected by a validator
     */
    [[nodiscard]] static Status create(const OptionSchema& schema,
                                       const OptionMap& provided,
                                       OptionTable* out);

    /// Stored value, or a NULL value when absent
    [[nodiscard]] const Value& get(std::string_view name) const noexcept;

    /// Stored value of a readable option
    [[nodiscard]] Status read(std::string_view name, Value* out) const;

    /// True for INHERITED and EXPLICIT values
    [[nodiscard]] bool is_defined(std::string_view name) const noexcept;

    [[nodiscard]] std::optional<OptionOrigin> origin(std::string_view name) const noexcept;

    /**
     * @brief Set a writable option
     * @param overwrite When false, an already defined value is kept
     */
    [[nodiscard]] Status set(std::string_view name, Value value, bool overwrite = true);

    /**
     * @brief Adopt values from another table
     *
     * Only options declared inheritable in this table's schema take part.
     * Adopted values are marked INHERITED. Applying the same merge twice
     * has no further effect.
     */
    [[nodiscard]] Status merge(const OptionTable& other, MergePolicy policy = {});

    /// Adopt values from a raw map; map values count as defined
    [[nodiscard]] Status merge(const OptionMap& other, MergePolicy policy = {});

    /// Snapshot of every INHERITED or EXPLICIT value
    [[nodiscard]] OptionMap defined_values() const;

    [[nodiscard]] const OptionSchema* schema() const noexcept { return schema_; }

    bool operator==(const OptionTable& other) const;
    bool operator!=(const OptionTable& other) const { return !(*this == other); }

private:
    struct Slot {
        Value value;
        OptionOrigin origin = OptionOrigin::DEFAULT;

        bool operator==(const Slot& other) const {
            return value == other.value && origin == other.origin;
        }
    };

    [[nodiscard]] Status coerce(const OptionSpec& spec, const Value& raw,
                                Value* out) const;
    [[nodiscard]] Status adopt(std::string_view name, const Value& value,
                               MergePolicy policy);

    const OptionSchema* schema_ = nullptr;
    std::map<std::string, Slot, std::less<>> values_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Common transforms and validators
// ─────────────────────────────────────────────────────────────────────────────

namespace options {

/// Trim surrounding whitespace from string values
OptionSpec::Transform trim();

/// Lower-case string values
OptionSpec::Transform lowercase();

OptionSpec::Validator is_bool();
OptionSpec::Validator is_identifier();
OptionSpec::Validator is_positive_integer();
OptionSpec::Validator is_non_negative_integer();
OptionSpec::Validator is_single_codepoint();
OptionSpec::Validator one_of(std::vector<std::string> allowed);

/// True for `[A-Za-z_][A-Za-z0-9_]*` within the configured length limit
[[nodiscard]] bool is_identifier(std::string_view name) noexcept;

}  // namespace options

/// Option schema shared by every Schema
[[nodiscard]] const OptionSchema& schema_option_schema();

/// Option schema shared by every Column
[[nodiscard]] const OptionSchema& column_option_schema();

}  // namespace fixedwidth
