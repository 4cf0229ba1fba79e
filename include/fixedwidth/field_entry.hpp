#pragma once

/**
 * @file field_entry.hpp
 * @brief Field entries of a schema: columns, nested schemas, references
 */

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "fixedwidth/field_codec.hpp"
#include "fixedwidth/option_table.hpp"

namespace fixedwidth {

class Schema;

// ─────────────────────────────────────────────────────────────────────────────
// Reference
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Declaration of a reference to a schema defined elsewhere
 */
struct ReferenceSpec {
    std::string schema_name;  ///< Name to resolve through the ancestor chain
    std::string store_name;   ///< Record key; defaults to schema_name
    OptionMap options;        ///< Propagated into the target once resolved
};

enum class ResolutionState : uint8_t {
    UNRESOLVED,
    RESOLVED,
    FAILED,  // Last attempt failed; retried on the next lookup
};

/**
 * @brief A named, lazily resolved link to another schema
 *
 * A resolved reference never changes its target. Option sets propagated
 * into an unresolved reference are queued and handed over on resolution.
 */
class Reference {
public:
    explicit Reference(ReferenceSpec spec);

    [[nodiscard]] const std::string& schema_name() const noexcept { return spec_.schema_name; }
    [[nodiscard]] const std::string& store_name() const noexcept { return spec_.store_name; }
    [[nodiscard]] const OptionMap& options() const noexcept { return spec_.options; }

    [[nodiscard]] ResolutionState state() const noexcept { return state_; }
    [[nodiscard]] bool is_resolved() const noexcept { return state_ == ResolutionState::RESOLVED; }

    /// Resolved target, nullptr until resolved
    [[nodiscard]] Schema* target() const noexcept { return target_; }

    /// Reason of the last failed resolution
    [[nodiscard]] const std::string& failure() const noexcept { return failure_; }

    /**
     * @brief Bind the target
     * @return Option sets queued while unresolved
     */
    std::vector<OptionMap> bind(Schema* target);

    void fail(std::string reason);

    /// Queue an option set until resolution
    void enqueue(const OptionMap& options);

    [[nodiscard]] const std::vector<OptionMap>& pending() const noexcept { return pending_; }

private:
    ReferenceSpec spec_;
    ResolutionState state_ = ResolutionState::UNRESOLVED;
    Schema* target_ = nullptr;
    std::string failure_;
    std::vector<OptionMap> pending_;
};

// ─────────────────────────────────────────────────────────────────────────────
// FieldEntry
// ─────────────────────────────────────────────────────────────────────────────

enum class FieldKind : uint8_t {
    COLUMN,     // Owned codec, terminal
    SCHEMA,     // Owned nested schema
    REFERENCE,  // Named link to a schema owned elsewhere
};

/**
 * @brief Tagged variant over the three kinds of schema fields
 */
class FieldEntry {
public:
    explicit FieldEntry(std::unique_ptr<FieldCodec> codec);
    explicit FieldEntry(std::unique_ptr<Schema> schema);
    explicit FieldEntry(std::unique_ptr<Reference> reference);
    ~FieldEntry();

    FieldEntry(FieldEntry&&) noexcept;
    FieldEntry& operator=(FieldEntry&&) noexcept;
    FieldEntry(const FieldEntry&) = delete;
    FieldEntry& operator=(const FieldEntry&) = delete;

    [[nodiscard]] FieldKind kind() const noexcept;

    /// Accessors return nullptr for the other kinds
    [[nodiscard]] FieldCodec* codec() const noexcept;
    [[nodiscard]] Schema* schema() const noexcept;
    [[nodiscard]] Reference* reference() const noexcept;

private:
    std::variant<std::unique_ptr<FieldCodec>, std::unique_ptr<Schema>,
                 std::unique_ptr<Reference>>
        entry_;
};

}  // namespace fixedwidth
