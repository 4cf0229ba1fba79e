#pragma once

/**
 * @file record.hpp
 * @brief Values and structured records produced by parsing
 */

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace fixedwidth {

class Record;

/**
 * @brief A single parsed or to-be-formatted value
 *
 * Values are either scalars or a nested Record. Nested records are shared
 * immutably, so copying a Value is cheap.
 */
class Value {
public:
    using ValueType = std::variant<
        std::monostate,  // NULL
        bool,
        int64_t,
        double,
        std::string,
        std::shared_ptr<const Record>
    >;

    /// Construct a NULL value
    Value() : value_(std::monostate{}) {}

    /// Construct from various types
    explicit Value(bool v) : value_(v) {}
    explicit Value(int32_t v) : value_(static_cast<int64_t>(v)) {}
    explicit Value(int64_t v) : value_(v) {}
    explicit Value(double v) : value_(v) {}
    explicit Value(std::string v) : value_(std::move(v)) {}
    explicit Value(std::string_view v) : value_(std::string(v)) {}
    explicit Value(const char* v) : value_(std::string(v)) {}
    explicit Value(Record record);

    /// Check if the value is NULL
    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(value_);
    }

    /// Type checking methods
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(value_); }
    [[nodiscard]] bool is_int64() const noexcept { return std::holds_alternative<int64_t>(value_); }
    [[nodiscard]] bool is_double() const noexcept { return std::holds_alternative<double>(value_); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(value_); }
    [[nodiscard]] bool is_record() const noexcept {
        return std::holds_alternative<std::shared_ptr<const Record>>(value_);
    }

    /// Value retrieval methods (throw if wrong type)
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] int64_t as_int64() const;
    [[nodiscard]] double as_double() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const Record& as_record() const;

    /// Safe value retrieval (returns nullopt if wrong type or NULL)
    [[nodiscard]] std::optional<bool> try_bool() const noexcept;
    [[nodiscard]] std::optional<int64_t> try_int64() const noexcept;
    [[nodiscard]] std::optional<double> try_double() const noexcept;
    [[nodiscard]] std::optional<std::string_view> try_string() const noexcept;
    [[nodiscard]] const Record* try_record() const noexcept;

    /// Get the underlying variant
    [[nodiscard]] const ValueType& value() const noexcept { return value_; }

    /// Convert to string representation
    [[nodiscard]] std::string to_string() const;

    /// Deep comparison (nested records compare by content)
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    ValueType value_;
};

/**
 * @brief Insertion-ordered mapping from field key to Value
 *
 * Equality ignores insertion order.
 */
class Record {
public:
    using Entry = std::pair<std::string, Value>;

    Record() = default;
    Record(std::initializer_list<Entry> entries);

    /// Insert or replace a value, keeping the original position on replace
    void set(std::string key, Value value);

    /// Get value by key, nullptr if absent
    [[nodiscard]] const Value* find(std::string_view key) const noexcept;

    [[nodiscard]] bool contains(std::string_view key) const noexcept {
        return find(key) != nullptr;
    }

    /// Get value by key (throws std::out_of_range if absent)
    [[nodiscard]] const Value& operator[](std::string_view key) const;

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// Keys in insertion order
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Iterator support
    [[nodiscard]] auto begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] auto end() const noexcept { return entries_.end(); }

    /// Render as `{key: value, ...}` for diagnostics
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Record& other) const;
    bool operator!=(const Record& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

/// Printers picked up by GoogleTest assertions
void PrintTo(const Value& value, std::ostream* os);
void PrintTo(const Record& record, std::ostream* os);

}  // namespace fixedwidth
