/**
 * @file record.cpp
 * @brief Value and Record implementations
 */

#include "fixedwidth/record.hpp"

#include <ostream>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace fixedwidth {

// ─────────────────────────────────────────────────────────────────────────────
// Value implementation
// ─────────────────────────────────────────────────────────────────────────────

Value::Value(Record record)
    : value_(std::make_shared<const Record>(std::move(record))) {}

bool Value::as_bool() const {
    if (auto* v = std::get_if<bool>(&value_)) return *v;
    throw std::runtime_error("Value is not a bool");
}

int64_t Value::as_int64() const {
    if (auto* v = std::get_if<int64_t>(&value_)) return *v;
    throw std::runtime_error("Value is not an int64");
}

double Value::as_double() const {
    if (auto* v = std::get_if<double>(&value_)) return *v;
    throw std::runtime_error("Value is not a double");
}

const std::string& Value::as_string() const {
    if (auto* v = std::get_if<std::string>(&value_)) return *v;
    throw std::runtime_error("Value is not a string");
}

const Record& Value::as_record() const {
    if (auto* v = std::get_if<std::shared_ptr<const Record>>(&value_)) return **v;
    throw std::runtime_error("Value is not a record");
}

std::optional<bool> Value::try_bool() const noexcept {
    if (auto* v = std::get_if<bool>(&value_)) return *v;
    return std::nullopt;
}

std::optional<int64_t> Value::try_int64() const noexcept {
    if (auto* v = std::get_if<int64_t>(&value_)) return *v;
    return std::nullopt;
}

std::optional<double> Value::try_double() const noexcept {
    if (auto* v = std::get_if<double>(&value_)) return *v;
    return std::nullopt;
}

std::optional<std::string_view> Value::try_string() const noexcept {
    if (auto* v = std::get_if<std::string>(&value_)) return std::string_view(*v);
    return std::nullopt;
}

const Record* Value::try_record() const noexcept {
    if (auto* v = std::get_if<std::shared_ptr<const Record>>(&value_)) return v->get();
    return nullptr;
}

std::string Value::to_string() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::shared_ptr<const Record>>) {
            return v->to_string();
        } else {
            return fmt::format("{}", v);
        }
    }, value_);
}

bool Value::operator==(const Value& other) const {
    const Record* lhs = try_record();
    const Record* rhs = other.try_record();
    if (lhs != nullptr || rhs != nullptr) {
        return lhs != nullptr && rhs != nullptr && *lhs == *rhs;
    }
    return value_ == other.value_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Record implementation
// ─────────────────────────────────────────────────────────────────────────────

Record::Record(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

void Record::set(std::string key, Value value) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

const Value* Record::find(std::string_view key) const noexcept {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

const Value& Record::operator[](std::string_view key) const {
    const Value* value = find(key);
    if (value == nullptr) {
        throw std::out_of_range("Record has no key: " + std::string(key));
    }
    return *value;
}

std::vector<std::string> Record::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, value] : entries_) {
        result.push_back(key);
    }
    return result;
}

std::string Record::to_string() const {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : entries_) {
        if (!first) out += ", ";
        first = false;
        out += key;
        out += ": ";
        out += value.is_string() ? "\"" + value.as_string() + "\"" : value.to_string();
    }
    out += "}";
    return out;
}

bool Record::operator==(const Record& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto& [key, value] : entries_) {
        const Value* theirs = other.find(key);
        if (theirs == nullptr || *theirs != value) {
            return false;
        }
    }
    return true;
}

void PrintTo(const Value& value, std::ostream* os) {
    *os << value.to_string();
}

void PrintTo(const Record& record, std::ostream* os) {
    *os << record.to_string();
}

}  // namespace fixedwidth
