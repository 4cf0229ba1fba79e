/**
 * @file option_table.cpp
 * @brief OptionSchema and OptionTable implementation
 */

#include "fixedwidth/option_table.hpp"

#include <algorithm>
#include <cctype>

#include "common/config.hpp"
#include "common/utf8.hpp"

namespace fixedwidth {

// ─────────────────────────────────────────────────────────────────────────────
// OptionSchema
// ─────────────────────────────────────────────────────────────────────────────

OptionSchema& OptionSchema::define(OptionSpec spec) {
    if (OptionSpec* existing = find_mutable(spec.name)) {
        *existing = std::move(spec);
    } else {
        specs_.push_back(std::move(spec));
    }
    return *this;
}

OptionSchema& OptionSchema::configure(const std::vector<std::string>& required,
                                      const std::vector<std::string>& reader,
                                      const std::vector<std::string>& writer) {
    for (const auto& name : required) {
        if (OptionSpec* spec = find_mutable(name)) spec->required = true;
    }
    for (const auto& name : reader) {
        if (OptionSpec* spec = find_mutable(name)) spec->readable = true;
    }
    for (const auto& name : writer) {
        if (OptionSpec* spec = find_mutable(name)) spec->writable = true;
    }
    return *this;
}

const OptionSpec* OptionSchema::find(std::string_view name) const noexcept {
    for (const auto& spec : specs_) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

OptionSpec* OptionSchema::find_mutable(std::string_view name) noexcept {
    for (auto& spec : specs_) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

// ─────────────────────────────────────────────────────────────────────────────
// OptionTable
// ─────────────────────────────────────────────────────────────────────────────

Status OptionTable::create(const OptionSchema& schema, const OptionMap& provided,
                           OptionTable* out) {
    OptionTable table;
    table.schema_ = &schema;

    for (const auto& [name, raw] : provided) {
        const OptionSpec* spec = schema.find(name);
        if (spec == nullptr) {
            return Status::ConfigError("Unknown option '" + name + "' for " +
                                       schema.owner());
        }
        if (raw.is_null()) {
            continue;
        }
        Value value;
        auto status = table.coerce(*spec, raw, &value);
        if (!status.ok()) {
            return status;
        }
        table.values_[name] = Slot{std::move(value), OptionOrigin::EXPLICIT};
    }

    for (const auto& spec : schema.specs()) {
        if (table.values_.count(spec.name) > 0) {
            continue;
        }
        if (spec.required) {
            return Status::ConfigError("Missing required option '" + spec.name +
                                       "' for " + schema.owner());
        }
        if (spec.default_value) {
            table.values_[spec.name] = Slot{*spec.default_value, OptionOrigin::DEFAULT};
        }
    }

    *out = std::move(table);
    return Status::Ok();
}

const Value& OptionTable::get(std::string_view name) const noexcept {
    static const Value kNull;
    auto it = values_.find(name);
    return it != values_.end() ? it->second.value : kNull;
}

Status OptionTable::read(std::string_view name, Value* out) const {
    const OptionSpec* spec = schema_ ? schema_->find(name) : nullptr;
    if (spec == nullptr || !spec->readable) {
        return Status::ConfigError("Option '" + std::string(name) +
                                   "' is not readable");
    }
    *out = get(name);
    return Status::Ok();
}

bool OptionTable::is_defined(std::string_view name) const noexcept {
    auto it = values_.find(name);
    return it != values_.end() && it->second.origin != OptionOrigin::DEFAULT;
}

std::optional<OptionOrigin> OptionTable::origin(std::string_view name) const noexcept {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second.origin;
}

Status OptionTable::set(std::string_view name, Value value, bool overwrite) {
    const OptionSpec* spec = schema_ ? schema_->find(name) : nullptr;
    if (spec == nullptr || !spec->writable) {
        return Status::ConfigError("Option '" + std::string(name) +
                                   "' is not writable");
    }
    if (!overwrite && is_defined(name)) {
        return Status::Ok();
    }
    Value coerced;
    auto status = coerce(*spec, value, &coerced);
    if (!status.ok()) {
        return status;
    }
    values_[spec->name] = Slot{std::move(coerced), OptionOrigin::EXPLICIT};
    return Status::Ok();
}

Status OptionTable::merge(const OptionTable& other, MergePolicy policy) {
    for (const auto& [name, slot] : other.values_) {
        const bool theirs_defined = slot.origin != OptionOrigin::DEFAULT ||
                                    policy.missing == MergeMissing::DEFINED;
        if (!theirs_defined || slot.value.is_null()) {
            continue;
        }
        auto status = adopt(name, slot.value, policy);
        if (!status.ok()) {
            return status;
        }
    }
    return Status::Ok();
}

Status OptionTable::merge(const OptionMap& other, MergePolicy policy) {
    for (const auto& [name, value] : other) {
        if (value.is_null()) {
            continue;
        }
        auto status = adopt(name, value, policy);
        if (!status.ok()) {
            return status;
        }
    }
    return Status::Ok();
}

OptionMap OptionTable::defined_values() const {
    OptionMap result;
    for (const auto& [name, slot] : values_) {
        if (slot.origin != OptionOrigin::DEFAULT) {
            result.emplace(name, slot.value);
        }
    }
    return result;
}

bool OptionTable::operator==(const OptionTable& other) const {
    return schema_ == other.schema_ && values_ == other.values_;
}

Status OptionTable::coerce(const OptionSpec& spec, const Value& raw,
                           Value* out) const {
    Value value = spec.transform ? spec.transform(raw) : raw;
    if (spec.validator && !spec.validator(value)) {
        std::string message = "Invalid value for " + schema_->owner() +
                               " option '" + spec.name + "'";
        if (!spec.expected.empty()) {
            message += ": expected " + spec.expected;
        }
        message += ", got '" + value.to_string() + "'";
        return Status::ConfigError(std::move(message));
    }
    *out = std::move(value);
    return Status::Ok();
}

Status OptionTable::adopt(std::string_view name, const Value& value,
                          MergePolicy policy) {
    const OptionSpec* spec = schema_ ? schema_->find(name) : nullptr;
    if (spec == nullptr || !spec->inheritable) {
        return Status::Ok();
    }

    auto it = values_.find(name);
    const bool mine_defined =
        it != values_.end() && (it->second.origin != OptionOrigin::DEFAULT ||
                                policy.missing == MergeMissing::DEFINED);
    if (mine_defined &&
        (policy.prefer == MergePrefer::SELF || it->second.value == value)) {
        return Status::Ok();
    }

    Value coerced;
    auto status = coerce(*spec, value, &coerced);
    if (!status.ok()) {
        return status;
    }
    values_[spec->name] = Slot{std::move(coerced), OptionOrigin::INHERITED};
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Common transforms and validators
// ─────────────────────────────────────────────────────────────────────────────

namespace options {

OptionSpec::Transform trim() {
    return [](const Value& v) {
        auto s = v.try_string();
        if (!s) return v;
        const auto begin = s->find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos) return Value(std::string());
        const auto end = s->find_last_not_of(" \t\r\n");
        return Value(s->substr(begin, end - begin + 1));
    };
}

OptionSpec::Transform lowercase() {
    return [](const Value& v) {
        auto s = v.try_string();
        if (!s) return v;
        std::string lowered(*s);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return Value(std::move(lowered));
    };
}

OptionSpec::Validator is_bool() {
    return [](const Value& v) { return v.is_bool(); };
}

OptionSpec::Validator is_identifier() {
    return [](const Value& v) {
        auto s = v.try_string();
        return s && is_identifier(*s);
    };
}

OptionSpec::Validator is_positive_integer() {
    return [](const Value& v) {
        auto n = v.try_int64();
        return n && *n > 0;
    };
}

OptionSpec::Validator is_non_negative_integer() {
    return [](const Value& v) {
        auto n = v.try_int64();
        return n && *n >= 0;
    };
}

OptionSpec::Validator is_single_codepoint() {
    return [](const Value& v) {
        auto s = v.try_string();
        return s && utf8::length(*s) == 1;
    };
}

OptionSpec::Validator one_of(std::vector<std::string> allowed) {
    return [allowed = std::move(allowed)](const Value& v) {
        auto s = v.try_string();
        return s && std::find(allowed.begin(), allowed.end(), *s) != allowed.end();
    };
}

bool is_identifier(std::string_view name) noexcept {
    if (name.empty() || name.size() > config::kMaxNameLength) {
        return false;
    }
    const auto head = static_cast<unsigned char>(name.front());
    if (!std::isalpha(head) && head != '_') {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(), [](char c) {
        const auto ch = static_cast<unsigned char>(c);
        return std::isalnum(ch) || ch == '_';
    });
}

}  // namespace options

// ─────────────────────────────────────────────────────────────────────────────
// Owner option schemas
// ─────────────────────────────────────────────────────────────────────────────

namespace {

OptionSchema build_schema_options() {
    OptionSchema schema("schema");
    schema.define({"name", options::trim(), options::is_identifier(), "an identifier"})
        .define({"optional", {}, options::is_bool(), "true or false", Value(false),
                 false, false, false, true})
        .define({"singular", {}, options::is_bool(), "true or false", Value(false),
                 false, false, false, true})
        .define({"align", options::lowercase(), options::one_of({"left", "right"}),
                 "left or right", std::nullopt, false, false, false, true})
        .define({"padding", {}, options::is_single_codepoint(), "a single character",
                 std::nullopt, false, false, false, true})
        .define({"truncate", {}, options::is_bool(), "true or false", std::nullopt,
                 false, false, false, true})
        .define({"nil_blank", {}, options::is_bool(), "true or false", std::nullopt,
                 false, false, false, true});
    schema.configure({"name"},
                     {"name", "optional", "singular", "align", "padding",
                      "truncate", "nil_blank"},
                     {"optional", "singular"});
    return schema;
}

OptionSchema build_column_options() {
    OptionSchema schema("column");
    schema.define({"name", options::trim(), options::is_identifier(), "an identifier"})
        .define({"length", {}, options::is_positive_integer(), "a positive integer"})
        .define({"group", options::trim(), options::is_identifier(), "an identifier"})
        .define({"type", options::lowercase(),
                 options::one_of({"string", "integer", "float"}),
                 "string, integer or float", Value(config::kDefaultType)})
        .define({"precision", {}, options::is_non_negative_integer(),
                 "a non-negative integer"})
        .define({"align", options::lowercase(), options::one_of({"left", "right"}),
                 "left or right", Value(config::kDefaultAlign), false, false, false, true})
        .define({"padding", {}, options::is_single_codepoint(), "a single character",
                 Value(config::kDefaultPadding), false, false, false, true})
        .define({"truncate", {}, options::is_bool(), "true or false", Value(false),
                 false, false, false, true})
        .define({"nil_blank", {}, options::is_bool(), "true or false", Value(false),
                 false, false, false, true});
    schema.configure({"name", "length"},
                     {"name", "length", "group", "type", "precision", "align",
                      "padding", "truncate", "nil_blank"},
                     {});
    return schema;
}

}  // namespace

const OptionSchema& schema_option_schema() {
    static const OptionSchema schema = build_schema_options();
    return schema;
}

const OptionSchema& column_option_schema() {
    static const OptionSchema schema = build_column_options();
    return schema;
}

}  // namespace fixedwidth
