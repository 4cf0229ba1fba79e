/**
 * @file column.cpp
 * @brief Column implementation
 */

#include "fixedwidth/column.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>

#include <spdlog/fmt/fmt.h>

#include "common/status.hpp"
#include "common/utf8.hpp"

namespace fixedwidth {

namespace {

/// True when text holds nothing but pad characters and spaces
bool is_blank(std::string_view text, std::string_view pad) {
    std::string_view rest = text;
    while (!rest.empty()) {
        std::string_view next = utf8::strip_leading(utf8::strip_leading(rest, pad), " ");
        if (next.size() == rest.size()) {
            return false;
        }
        rest = next;
    }
    return true;
}

std::string_view trim_spaces(std::string_view text) {
    const auto begin = text.find_first_not_of(' ');
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(' ');
    return text.substr(begin, end - begin + 1);
}

}  // namespace

Status Column::create(std::string name, size_t length, const OptionMap& options,
                      std::unique_ptr<Column>* out) {
    OptionMap provided = options;
    provided["name"] = Value(std::move(name));
    provided["length"] = Value(static_cast<int64_t>(length));

    auto column = std::make_unique<Column>(Token{});
    FIXEDWIDTH_RETURN_IF_ERROR(
        OptionTable::create(column_option_schema(), provided, &column->options_));

    column->name_ = column->options_.get("name").as_string();
    column->length_ = static_cast<size_t>(column->options_.get("length").as_int64());
    if (auto group = column->options_.get("group").try_string()) {
        column->group_ = std::string(*group);
    }
    *out = std::move(column);
    return Status::Ok();
}

Status Column::create_filler(std::string name, size_t length,
                             const std::string& padding,
                             std::unique_ptr<Column>* out) {
    OptionMap options;
    if (!padding.empty()) {
        options["padding"] = Value(padding);
    }
    std::unique_ptr<Column> column;
    FIXEDWIDTH_RETURN_IF_ERROR(create(std::move(name), length, options, &column));
    column->filler_ = true;
    *out = std::move(column);
    return Status::Ok();
}

const std::string& Column::padding() const {
    return options_.get("padding").as_string();
}

bool Column::align_left() const {
    return options_.get("align").as_string() == "left";
}

const std::string& Column::type() const {
    return options_.get("type").as_string();
}

// ─────────────────────────────────────────────────────────────────────────────
// Parsing
// ─────────────────────────────────────────────────────────────────────────────

Status Column::parse(std::string_view text, Value* out) const {
    if (filler_) {
        *out = Value();
        return Status::Ok();
    }

    const std::string& pad = padding();
    if (options_.get("nil_blank").try_bool().value_or(false) && is_blank(text, pad)) {
        *out = Value();
        return Status::Ok();
    }

    std::string_view stripped = align_left() ? utf8::strip_trailing(text, pad)
                                             : utf8::strip_leading(text, pad);
    if (type() == "string") {
        *out = Value(stripped);
        return Status::Ok();
    }
    return parse_number(text, stripped, out);
}

Status Column::parse_number(std::string_view raw, std::string_view text,
                            Value* out) const {
    const bool integer = type() == "integer";
    std::string_view digits = trim_spaces(text);

    if (digits.empty()) {
        // All spaces is a missing value; all padding (e.g. "0000") is zero
        if (trim_spaces(raw).empty()) {
            *out = Value();
        } else {
            *out = integer ? Value(static_cast<int64_t>(0)) : Value(0.0);
        }
        return Status::Ok();
    }

    if (integer) {
        // from_chars takes no '+', and must not see the sign in "+-5"
        bool signed_twice = false;
        if (digits.front() == '+') {
            digits.remove_prefix(1);
            signed_twice = !digits.empty() && digits.front() == '-';
        }
        int64_t parsed = 0;
        const char* end = digits.data() + digits.size();
        auto [ptr, ec] = std::from_chars(digits.data(), end, parsed);
        if (signed_twice || ec != std::errc() || ptr != end) {
            return Status::InvalidArgument("Column '" + name_ + "': cannot parse '" +
                                           std::string(text) + "' as integer");
        }
        *out = Value(parsed);
        return Status::Ok();
    }

    const std::string copy(digits);
    char* end = nullptr;
    errno = 0;
    const double parsed = std::strtod(copy.c_str(), &end);
    if (errno == ERANGE || end != copy.c_str() + copy.size()) {
        return Status::InvalidArgument("Column '" + name_ + "': cannot parse '" +
                                       std::string(text) + "' as float");
    }
    *out = Value(parsed);
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Formatting
// ─────────────────────────────────────────────────────────────────────────────

Status Column::format(const Value& value, std::string* out) const {
    const std::string& pad = padding();
    if (filler_) {
        *out = utf8::repeat(pad, length_);
        return Status::Ok();
    }

    std::string text;
    FIXEDWIDTH_RETURN_IF_ERROR(to_text(value, &text));

    size_t width = utf8::length(text);
    if (width > length_) {
        if (!options_.get("truncate").try_bool().value_or(false)) {
            return Status::InvalidArgument(fmt::format(
                "Formatted value '{}' exceeds the {}-character width of column '{}'",
                text, length_, name_));
        }
        text = std::string(align_left() ? utf8::first(text, length_)
                                        : utf8::last(text, length_));
        width = length_;
    }

    const std::string fill = utf8::repeat(pad, length_ - width);
    *out = align_left() ? text + fill : fill + text;
    return Status::Ok();
}

Status Column::to_text(const Value& value, std::string* out) const {
    if (value.is_null()) {
        out->clear();
    } else if (auto b = value.try_bool()) {
        *out = *b ? "true" : "false";
    } else if (auto i = value.try_int64()) {
        *out = std::to_string(*i);
    } else if (auto d = value.try_double()) {
        if (auto precision = options_.get("precision").try_int64()) {
            *out = fmt::format("{:.{}f}", *d, *precision);
        } else {
            *out = fmt::format("{}", *d);
        }
    } else if (auto s = value.try_string()) {
        *out = std::string(*s);
    } else {
        return Status::InvalidArgument("Column '" + name_ +
                                       "' cannot format a nested record");
    }
    return Status::Ok();
}

}  // namespace fixedwidth
