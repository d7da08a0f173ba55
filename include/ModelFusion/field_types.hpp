#pragma once

#include <algorithm>
#include <charconv>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <format>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "value.hpp"

namespace ModelFusion {

// ============================================================================
// Field options
// ============================================================================
//
// Aggregates meant for designated initialization:
//     StringType({.required = true, .max_length = 64})
// `key` overrides the registry name taken from the declaration member.

struct FieldOptions {
    bool                 required = false;
    std::optional<Value> default_value{};
    std::vector<Value>   choices{};
    std::string          key{};
};

struct StringOptions {
    bool                       required = false;
    std::optional<Value>       default_value{};
    std::vector<Value>         choices{};
    std::string                key{};
    std::optional<std::size_t> min_length{};
    std::optional<std::size_t> max_length{};
};

struct IntOptions {
    bool                        required = false;
    std::optional<Value>        default_value{};
    std::vector<Value>          choices{};
    std::string                 key{};
    std::optional<std::int64_t> min_value{};
    std::optional<std::int64_t> max_value{};
};

struct FloatOptions {
    bool                  required = false;
    std::optional<Value>  default_value{};
    std::vector<Value>    choices{};
    std::string           key{};
    std::optional<double> min_value{};
    std::optional<double> max_value{};
};


// ============================================================================
// BaseType
// ============================================================================

class BaseType {
public:
    virtual ~BaseType() = default;

    bool                        required() const { return m_options.required; }
    const std::optional<Value>& defaultValue() const { return m_options.default_value; }
    const std::vector<Value>&   choices() const { return m_options.choices; }
    const std::string&          key() const { return m_options.key; }

    virtual std::string_view typeName() const = 0;

    // Raw -> typed. Accepts values that are already typed.
    virtual FieldResult<Value> convert(const Value& raw) const = 0;

    // Typed value constraints, independent of the owning model
    virtual FieldStatus validate(const Value& value) const {
        return checkChoices(value);
    }

    FieldResult<Value> convertAndValidate(const Value& raw) const {
        auto converted = convert(raw);
        if (!converted) {
            return converted;
        }
        if (auto st = validate(*converted); !st) {
            return std::unexpected(std::move(st.error()));
        }
        return converted;
    }

protected:
    explicit BaseType(FieldOptions options) : m_options(std::move(options)) {}
    BaseType(const BaseType&) = default;
    BaseType& operator=(const BaseType&) = default;

    FieldStatus checkChoices(const Value& value) const {
        const auto& allowed = m_options.choices;
        if (allowed.empty() || std::ranges::find(allowed, value) != allowed.end()) {
            return {};
        }
        std::string list;
        for (const auto& c : allowed) {
            if (!list.empty()) list += ", ";
            list += c.repr();
        }
        return fieldError(ErrorCode::value_constraint_violation,
                          std::format("Value must be one of [{}].", list));
    }

    FieldOptions m_options;
};


namespace field_types_detail {

constexpr std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\n\r\f\v";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

template<class NumberT>
bool parse_number(std::string_view text, NumberT& out) {
    std::string_view s = trim(text);
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
        // from_chars would still accept the '-' of "+-5"
        if (!s.empty() && s.front() == '-') return false;
    }
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

// Code points in well-formed UTF-8; nullopt for stray bytes, truncated or
// overlong sequences, surrogates and values past U+10FFFF
constexpr std::optional<std::size_t> utf8_length(std::string_view s) {
    constexpr char32_t min_code_point[] = {0, 0, 0x80, 0x800, 0x10000};
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        const auto lead = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        char32_t cp = 0;
        if (lead < 0x80) {
            len = 1; cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            len = 2; cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3; cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4; cp = lead & 0x07;
        } else {
            return std::nullopt;
        }
        if (i + len > s.size()) return std::nullopt;
        for (std::size_t k = 1; k < len; k ++) {
            const auto cont = static_cast<unsigned char>(s[i + k]);
            if ((cont & 0xC0) != 0x80) return std::nullopt;
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (cp < min_code_point[len] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return std::nullopt;
        }
        i += len;
        count ++;
    }
    return count;
}

} // namespace field_types_detail


// ============================================================================
// Scalar types
// ============================================================================

class StringType : public BaseType {
public:
    explicit StringType(StringOptions opts = {})
        : BaseType(FieldOptions{opts.required, std::move(opts.default_value),
                                std::move(opts.choices), std::move(opts.key)})
        , m_minLength(opts.min_length)
        , m_maxLength(opts.max_length)
    {}

    std::string_view typeName() const override { return "string"; }

    FieldResult<Value> convert(const Value& raw) const override {
        switch (raw.kind()) {
        case Value::Kind::string:
            if (field_types_detail::utf8_length(raw.asString())) {
                return raw;
            }
            break;
        case Value::Kind::integer:  return Value(std::to_string(raw.asInt()));
        case Value::Kind::real:     return Value(std::format("{}", raw.asDouble()));
        case Value::Kind::boolean:  return Value(raw.asBool() ? "true" : "false");
        case Value::Kind::datetime: return Value(raw.asDateTime().toIsoString());
        default: break;
        }
        return fieldError(ErrorCode::conversion_error, "Couldn't interpret value as string.");
    }

    FieldStatus validate(const Value& value) const override {
        if (auto st = checkChoices(value); !st) {
            return st;
        }
        // Lengths count code points
        const auto len = field_types_detail::utf8_length(value.asString());
        if (!len) {
            return fieldError(ErrorCode::conversion_error, "Couldn't interpret value as string.");
        }
        if (m_minLength && *len < *m_minLength) {
            return fieldError(ErrorCode::value_constraint_violation,
                              std::format("String value is too short (minimum {}).", *m_minLength));
        }
        if (m_maxLength && *len > *m_maxLength) {
            return fieldError(ErrorCode::value_constraint_violation,
                              std::format("String value is too long (maximum {}).", *m_maxLength));
        }
        return {};
    }

private:
    std::optional<std::size_t> m_minLength;
    std::optional<std::size_t> m_maxLength;
};


class IntType : public BaseType {
public:
    explicit IntType(IntOptions opts = {})
        : BaseType(FieldOptions{opts.required, std::move(opts.default_value),
                                std::move(opts.choices), std::move(opts.key)})
        , m_minValue(opts.min_value)
        , m_maxValue(opts.max_value)
    {}

    std::string_view typeName() const override { return "int"; }

    FieldResult<Value> convert(const Value& raw) const override {
        switch (raw.kind()) {
        case Value::Kind::integer:
            return raw;
        case Value::Kind::boolean:
            return Value(raw.asBool() ? 1 : 0);
        case Value::Kind::real: {
            const double d = raw.asDouble();
            // 2^63 is exactly representable, INT64_MAX is not
            if (std::isfinite(d) && d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
                return Value(static_cast<std::int64_t>(d));
            }
            break;
        }
        case Value::Kind::string: {
            std::int64_t v = 0;
            if (field_types_detail::parse_number(raw.asString(), v)) {
                return Value(v);
            }
            break;
        }
        default:
            break;
        }
        return fieldError(ErrorCode::conversion_error, std::format("Value {} is not int.", raw.repr()));
    }

    FieldStatus validate(const Value& value) const override {
        if (auto st = checkChoices(value); !st) {
            return st;
        }
        const std::int64_t v = value.asInt();
        if (m_minValue && v < *m_minValue) {
            return fieldError(ErrorCode::value_constraint_violation,
                              std::format("Int value should be greater than or equal to {}.", *m_minValue));
        }
        if (m_maxValue && v > *m_maxValue) {
            return fieldError(ErrorCode::value_constraint_violation,
                              std::format("Int value should be less than or equal to {}.", *m_maxValue));
        }
        return {};
    }

private:
    std::optional<std::int64_t> m_minValue;
    std::optional<std::int64_t> m_maxValue;
};


class FloatType : public BaseType {
public:
    explicit FloatType(FloatOptions opts = {})
        : BaseType(FieldOptions{opts.required, std::move(opts.default_value),
                                std::move(opts.choices), std::move(opts.key)})
        , m_minValue(opts.min_value)
        , m_maxValue(opts.max_value)
    {}

    std::string_view typeName() const override { return "float"; }

    FieldResult<Value> convert(const Value& raw) const override {
        switch (raw.kind()) {
        case Value::Kind::real:
            return raw;
        case Value::Kind::integer:
            return Value(static_cast<double>(raw.asInt()));
        case Value::Kind::boolean:
            return Value(raw.asBool() ? 1.0 : 0.0);
        case Value::Kind::string: {
            double d = 0;
            if (field_types_detail::parse_number(raw.asString(), d)) {
                return Value(d);
            }
            break;
        }
        default:
            break;
        }
        return fieldError(ErrorCode::conversion_error, std::format("Value {} is not float.", raw.repr()));
    }

    FieldStatus validate(const Value& value) const override {
        if (auto st = checkChoices(value); !st) {
            return st;
        }
        const double v = value.asDouble();
        if (m_minValue && v < *m_minValue) {
            return fieldError(ErrorCode::value_constraint_violation,
                              std::format("Float value should be greater than or equal to {}.", *m_minValue));
        }
        if (m_maxValue && v > *m_maxValue) {
            return fieldError(ErrorCode::value_constraint_violation,
                              std::format("Float value should be less than or equal to {}.", *m_maxValue));
        }
        return {};
    }

private:
    std::optional<double> m_minValue;
    std::optional<double> m_maxValue;
};


class BooleanType : public BaseType {
public:
    explicit BooleanType(FieldOptions opts = {}) : BaseType(std::move(opts)) {}

    std::string_view typeName() const override { return "boolean"; }

    FieldResult<Value> convert(const Value& raw) const override {
        if (raw.isBool()) {
            return raw;
        }
        if (raw.isInt() && (raw.asInt() == 0 || raw.asInt() == 1)) {
            return Value(raw.asInt() == 1);
        }
        if (raw.isString()) {
            const std::string_view s = field_types_detail::trim(raw.asString());
            if (s == "true" || s == "True" || s == "1") return Value(true);
            if (s == "false" || s == "False" || s == "0") return Value(false);
        }
        return fieldError(ErrorCode::conversion_error, std::format("Value {} is not a boolean.", raw.repr()));
    }
};


class DateTimeType : public BaseType {
public:
    explicit DateTimeType(FieldOptions opts = {}) : BaseType(std::move(opts)) {}

    std::string_view typeName() const override { return "datetime"; }

    FieldResult<Value> convert(const Value& raw) const override {
        if (raw.isDateTime()) {
            return raw;
        }
        if (raw.isString()) {
            if (auto dt = DateTime::parse(field_types_detail::trim(raw.asString()))) {
                return Value(*dt);
            }
        }
        return fieldError(ErrorCode::conversion_error,
                          std::format("Could not parse {}. Should be ISO8601.", raw.repr()));
    }
};


// ============================================================================
// Field handle
// ============================================================================
//
// Shared, immutable reference to a field type. Declaration structs hold these:
//     struct UserFields {
//         Field name = StringType({.required = true});
//         Field bio  = StringType();
//     };

class Field {
public:
    Field() = default;
    Field(std::shared_ptr<const BaseType> type) : m_type(std::move(type)) {}

    template<class T>
        requires std::derived_from<std::remove_cvref_t<T>, BaseType>
    Field(T&& type)
        : m_type(std::make_shared<const std::remove_cvref_t<T>>(std::forward<T>(type)))
    {}

    const BaseType& operator*() const { return *m_type; }
    const BaseType* operator->() const { return m_type.get(); }
    const BaseType* get() const { return m_type.get(); }
    explicit operator bool() const { return static_cast<bool>(m_type); }

    const std::shared_ptr<const BaseType>& shared() const { return m_type; }

    // Identity: two handles are equal when they share the same field type
    friend bool operator==(const Field&, const Field&) = default;

private:
    std::shared_ptr<const BaseType> m_type;
};

} // namespace ModelFusion
