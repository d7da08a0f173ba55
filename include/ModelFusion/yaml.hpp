#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <format>
#include <string>
#include <string_view>
#include <utility>

#include <rapidyaml.hpp>

#include "logging.hpp"
#include "result.hpp"
#include "value.hpp"

namespace ModelFusion {

namespace yaml {

namespace detail {

inline std::string_view view(c4::csubstr s) {
    return std::string_view(s.data(), s.size());
}

// Plain scalars are typed the way JSON would type them; quoted ones stay strings
inline Value scalar(ryml::ConstNodeRef node) {
    const std::string_view s = view(node.val());
    if (node.is_val_quoted()) {
        return Value(s);
    }
    if (s.empty() || s == "null" || s == "~") {
        return Value(nullptr);
    }
    if (s == "true")  return Value(true);
    if (s == "false") return Value(false);

    const char first = s.front();
    if ((first >= '0' && first <= '9') || first == '-' || first == '+' || first == '.') {
        std::string_view digits = s;
        if (first == '+') {
            digits.remove_prefix(1);
            // "+-5" is text, not a number
            if (!digits.empty() && (digits.front() == '+' || digits.front() == '-')) {
                return Value(s);
            }
        }
        std::int64_t i = 0;
        auto [iptr, iec] = std::from_chars(digits.data(), digits.data() + digits.size(), i);
        if (iec == std::errc() && iptr == digits.data() + digits.size()) {
            return Value(i);
        }
        double d = 0;
        auto [dptr, dec] = std::from_chars(digits.data(), digits.data() + digits.size(), d);
        if (dec == std::errc() && dptr == digits.data() + digits.size()) {
            return Value(d);
        }
    }
    return Value(s);
}

// Anchors, aliases and tags are not supported
inline Result<Value> fromNode(ryml::ConstNodeRef node, std::size_t depth = 0) {
    if (node.has_anchor() || node.is_ref() || node.has_key_tag() || node.has_val_tag()) {
        return makeError(ErrorCode::reader_error, "YAML anchors, aliases and tags are not supported");
    }
    if (node.is_container() && depth >= max_nesting_depth) {
        return makeError(ErrorCode::reader_error,
                         std::format("YAML nesting exceeds the maximum depth of {}", max_nesting_depth));
    }
    if (node.is_map()) {
        Value::Object out;
        for (ryml::ConstNodeRef child : node.children()) {
            auto converted = fromNode(child, depth + 1);
            if (!converted) {
                return converted;
            }
            out.insert_or_assign(std::string(view(child.key())), std::move(*converted));
        }
        return Value(std::move(out));
    }
    if (node.is_seq()) {
        Value::Array out;
        out.reserve(node.num_children());
        for (ryml::ConstNodeRef child : node.children()) {
            auto converted = fromNode(child, depth + 1);
            if (!converted) {
                return converted;
            }
            out.push_back(std::move(*converted));
        }
        return Value(std::move(out));
    }
    if (node.has_val()) {
        return scalar(node);
    }
    return Value(nullptr);
}

} // namespace detail


// Builds with RYML_DEFAULT_CALLBACK_USES_EXCEPTIONS so parse errors surface here
inline Result<Value> parse(std::string_view text) {
    auto fail = [](std::string message) -> std::unexpected<Error> {
        logging::getLogger()->debug("YAML parse failed: {}", message);
        return makeError(ErrorCode::reader_error, std::move(message));
    };

    ryml::Tree tree;
    try {
        tree = ryml::parse_in_arena(c4::csubstr(text.data(), text.size()));
    } catch (const std::exception& e) {
        return fail(std::format("YAML parse error: {}", e.what()));
    }

    ryml::ConstNodeRef root = tree.crootref();
    if (root.is_stream()) {
        if (root.num_children() > 1) {
            return fail("Multi-document YAML streams are not supported");
        }
        if (root.num_children() == 0) {
            return Value(nullptr);
        }
        root = root.first_child();
    }
    if (!root.readable()) {
        return Value(nullptr);
    }
    auto value = detail::fromNode(root);
    if (!value) {
        return fail(std::move(value.error().message));
    }
    return value;
}

inline Result<Value::Object> parseObject(std::string_view text) {
    auto v = parse(text);
    if (!v) {
        return std::unexpected(std::move(v.error()));
    }
    if (!v->isObject()) {
        return makeError(ErrorCode::reader_error,
                         std::format("Expected a YAML mapping, got {}", v->typeName()));
    }
    return v->asObject();
}

} // namespace yaml

} // namespace ModelFusion
