#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <yyjson.h>

#include "logging.hpp"
#include "model.hpp"
#include "result.hpp"
#include "serializer.hpp"
#include "value.hpp"

namespace ModelFusion {

namespace json {

namespace detail {

struct DocDeleter {
    void operator()(yyjson_doc* d) const { yyjson_doc_free(d); }
};
struct MutDocDeleter {
    void operator()(yyjson_mut_doc* d) const { yyjson_mut_doc_free(d); }
};
struct FreeDeleter {
    void operator()(char* p) const { std::free(p); }
};

inline Result<Value> fromYyjson(yyjson_val* v, std::size_t depth = 0) {
    if ((yyjson_is_arr(v) || yyjson_is_obj(v)) && depth >= max_nesting_depth) {
        return makeError(ErrorCode::reader_error,
                         std::format("JSON nesting exceeds the maximum depth of {}", max_nesting_depth));
    }
    switch (yyjson_get_type(v)) {
    case YYJSON_TYPE_BOOL:
        return Value(yyjson_get_bool(v));
    case YYJSON_TYPE_NUM:
        if (yyjson_is_real(v)) {
            return Value(yyjson_get_real(v));
        }
        if (yyjson_is_uint(v)) {
            // Past INT64_MAX the Value keeps it as a double
            return Value(static_cast<std::uint64_t>(yyjson_get_uint(v)));
        }
        return Value(static_cast<std::int64_t>(yyjson_get_sint(v)));
    case YYJSON_TYPE_STR:
        return Value(std::string(yyjson_get_str(v), yyjson_get_len(v)));
    case YYJSON_TYPE_ARR: {
        Value::Array out;
        out.reserve(yyjson_arr_size(v));
        yyjson_arr_iter it;
        yyjson_arr_iter_init(v, &it);
        while (yyjson_val* item = yyjson_arr_iter_next(&it)) {
            auto converted = fromYyjson(item, depth + 1);
            if (!converted) {
                return converted;
            }
            out.push_back(std::move(*converted));
        }
        return Value(std::move(out));
    }
    case YYJSON_TYPE_OBJ: {
        Value::Object out;
        yyjson_obj_iter it;
        yyjson_obj_iter_init(v, &it);
        while (yyjson_val* key = yyjson_obj_iter_next(&it)) {
            auto converted = fromYyjson(yyjson_obj_iter_get_val(key), depth + 1);
            if (!converted) {
                return converted;
            }
            // Duplicate keys: the last occurrence wins
            out.insert_or_assign(std::string(yyjson_get_str(key), yyjson_get_len(key)),
                                 std::move(*converted));
        }
        return Value(std::move(out));
    }
    default:
        return Value(nullptr);
    }
}

// `v` must already be primitive (see serializer::toPrimitive)
inline yyjson_mut_val* toYyjson(yyjson_mut_doc* doc, const Value& v) {
    switch (v.kind()) {
    case Value::Kind::null:    return yyjson_mut_null(doc);
    case Value::Kind::boolean: return yyjson_mut_bool(doc, v.asBool());
    case Value::Kind::integer: return yyjson_mut_sint(doc, v.asInt());
    case Value::Kind::real:    return yyjson_mut_real(doc, v.asDouble());
    case Value::Kind::string:
        return yyjson_mut_strncpy(doc, v.asString().data(), v.asString().size());
    case Value::Kind::array: {
        yyjson_mut_val* arr = yyjson_mut_arr(doc);
        for (const auto& item : v.asArray()) {
            yyjson_mut_val* node = toYyjson(doc, item);
            if (!node || !yyjson_mut_arr_add_val(arr, node)) {
                return nullptr;
            }
        }
        return arr;
    }
    case Value::Kind::object: {
        yyjson_mut_val* obj = yyjson_mut_obj(doc);
        for (const auto& [k, item] : v.asObject()) {
            yyjson_mut_val* key  = yyjson_mut_strncpy(doc, k.data(), k.size());
            yyjson_mut_val* node = toYyjson(doc, item);
            if (!key || !node || !yyjson_mut_obj_add(obj, key, node)) {
                return nullptr;
            }
        }
        return obj;
    }
    default:
        return nullptr;
    }
}

} // namespace detail


inline Result<Value> parse(std::string_view text) {
    yyjson_read_err err;
    // Without YYJSON_READ_INSITU the input buffer is not modified
    std::unique_ptr<yyjson_doc, detail::DocDeleter> doc(
        yyjson_read_opts(const_cast<char*>(text.data()), text.size(), 0, nullptr, &err));
    if (!doc) {
        logging::getLogger()->debug("JSON parse failed at {}: {}", err.pos, err.msg);
        return makeError(ErrorCode::reader_error,
                         std::format("JSON parse error at position {}: {}", err.pos, err.msg));
    }
    return detail::fromYyjson(yyjson_doc_get_root(doc.get()));
}

// Top-level document must be an object; suitable for Model::validate and Model::create
inline Result<Value::Object> parseObject(std::string_view text) {
    auto v = parse(text);
    if (!v) {
        return std::unexpected(std::move(v.error()));
    }
    if (!v->isObject()) {
        return makeError(ErrorCode::reader_error,
                         std::format("Expected a JSON object, got {}", v->typeName()));
    }
    return v->asObject();
}

inline Result<std::string> write(const Value& value, bool pretty = false) {
    auto primitive = serializer::toPrimitive(value, std::nullopt);
    if (!primitive) {
        return std::unexpected(std::move(primitive.error()));
    }

    std::unique_ptr<yyjson_mut_doc, detail::MutDocDeleter> doc(yyjson_mut_doc_new(nullptr));
    if (!doc) {
        return makeError(ErrorCode::writer_error, "Failed to allocate JSON document");
    }
    yyjson_mut_val* root = detail::toYyjson(doc.get(), *primitive);
    if (!root) {
        return makeError(ErrorCode::writer_error, "Failed to build JSON document");
    }
    yyjson_mut_doc_set_root(doc.get(), root);

    yyjson_write_err err;
    std::size_t len = 0;
    const yyjson_write_flag flags = pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG;
    std::unique_ptr<char, detail::FreeDeleter> out(
        yyjson_mut_write_opts(doc.get(), flags, nullptr, &len, &err));
    if (!out) {
        return makeError(ErrorCode::writer_error, std::format("JSON write error: {}", err.msg));
    }
    return std::string(out.get(), len);
}

inline Result<std::string> serialize(const Model& model,
                                     std::optional<std::string_view> role = std::nullopt,
                                     bool pretty = false) {
    auto obj = model.serialize(role);
    if (!obj) {
        return std::unexpected(std::move(obj.error()));
    }
    return write(Value(std::move(*obj)), pretty);
}

} // namespace json

} // namespace ModelFusion
