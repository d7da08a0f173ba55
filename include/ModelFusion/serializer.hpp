#pragma once

#include <cstddef>
#include <format>
#include <optional>
#include <string_view>
#include <utility>

#include "logging.hpp"
#include "model_definition.hpp"
#include "result.hpp"
#include "roles.hpp"
#include "value.hpp"

namespace ModelFusion {

namespace serializer {

using Role = std::optional<std::string_view>;

// `depth` is the nesting level of the value itself; containers past
// max_nesting_depth are a writer_error.
inline Result<Value::Object> serializeModel(const Model& model, Role role, std::size_t depth = 0);

inline std::unexpected<Error> nestingTooDeep() {
    return makeError(ErrorCode::writer_error,
                     std::format("Nesting exceeds the maximum depth of {}", max_nesting_depth));
}

// Externally representable form: DateTime becomes its ISO string, nested
// models become objects. Nested models keep the role only if they define it.
inline Result<Value> toPrimitive(const Value& v, Role role, std::size_t depth = 0) {
    if (!v.isScalar() && depth >= max_nesting_depth) {
        return nestingTooDeep();
    }
    switch (v.kind()) {
    case Value::Kind::datetime:
        return Value(v.asDateTime().toIsoString());
    case Value::Kind::array: {
        Value::Array out;
        out.reserve(v.asArray().size());
        for (const auto& item : v.asArray()) {
            auto p = toPrimitive(item, role, depth + 1);
            if (!p) {
                return p;
            }
            out.push_back(std::move(*p));
        }
        return Value(std::move(out));
    }
    case Value::Kind::object: {
        Value::Object out;
        for (const auto& [k, item] : v.asObject()) {
            auto p = toPrimitive(item, role, depth + 1);
            if (!p) {
                return p;
            }
            out.emplace(k, std::move(*p));
        }
        return Value(std::move(out));
    }
    case Value::Kind::model: {
        const Model& nested = v.asModel();
        Role nestedRole = (role && nested.definition().options().findRole(*role)) ? role : std::nullopt;
        auto obj = serializeModel(nested, nestedRole, depth);
        if (!obj) {
            return std::unexpected(std::move(obj.error()));
        }
        return Value(std::move(*obj));
    }
    default:
        return v;
    }
}

inline Result<Value::Object> serializeModel(const Model& model, Role role, std::size_t depth) {
    if (depth >= max_nesting_depth) {
        return nestingTooDeep();
    }
    const ModelDefinition& def = model.definition();

    const RoleFilter* filter = nullptr;
    if (role) {
        filter = def.options().findRole(*role);
        if (!filter) {
            logging::getLogger()->warn("Model '{}' has no role '{}'", def.name(), *role);
            return makeError(ErrorCode::invalid_configuration,
                             std::format("Model '{}' has no role '{}'", def.name(), *role));
        }
    }

    Value::Object out;
    for (const auto& [name, field] : def.fields()) {
        const Value* v = model.find(name);
        if (!v) {
            continue;
        }
        auto p = toPrimitive(*v, role, depth + 1);
        if (!p) {
            return std::unexpected(std::move(p.error()));
        }
        out.emplace(name, std::move(*p));
    }

    if (filter) {
        return filter->apply(out);
    }
    return out;
}

} // namespace serializer

inline Result<Value::Object> Model::serialize(std::optional<std::string_view> role) const {
    return serializer::serializeModel(*this, role);
}

} // namespace ModelFusion
