#pragma once

#include <cstddef>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "field_types.hpp"
#include "model.hpp"
#include "model_definition.hpp"
#include "value.hpp"

namespace ModelFusion {

struct ListOptions {
    bool                       required = false;
    std::optional<Value>       default_value{};
    std::string                key{};
    std::optional<std::size_t> min_size{};
    std::optional<std::size_t> max_size{};
};


// Homogeneous list of an inner field type. A positive min_size implies required.
class ListType : public BaseType {
public:
    explicit ListType(Field inner, ListOptions opts = {})
        : BaseType(FieldOptions{opts.required || (opts.min_size && *opts.min_size > 0),
                                std::move(opts.default_value), {}, std::move(opts.key)})
        , m_inner(std::move(inner))
        , m_minSize(opts.min_size)
        , m_maxSize(opts.max_size)
    {}

    std::string_view typeName() const override { return "list"; }

    const Field&               inner() const { return m_inner; }
    std::optional<std::size_t> minSize() const { return m_minSize; }
    std::optional<std::size_t> maxSize() const { return m_maxSize; }

    FieldResult<Value> convert(const Value& raw) const override {
        if (!raw.isArray()) {
            return fieldError(ErrorCode::structure_mismatch,
                              std::format("Please provide a list of items, not {}.", raw.typeName()));
        }
        const auto& items = raw.asArray();
        Value::Array out;
        out.reserve(items.size());
        FieldFailure failure;

        for (std::size_t i = 0; i < items.size(); i ++) {
            auto converted = m_inner->convert(items[i]);
            if (converted) {
                out.push_back(std::move(*converted));
                continue;
            }
            // A scalar where a container is expected fails the list as a whole
            if (converted.error().code == ErrorCode::structure_mismatch && items[i].isScalar()) {
                return std::unexpected(std::move(converted.error()));
            }
            collect(failure, i, converted.error());
        }
        if (!failure.messages.empty()) {
            return std::unexpected(std::move(failure));
        }
        return Value(std::move(out));
    }

    FieldStatus validate(const Value& value) const override {
        const auto& items = value.asArray();
        if (m_minSize && items.size() < *m_minSize) {
            return fieldError(ErrorCode::size_constraint_violation,
                              std::format("Please provide at least {} item(s).", *m_minSize));
        }
        if (m_maxSize && items.size() > *m_maxSize) {
            return fieldError(ErrorCode::size_constraint_violation,
                              std::format("Please provide no more than {} item(s).", *m_maxSize));
        }
        FieldFailure failure;
        for (std::size_t i = 0; i < items.size(); i ++) {
            if (auto st = m_inner->validate(items[i]); !st) {
                collect(failure, i, st.error());
            }
        }
        if (!failure.messages.empty()) {
            return std::unexpected(std::move(failure));
        }
        return {};
    }

private:
    static void collect(FieldFailure& into, std::size_t index, const FieldFailure& item) {
        if (into.code == ErrorCode::none) {
            into.code = item.code;
        }
        for (const auto& m : item.messages) {
            into.messages.push_back(std::format("Item {}: {}", index, m));
        }
    }

    Field                      m_inner;
    std::optional<std::size_t> m_minSize;
    std::optional<std::size_t> m_maxSize;
};


// Nested model. Mappings are validated in full against the wrapped definition.
class ModelType : public BaseType {
public:
    explicit ModelType(ModelDefinitionPtr definition, FieldOptions opts = {})
        : BaseType(std::move(opts))
        , m_definition(std::move(definition))
    {}

    std::string_view typeName() const override { return "model"; }

    const ModelDefinitionPtr& definition() const { return m_definition; }

    FieldResult<Value> convert(const Value& raw) const override {
        if (raw.isModel() && &raw.asModel().definition() == m_definition.get()) {
            return raw;
        }
        if (!raw.isObject()) {
            return fieldError(ErrorCode::structure_mismatch,
                              std::format("Please use a mapping for this field or {} instance instead of {}.",
                                          m_definition->name(), raw.typeName()));
        }

        Model nested(m_definition);
        if (nested.validate(raw.asObject())) {
            return Value(std::move(nested));
        }
        FieldFailure failure{ErrorCode::structure_mismatch, {}};
        for (const auto& [name, msgs] : nested.errors()) {
            for (const auto& m : msgs) {
                failure.messages.push_back(std::format("{}: {}", name, m));
            }
        }
        return std::unexpected(std::move(failure));
    }

private:
    ModelDefinitionPtr m_definition;
};

} // namespace ModelFusion
