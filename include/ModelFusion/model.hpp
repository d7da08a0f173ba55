#pragma once

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "errors.hpp"
#include "field_types.hpp"
#include "logging.hpp"
#include "model_definition.hpp"
#include "model_options.hpp"
#include "result.hpp"
#include "serializer.hpp"
#include "value.hpp"

namespace ModelFusion {

namespace model_detail {

inline void eraseEntry(ErrorMap& errors, std::string_view name) {
    if (auto it = errors.find(name); it != errors.end()) {
        errors.erase(it);
    }
}

} // namespace model_detail


inline Model::Model(ModelDefinitionPtr definition)
    : m_definition(std::move(definition))
{
    for (const auto& [name, field] : m_definition->fields()) {
        const auto& def = field->defaultValue();
        if (!def) {
            continue;
        }
        if (auto st = applyField(name, field, *def); !st) {
            logging::getLogger()->debug("Model '{}': default of '{}' rejected", m_definition->name(), name);
            m_errors.insert_or_assign(name, std::move(st.error().messages));
        }
    }
}

inline Result<Model> Model::create(ModelDefinitionPtr definition, const Value::Object& values) {
    Model m(std::move(definition));
    const ModelDefinition& def = m.definition();
    auto log = logging::getLogger();

    for (const auto& [name, raw] : values) {
        const Field* field = def.findField(name);
        if (!field) {
            log->trace("Model '{}': ignoring undeclared input '{}'", def.name(), name);
            continue;
        }
        if (auto st = m.applyField(name, *field, raw); st) {
            model_detail::eraseEntry(m.m_errors, name);
        } else {
            m.m_errors.insert_or_assign(name, std::move(st.error().messages));
        }
    }

    ErrorMap missing;
    for (const auto& [name, field] : def.fields()) {
        if (!field->required() || m.contains(name)) {
            continue;
        }
        auto it = m.m_errors.find(name);
        missing.emplace(name, it != m.m_errors.end() ? it->second
                                                     : ErrorMessages{std::string(messages::required)});
    }
    if (!missing.empty()) {
        log->debug("Model '{}': {} required field(s) without a value", def.name(), missing.size());
        return makeError(ErrorCode::validation_error,
                         std::format("Model '{}' is missing required fields", def.name()),
                         std::move(missing));
    }
    return m;
}

inline const ModelOptions& Model::options() const {
    return m_definition->options();
}

inline FieldStatus Model::applyField(std::string_view name, const Field& field, const Value& raw) {
    if (raw.isNull()) {
        // null means "no value"
        if (field->required()) {
            return std::unexpected(FieldFailure::missing());
        }
        if (auto it = m_data.find(name); it != m_data.end()) {
            m_data.erase(it);
        }
        return {};
    }
    auto converted = field->convertAndValidate(raw);
    if (!converted) {
        return std::unexpected(std::move(converted.error()));
    }
    m_data.insert_or_assign(std::string(name), std::move(*converted));
    return {};
}

inline bool Model::set(std::string_view name, const Value& raw) {
    const Field* field = m_definition->findField(name);
    if (!field) {
        logging::getLogger()->debug("Model '{}': cannot set undeclared field '{}'", m_definition->name(), name);
        return false;
    }
    if (auto st = applyField(name, *field, raw); !st) {
        m_errors.insert_or_assign(std::string(name), std::move(st.error().messages));
        return false;
    }
    model_detail::eraseEntry(m_errors, name);
    return true;
}

inline bool Model::validate(const Value::Object& input, bool partial) {
    ErrorMap found;

    for (const auto& [name, field] : m_definition->fields()) {
        const Value* candidate = nullptr;
        if (auto it = input.find(name); it != input.end()) {
            candidate = &it->second;
        } else if (contains(name)) {
            continue;
        } else if (!partial && field->defaultValue()) {
            candidate = &*field->defaultValue();
        }

        if (!candidate) {
            if (!partial && field->required()) {
                found.emplace(name, ErrorMessages{std::string(messages::required)});
            }
            continue;
        }
        if (auto st = applyField(name, field, *candidate); !st) {
            found.emplace(name, std::move(st.error().messages));
        }
    }

    const std::size_t invalid = found.size();
    if (partial) {
        for (const auto& [name, _] : input) {
            model_detail::eraseEntry(m_errors, name);
        }
        for (auto& [name, msgs] : found) {
            m_errors.insert_or_assign(name, std::move(msgs));
        }
    } else {
        m_errors = std::move(found);
    }

    logging::getLogger()->debug("Model '{}': {} validation finished with {} invalid field(s)",
                                m_definition->name(), partial ? "partial" : "full", invalid);
    return invalid == 0;
}

inline const Value& Model::at(std::string_view name) const {
    if (!m_definition->declares(name)) {
        throw std::out_of_range(std::format("Model '{}' has no field '{}'", m_definition->name(), name));
    }
    auto it = m_data.find(name);
    if (it == m_data.end()) {
        throw std::out_of_range(std::format("Field '{}' of model '{}' is not set", name, m_definition->name()));
    }
    return it->second;
}

} // namespace ModelFusion
