#pragma once

#include <cstddef>
#include <format>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "field_types.hpp"
#include "introspection.hpp"
#include "logging.hpp"
#include "model_options.hpp"
#include "result.hpp"
#include "value.hpp"

namespace ModelFusion {

// Compiled, shared schema of a named model. Immutable once built.
class ModelDefinition {
    // Constructible through Builder only
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    using Registry = std::vector<std::pair<std::string, Field>>;

    class Builder;

    ModelDefinition(Passkey, std::string name) : m_name(std::move(name)) {}

    const std::string&                     name() const { return m_name; }
    const Registry&                        fields() const { return m_fields; }
    const std::vector<ModelDefinitionPtr>& parents() const { return m_parents; }
    const ModelOptions&                    options() const { return m_options; }

    const Field* findField(std::string_view name) const {
        auto it = m_index.find(name);
        return it == m_index.end() ? nullptr : &m_fields[it->second].second;
    }

    bool declares(std::string_view name) const {
        return m_index.find(name) != m_index.end();
    }

private:
    // Replaces an existing entry in place, appends otherwise
    void merge(const std::string& name, const Field& field) {
        if (auto it = m_index.find(name); it != m_index.end()) {
            m_fields[it->second].second = field;
            return;
        }
        m_index.emplace(name, m_fields.size());
        m_fields.emplace_back(name, field);
    }

    std::string                                     m_name;
    Registry                                        m_fields;
    std::map<std::string, std::size_t, std::less<>> m_index;
    std::vector<ModelDefinitionPtr>                 m_parents;
    ModelOptions                                    m_options;
};


class ModelDefinition::Builder {
public:
    explicit Builder(std::string name) : m_name(std::move(name)) {}

    // Parents listed earlier take precedence over later ones
    Builder& extends(ModelDefinitionPtr parent) {
        m_parents.push_back(std::move(parent));
        return *this;
    }

    // The field's `key` option, when set, replaces `name` in the registry
    Builder& field(std::string name, Field f) {
        m_own.emplace_back(std::move(name), std::move(f));
        return *this;
    }

    Builder& options(ModelOptions::Entries entries) {
        m_options = std::move(entries);
        return *this;
    }

    Builder& options(Value document) {
        m_options = std::move(document);
        return *this;
    }

    Result<ModelDefinitionPtr> build() const {
        auto log = logging::getLogger();
        auto fail = [&](std::string message) -> std::unexpected<Error> {
            log->warn("Model '{}': {}", m_name, message);
            return makeError(ErrorCode::invalid_configuration, std::move(message));
        };

        auto def = std::make_shared<ModelDefinition>(Passkey{}, m_name);
        def->m_parents = m_parents;

        for (auto it = m_parents.rbegin(); it != m_parents.rend(); ++it) {
            if (!*it) {
                return fail("null parent definition");
            }
            for (const auto& [name, field] : (*it)->fields()) {
                def->merge(name, field);
            }
        }

        std::map<std::string, bool, std::less<>> seen;
        for (const auto& [declared, field] : m_own) {
            if (!field) {
                return fail(std::format("field '{}' has no type", declared));
            }
            const std::string& name = field->key().empty() ? declared : field->key();
            if (!seen.emplace(name, true).second) {
                return fail(std::format("field '{}' is declared twice", name));
            }
            def->merge(name, field);
        }

        auto opts = std::visit([&](const auto& source) -> Result<ModelOptions> {
            using S = std::decay_t<decltype(source)>;
            if constexpr (std::is_same_v<S, std::monostate>) {
                return ModelOptions(def.get());
            } else if constexpr (std::is_same_v<S, ModelOptions::Entries>) {
                return ModelOptions::make(def.get(), source);
            } else {
                return ModelOptions::fromValue(def.get(), source);
            }
        }, m_options);
        if (!opts) {
            return fail(opts.error().message);
        }
        def->m_options = std::move(*opts);

        log->debug("Declared model '{}' with {} field(s)", def->name(), def->fields().size());
        return ModelDefinitionPtr(std::move(def));
    }

private:
    std::string                                                  m_name;
    std::vector<ModelDefinitionPtr>                              m_parents;
    std::vector<std::pair<std::string, Field>>                   m_own;
    std::variant<std::monostate, ModelOptions::Entries, Value>   m_options;
};


// Builds a definition from an aggregate declaration struct:
//     struct PersonFields {
//         Field name = StringType({.required = true});
//         Field age  = IntType();
//         static ModelOptions::Entries options() { return {{"namespace", "people"}}; }
//     };
//     auto Person = declare<PersonFields>("Person");
template<class Decl>
Result<ModelDefinitionPtr> declare(std::string name, std::vector<ModelDefinitionPtr> parents = {}) {
    ModelDefinition::Builder builder(std::move(name));
    for (auto& p : parents) {
        builder.extends(std::move(p));
    }
    const Decl decl{};
    introspection::forEachField(decl, [&](std::string_view fieldName, const Field& f) {
        builder.field(std::string(fieldName), f);
    });
    if constexpr (introspection::DeclaresOptions<Decl>) {
        builder.options(Decl::options());
    }
    return builder.build();
}

} // namespace ModelFusion
