#pragma once

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "result.hpp"
#include "roles.hpp"
#include "value.hpp"

namespace ModelFusion {

// Per-definition configuration block: klass, roles, namespace.
class ModelOptions {
public:
    using OptionValue = std::variant<std::nullptr_t, const ModelDefinition*, Roles, std::string>;
    using Entries     = std::vector<std::pair<std::string, OptionValue>>;

    ModelOptions() = default;
    explicit ModelOptions(const ModelDefinition* klass) : m_klass(klass) {}

    // `klass` is the owning definition; an explicit "klass" entry replaces it.
    static Result<ModelOptions> make(const ModelDefinition* klass, const Entries& entries) {
        ModelOptions opts(klass);
        for (const auto& [key, value] : entries) {
            if (key == "klass") {
                if (std::holds_alternative<std::nullptr_t>(value)) {
                    opts.m_klass = nullptr;
                } else if (auto* k = std::get_if<const ModelDefinition*>(&value)) {
                    opts.m_klass = *k;
                } else {
                    return wrongKind(key, "a model definition");
                }
            } else if (key == "roles") {
                if (std::holds_alternative<std::nullptr_t>(value)) {
                    opts.m_roles.reset();
                } else if (auto* r = std::get_if<Roles>(&value)) {
                    opts.m_roles = *r;
                } else {
                    return wrongKind(key, "a role mapping");
                }
            } else if (key == "namespace") {
                if (std::holds_alternative<std::nullptr_t>(value)) {
                    opts.m_namespace.reset();
                } else if (auto* s = std::get_if<std::string>(&value)) {
                    opts.m_namespace = *s;
                } else {
                    return wrongKind(key, "a string");
                }
            } else {
                return makeError(ErrorCode::invalid_configuration,
                                 std::format("Unknown model option '{}'", key));
            }
        }
        return opts;
    }

    // Loads options from a document such as
    //     {"namespace": "users",
    //      "roles": {"public": {"whitelist": ["name"]}, "owner": "wholelist"}}
    static Result<ModelOptions> fromValue(const ModelDefinition* klass, const Value& doc) {
        if (doc.isNull()) {
            return ModelOptions(klass);
        }
        if (!doc.isObject()) {
            return makeError(ErrorCode::invalid_configuration,
                             std::format("Model options must be a mapping, not {}", doc.typeName()));
        }
        Entries entries;
        for (const auto& [key, value] : doc.asObject()) {
            if (value.isNull()) {
                entries.emplace_back(key, nullptr);
            } else if (key == "namespace" && value.isString()) {
                entries.emplace_back(key, value.asString());
            } else if (key == "roles" && value.isObject()) {
                auto roles = rolesFromValue(value.asObject());
                if (!roles) {
                    return std::unexpected(std::move(roles.error()));
                }
                entries.emplace_back(key, std::move(*roles));
            } else if (key == "klass" || key == "namespace" || key == "roles") {
                return makeError(ErrorCode::invalid_configuration,
                                 std::format("Model option '{}' cannot take a {} value", key, value.typeName()));
            } else {
                return makeError(ErrorCode::invalid_configuration,
                                 std::format("Unknown model option '{}'", key));
            }
        }
        return make(klass, entries);
    }

    const ModelDefinition*            klass() const { return m_klass; }
    const std::optional<Roles>&       roles() const { return m_roles; }
    const std::optional<std::string>& namespaceName() const { return m_namespace; }

    const RoleFilter* findRole(std::string_view name) const {
        if (!m_roles) return nullptr;
        auto it = m_roles->find(name);
        return it == m_roles->end() ? nullptr : &it->second;
    }

private:
    static std::unexpected<Error> wrongKind(std::string_view key, std::string_view expected) {
        return makeError(ErrorCode::invalid_configuration,
                         std::format("Model option '{}' expects {}", key, expected));
    }

    static Result<std::vector<std::string>> namesFromValue(std::string_view role, const Value& v) {
        if (!v.isArray()) {
            return makeError(ErrorCode::invalid_configuration,
                             std::format("Role '{}' expects a list of field names", role));
        }
        std::vector<std::string> names;
        for (const auto& item : v.asArray()) {
            if (!item.isString()) {
                return makeError(ErrorCode::invalid_configuration,
                                 std::format("Role '{}' lists a non-string field name {}", role, item.repr()));
            }
            names.push_back(item.asString());
        }
        return names;
    }

    static Result<Roles> rolesFromValue(const Value::Object& doc) {
        Roles roles;
        for (const auto& [role, entry] : doc) {
            if (entry.isString() && entry.asString() == "wholelist") {
                roles.emplace(role, wholelist());
                continue;
            }
            if (!entry.isObject() || entry.asObject().size() != 1) {
                return makeError(ErrorCode::invalid_configuration,
                                 std::format("Role '{}' must be \"wholelist\" or a single "
                                             "whitelist/blacklist entry", role));
            }
            const auto& [kind, list] = *entry.asObject().begin();
            RoleFilter filter;
            if (kind == "whitelist") {
                filter.kind = RoleFilter::Kind::whitelist;
            } else if (kind == "blacklist") {
                filter.kind = RoleFilter::Kind::blacklist;
            } else if (kind == "wholelist") {
                filter.kind = RoleFilter::Kind::wholelist;
            } else {
                return makeError(ErrorCode::invalid_configuration,
                                 std::format("Role '{}' has unknown filter kind '{}'", role, kind));
            }
            auto names = namesFromValue(role, list);
            if (!names) {
                return std::unexpected(std::move(names.error()));
            }
            filter.names = std::move(*names);
            roles.emplace(role, std::move(filter));
        }
        return roles;
    }

    const ModelDefinition*     m_klass = nullptr;
    std::optional<Roles>       m_roles;
    std::optional<std::string> m_namespace;
};

} // namespace ModelFusion
