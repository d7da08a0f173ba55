#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "datetime.hpp"
#include "errors.hpp"
#include "result.hpp"

namespace ModelFusion {

class Field;
class Model;
class ModelDefinition;
class ModelOptions;
class Value;

using ModelDefinitionPtr = std::shared_ptr<const ModelDefinition>;

// Most containers that may nest inside one another in a document read, written
// or serialized. The root value is at depth 0.
inline constexpr std::size_t max_nesting_depth = 512;

// Structural; nested model instances compare by their data stores
inline bool operator==(const Value& lhs, const Value& rhs);

// Raw input and converted field values share one dynamic representation.
class Value {
public:
    using Array    = std::vector<Value>;
    using Object   = std::map<std::string, Value, std::less<>>;
    using ModelPtr = std::shared_ptr<const Model>;

    // Alternative order matches Kind
    using Storage = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string,
                                 DateTime, Array, Object, ModelPtr>;

    enum class Kind {
        null,
        boolean,
        integer,
        real,
        string,
        datetime,
        array,
        object,
        model
    };

    Value() : m_storage(nullptr) {}
    Value(std::nullptr_t) : m_storage(nullptr) {}
    Value(bool b) : m_storage(b) {}

    template<class T>
        requires (std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, char>)
    Value(T i) : m_storage(fromIntegral(i)) {}

    Value(char) = delete;

    template<std::floating_point T>
    Value(T d) : m_storage(static_cast<double>(d)) {}

    Value(const char* s) : m_storage(std::string(s)) {}
    Value(std::string s) : m_storage(std::move(s)) {}
    Value(std::string_view s) : m_storage(std::string(s)) {}
    Value(DateTime dt) : m_storage(std::move(dt)) {}
    Value(Array a) : m_storage(std::move(a)) {}
    Value(Object o) : m_storage(std::move(o)) {}
    Value(ModelPtr m) : m_storage(std::move(m)) {}
    Value(Model m);

    Kind kind() const { return static_cast<Kind>(m_storage.index()); }

    bool isNull()     const { return kind() == Kind::null; }
    bool isBool()     const { return kind() == Kind::boolean; }
    bool isInt()      const { return kind() == Kind::integer; }
    bool isDouble()   const { return kind() == Kind::real; }
    bool isNumber()   const { return isInt() || isDouble(); }
    bool isString()   const { return kind() == Kind::string; }
    bool isDateTime() const { return kind() == Kind::datetime; }
    bool isArray()    const { return kind() == Kind::array; }
    bool isObject()   const { return kind() == Kind::object; }
    bool isModel()    const { return kind() == Kind::model; }
    bool isScalar()   const { return !isArray() && !isObject() && !isModel(); }

    template<class T> const T* getIf() const { return std::get_if<T>(&m_storage); }
    template<class T> T*       getIf()       { return std::get_if<T>(&m_storage); }

    // Checked access, throws std::bad_variant_access on a kind mismatch
    bool                asBool()     const { return std::get<bool>(m_storage); }
    std::int64_t        asInt()      const { return std::get<std::int64_t>(m_storage); }
    double              asDouble()   const { return std::get<double>(m_storage); }
    const std::string&  asString()   const { return std::get<std::string>(m_storage); }
    const DateTime&     asDateTime() const { return std::get<DateTime>(m_storage); }
    const Array&        asArray()    const { return std::get<Array>(m_storage); }
    const Object&       asObject()   const { return std::get<Object>(m_storage); }
    const ModelPtr&     modelPtr()   const { return std::get<ModelPtr>(m_storage); }
    const Model&        asModel()    const;

    const Storage& storage() const { return m_storage; }

    std::string_view typeName() const {
        switch (kind()) {
        case Kind::null:     return "null";
        case Kind::boolean:  return "bool";
        case Kind::integer:  return "int";
        case Kind::real:     return "float";
        case Kind::string:   return "str";
        case Kind::datetime: return "datetime";
        case Kind::array:    return "list";
        case Kind::object:   return "dict";
        case Kind::model:    return "model";
        }
        return "N/A";
    }

    // Short rendering used inside error messages
    std::string repr() const {
        switch (kind()) {
        case Kind::null:     return "None";
        case Kind::boolean:  return asBool() ? "True" : "False";
        case Kind::integer:  return std::to_string(asInt());
        case Kind::real:     return std::format("{}", asDouble());
        case Kind::string:   return "'" + asString() + "'";
        case Kind::datetime: return "'" + asDateTime().toIsoString() + "'";
        case Kind::array:    return std::format("<list of {}>", asArray().size());
        case Kind::object:   return std::format("<dict of {}>", asObject().size());
        case Kind::model:    return "<model instance>";
        }
        return "N/A";
    }

private:
    // Unsigned values past INT64_MAX keep their magnitude as a double
    template<class T>
    static Storage fromIntegral(T i) {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t)) {
            if (i > static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<double>(i);
            }
        }
        return static_cast<std::int64_t>(i);
    }

    Storage m_storage;
};


// Per-instance field values and error state. Operations that need the
// definition's registry live in model.hpp.
class Model {
public:
    using Data = std::map<std::string, Value, std::less<>>;

    // Blank instance; fields with a default are populated
    explicit Model(ModelDefinitionPtr definition);

    // Strict construction: fails when a required field ends up without a value
    static Result<Model> create(ModelDefinitionPtr definition, const Value::Object& values);

    const ModelDefinition&    definition() const { return *m_definition; }
    const ModelDefinitionPtr& definitionPtr() const { return m_definition; }
    const ModelOptions&       options() const;

    bool validate(const Value::Object& input, bool partial = false);
    bool set(std::string_view name, const Value& raw);

    bool contains(std::string_view name) const {
        return m_data.find(name) != m_data.end();
    }

    const Value* find(std::string_view name) const {
        auto it = m_data.find(name);
        return it == m_data.end() ? nullptr : &it->second;
    }

    // Throws std::out_of_range for undeclared or unset fields
    const Value& at(std::string_view name) const;
    const Value& operator[](std::string_view name) const { return at(name); }

    const Data&     data() const { return m_data; }
    const ErrorMap& errors() const { return m_errors; }
    bool            hasErrors() const { return !m_errors.empty(); }

    Result<Value::Object> serialize(std::optional<std::string_view> role = std::nullopt) const;

    friend bool operator==(const Model& lhs, const Model& rhs) {
        return lhs.m_data == rhs.m_data;
    }

private:
    // Converts, validates and stores one declared field; m_errors is left to the caller
    FieldStatus applyField(std::string_view name, const Field& field, const Value& raw);

    ModelDefinitionPtr m_definition;
    Data               m_data;
    ErrorMap           m_errors;
};


inline Value::Value(Model m) : m_storage(std::make_shared<const Model>(std::move(m))) {}

inline const Model& Value::asModel() const {
    return *std::get<ModelPtr>(m_storage);
}

inline bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    if (lhs.isModel()) {
        const auto& l = lhs.modelPtr();
        const auto& r = rhs.modelPtr();
        if (l == r) return true;
        if (!l || !r) return false;
        return *l == *r;
    }
    return lhs.storage() == rhs.storage();
}

} // namespace ModelFusion
