#pragma once

#include <ModelFusion/modelfusion.hpp>
#include <cstddef>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TestHelpers {

// ============================================================================
// Runner
// ============================================================================

class Runner {
public:
    explicit Runner(std::string_view suite) : suite_(suite) {}

    void check(bool ok, std::string_view what) {
        ++total_;
        if (!ok) {
            ++failed_;
            std::cerr << "[FAIL] " << suite_ << ": " << what << "\n";
        }
    }

    int finish() const {
        std::cout << suite_ << ": " << (total_ - failed_) << "/" << total_ << " passed\n";
        return failed_ == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }

private:
    std::string_view suite_;
    int total_  = 0;
    int failed_ = 0;
};

// ============================================================================
// Declaration Helpers
// ============================================================================

/// Declare or stop the test binary; declarations in tests are expected to be valid
template<class Decl>
ModelFusion::ModelDefinitionPtr Declare(std::string name, std::vector<ModelFusion::ModelDefinitionPtr> parents = {}) {
    auto def = ModelFusion::declare<Decl>(std::move(name), std::move(parents));
    if (!def) {
        std::cerr << "declaration failed: " << ModelFusion::ErrorToString(def.error()) << "\n";
        std::abort();
    }
    return *def;
}

inline ModelFusion::ModelDefinitionPtr Build(const ModelFusion::ModelDefinition::Builder& builder) {
    auto def = builder.build();
    if (!def) {
        std::cerr << "declaration failed: " << ModelFusion::ErrorToString(def.error()) << "\n";
        std::abort();
    }
    return *def;
}

// ============================================================================
// Error Helpers
// ============================================================================

/// Exact message list recorded for one field
inline bool FieldErrorsAre(const ModelFusion::ErrorMap& errors, std::string_view field,
                           std::initializer_list<std::string_view> expected) {
    auto it = errors.find(field);
    if (it == errors.end()) {
        return false;
    }
    if (it->second.size() != expected.size()) {
        return false;
    }
    std::size_t i = 0;
    for (auto e : expected) {
        if (it->second[i++] != e) return false;
    }
    return true;
}

inline bool HasFieldError(const ModelFusion::ErrorMap& errors, std::string_view field) {
    return errors.find(field) != errors.end();
}

/// Conversion + validation of a single raw value fails with the given code
inline bool ConvertFailsWith(const ModelFusion::Field& field, const ModelFusion::Value& raw,
                             ModelFusion::ErrorCode code) {
    auto r = field->convertAndValidate(raw);
    return !r && r.error().code == code;
}

inline bool ConvertFailsWithMessage(const ModelFusion::Field& field, const ModelFusion::Value& raw,
                                    ModelFusion::ErrorCode code, std::string_view message) {
    auto r = field->convertAndValidate(raw);
    return !r && r.error().code == code
        && r.error().messages.size() == 1 && r.error().messages.front() == message;
}

inline bool ConvertsTo(const ModelFusion::Field& field, const ModelFusion::Value& raw,
                       const ModelFusion::Value& expected) {
    auto r = field->convertAndValidate(raw);
    return r && *r == expected;
}

// ============================================================================
// Nesting Helpers
// ============================================================================

/// "[[...]]" with `depth` arrays
inline std::string NestedArraysText(std::size_t depth) {
    return std::string(depth, '[') + std::string(depth, ']');
}

/// `depth` arrays nested inside one another, innermost empty
inline ModelFusion::Value NestedArrays(std::size_t depth) {
    ModelFusion::Value v = ModelFusion::Value::Array{};
    for (std::size_t i = 1; i < depth; i ++) {
        ModelFusion::Value::Array wrapper;
        wrapper.push_back(std::move(v));
        v = ModelFusion::Value(std::move(wrapper));
    }
    return v;
}

} // namespace TestHelpers
