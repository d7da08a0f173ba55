#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ModelFusion {


enum class ErrorCode {
    none,

    conversion_error,
    required_field_missing,
    structure_mismatch,
    size_constraint_violation,
    value_constraint_violation,

    invalid_configuration,
    validation_error,
    reader_error,
    writer_error
};

constexpr std::string_view error_to_string(ErrorCode e) {
    switch(e) {
    case ErrorCode::none:                       return "none"; break;
    case ErrorCode::conversion_error:           return "conversion_error"; break;
    case ErrorCode::required_field_missing:     return "required_field_missing"; break;
    case ErrorCode::structure_mismatch:         return "structure_mismatch"; break;
    case ErrorCode::size_constraint_violation:  return "size_constraint_violation"; break;
    case ErrorCode::value_constraint_violation: return "value_constraint_violation"; break;
    case ErrorCode::invalid_configuration:      return "invalid_configuration"; break;
    case ErrorCode::validation_error:           return "validation_error"; break;
    case ErrorCode::reader_error:               return "reader_error"; break;
    case ErrorCode::writer_error:               return "writer_error"; break;
    }
    return "N/A";
}

namespace messages {
inline constexpr std::string_view required = "This field is required.";
}

// Field name -> messages, in the order they were produced
using ErrorMessages = std::vector<std::string>;
using ErrorMap      = std::map<std::string, ErrorMessages, std::less<>>;

// Outcome of a single field conversion or validation.
struct FieldFailure {
    ErrorCode     code = ErrorCode::none;
    ErrorMessages messages;

    static FieldFailure make(ErrorCode c, std::string message) {
        return FieldFailure{c, ErrorMessages{std::move(message)}};
    }
    static FieldFailure missing() {
        return make(ErrorCode::required_field_missing, std::string(ModelFusion::messages::required));
    }
};

struct Error {
    ErrorCode   code = ErrorCode::none;
    std::string message;
    ErrorMap    fields;

    explicit operator bool() const {
        return code != ErrorCode::none;
    }
};

} // namespace ModelFusion
