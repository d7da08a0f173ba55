#pragma once

#include <format>
#include <string>

#include "errors.hpp"

namespace ModelFusion {

namespace error_formatting_detail {

inline void appendFieldErrors(std::string& out, const ErrorMap& fields) {
    for (const auto& [name, msgs] : fields) {
        for (const auto& m : msgs) {
            out += std::format("\n  - {}: {}", name, m);
        }
    }
}

}

inline std::string ErrorMapToString(const ErrorMap& fields) {
    std::string out;
    error_formatting_detail::appendFieldErrors(out, fields);
    if (!out.empty()) {
        out.erase(0, 1); // leading newline
    }
    return out;
}

// "validation_error: Model 'User' is missing required fields (1 error(s))
//   - bio: This field is required."
inline std::string ErrorToString(const Error& e) {
    std::string out = std::string(error_to_string(e.code));
    if (!e.message.empty()) {
        out += ": " + e.message;
    }
    if (!e.fields.empty()) {
        std::size_t count = 0;
        for (const auto& [_, msgs] : e.fields) count += msgs.size();
        out += std::format(" ({} error(s))", count);
        error_formatting_detail::appendFieldErrors(out, e.fields);
    }
    return out;
}

} // namespace ModelFusion
