#pragma once

#include <expected>
#include <string>
#include <utility>

#include "errors.hpp"

namespace ModelFusion {

template <class T>
using Result = std::expected<T, Error>;

// Field-level outcomes never leave the model; they are folded into its ErrorMap.
template <class T>
using FieldResult = std::expected<T, FieldFailure>;

using FieldStatus = std::expected<void, FieldFailure>;

inline std::unexpected<Error> makeError(ErrorCode code, std::string message, ErrorMap fields = {}) {
    return std::unexpected(Error{code, std::move(message), std::move(fields)});
}

inline std::unexpected<FieldFailure> fieldError(ErrorCode code, std::string message) {
    return std::unexpected(FieldFailure::make(code, std::move(message)));
}

} // namespace ModelFusion
