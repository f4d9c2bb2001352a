#pragma once

#include <string>

namespace tilestitch::core {

/// @brief Canonical error codes shared by the stores and the reassembly pipeline.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kNotFound,
    kAlreadyExists,
    kIoError,
    kDbError,
    kConflict,
    kTooLarge,
    kUnavailable,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable lower-case name for an error code, used in logs and responses.
const char* ErrorCodeName(ErrorCode code);

}  // namespace tilestitch::core
