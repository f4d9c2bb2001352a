#pragma once

#include <string>

namespace tilestitch::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate a resource id of the form "<prefix>_<epoch seconds>_<8 hex chars>".
std::string GenerateResourceId(const std::string& prefix);

}  // namespace tilestitch::core
