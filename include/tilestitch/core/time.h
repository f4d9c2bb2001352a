#pragma once

#include <cstdint>
#include <string>

namespace tilestitch::core {

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Returns a UTC ISO8601 timestamp offset from now by delta seconds.
std::string NowIso8601WithOffsetSeconds(int delta_seconds);
/// @brief Seconds since the Unix epoch.
std::int64_t NowEpochSeconds();
/// @brief Milliseconds since the Unix epoch.
std::int64_t NowEpochMillis();

}  // namespace tilestitch::core
