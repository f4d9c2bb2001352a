#pragma once

#include <string>
#include <utility>
#include <vector>

namespace tilestitch::core {

using LogFields = std::vector<std::pair<std::string, std::string>>;

/// @brief Route the "tilestitch" logger to the console and, when `log_file` is set, a rotating file.
void InitLogging(const std::string& level, const std::string& log_file = "");
void LogInfo(const std::string& message);
void LogWarning(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
/// @brief Log a structured JSON line for HTTP requests.
void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms);
/// @brief Log a structured JSON line for a pipeline event; events naming a failure log at warning.
void LogEvent(const std::string& event, const LogFields& fields);

}  // namespace tilestitch::core
