#pragma once

#include <string>

namespace tilestitch::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);
/// @brief Count one invocation outcome ("completed", "not_ready", ...).
void RecordReassembly(const std::string& outcome);
/// @brief Record the totals of one sweep run.
void RecordSweep(int checked, int reassembled, int failed);

}  // namespace tilestitch::observability
