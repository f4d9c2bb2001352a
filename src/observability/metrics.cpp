#include "tilestitch/observability/metrics.h"

#include <array>
#include <atomic>
#include <cstdint>

namespace tilestitch::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};

constexpr std::array<const char*, 7> kOutcomes{"completed", "already_completed", "not_ready",
                                               "in_progress", "not_found", "failed", "invalid"};
std::array<std::atomic<std::uint64_t>, kOutcomes.size()> g_reassembly_outcomes{};

std::atomic<std::uint64_t> g_sweeps_total{0};
std::atomic<std::uint64_t> g_sweep_sessions_checked{0};
std::atomic<std::uint64_t> g_sweep_sessions_reassembled{0};
std::atomic<std::uint64_t> g_sweep_sessions_failed{0};

std::string Counter(const std::string& name, const std::string& help, std::uint64_t value) {
    return "# HELP " + name + " " + help + "\n# TYPE " + name + " counter\n" + name + " " +
           std::to_string(value) + "\n";
}
}  // namespace

void RecordRequest(int status_code, long long latency_ms) {
    g_total_requests.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code >= 200 && status_code < 300) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordReassembly(const std::string& outcome) {
    for (std::size_t i = 0; i < kOutcomes.size(); ++i) {
        if (outcome == kOutcomes[i]) {
            g_reassembly_outcomes[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
}

void RecordSweep(int checked, int reassembled, int failed) {
    g_sweeps_total.fetch_add(1, std::memory_order_relaxed);
    g_sweep_sessions_checked.fetch_add(static_cast<std::uint64_t>(checked),
                                       std::memory_order_relaxed);
    g_sweep_sessions_reassembled.fetch_add(static_cast<std::uint64_t>(reassembled),
                                           std::memory_order_relaxed);
    g_sweep_sessions_failed.fetch_add(static_cast<std::uint64_t>(failed),
                                      std::memory_order_relaxed);
}

std::string RenderMetrics() {
    std::string out =
        "# HELP tilestitch_up 1 if server is up\n"
        "# TYPE tilestitch_up gauge\n"
        "tilestitch_up 1\n";
    out += Counter("tilestitch_http_requests_total", "Total HTTP requests processed",
                   g_total_requests.load(std::memory_order_relaxed));
    out += Counter("tilestitch_http_requests_2xx", "Total 2xx responses",
                   g_requests_2xx.load(std::memory_order_relaxed));
    out += Counter("tilestitch_http_requests_4xx", "Total 4xx responses",
                   g_requests_4xx.load(std::memory_order_relaxed));
    out += Counter("tilestitch_http_requests_5xx", "Total 5xx responses",
                   g_requests_5xx.load(std::memory_order_relaxed));
    out += Counter("tilestitch_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total.load(std::memory_order_relaxed));

    out += "# HELP tilestitch_reassembly_total Reassembly invocations by outcome\n"
           "# TYPE tilestitch_reassembly_total counter\n";
    for (std::size_t i = 0; i < kOutcomes.size(); ++i) {
        out += std::string("tilestitch_reassembly_total{outcome=\"") + kOutcomes[i] + "\"} " +
               std::to_string(g_reassembly_outcomes[i].load(std::memory_order_relaxed)) + "\n";
    }

    out += Counter("tilestitch_sweeps_total", "Completed sweeps of stale sessions",
                   g_sweeps_total.load(std::memory_order_relaxed));
    out += Counter("tilestitch_sweep_sessions_checked_total", "Sessions examined by sweeps",
                   g_sweep_sessions_checked.load(std::memory_order_relaxed));
    out += Counter("tilestitch_sweep_sessions_reassembled_total", "Sessions completed by sweeps",
                   g_sweep_sessions_reassembled.load(std::memory_order_relaxed));
    out += Counter("tilestitch_sweep_sessions_failed_total", "Sessions that failed during sweeps",
                   g_sweep_sessions_failed.load(std::memory_order_relaxed));
    return out;
}

}  // namespace tilestitch::observability
