#include "chunkvault/observability/metrics.h"

#include <atomic>

namespace chunkvault::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};
std::atomic<std::uint64_t> g_chunks_accepted{0};
std::atomic<std::uint64_t> g_chunks_rejected{0};
std::atomic<std::uint64_t> g_bytes_accepted{0};
std::atomic<std::uint64_t> g_assemblies_completed{0};
std::atomic<std::uint64_t> g_assemblies_failed{0};
std::atomic<std::uint64_t> g_sessions_expired{0};
std::atomic<std::uint64_t> g_sweep_faults{0};

std::string Counter(const char* name, const char* help, const std::atomic<std::uint64_t>& value) {
    return std::string("# HELP ") + name + " " + help + "\n# TYPE " + name + " counter\n" + name +
           " " + std::to_string(value.load(std::memory_order_relaxed)) + "\n";
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

void RecordChunkAccepted(std::uint64_t bytes) {
    g_chunks_accepted.fetch_add(1, std::memory_order_relaxed);
    g_bytes_accepted.fetch_add(bytes, std::memory_order_relaxed);
}

void RecordChunkRejected() { g_chunks_rejected.fetch_add(1, std::memory_order_relaxed); }

void RecordAssembly(bool succeeded) {
    if (succeeded) {
        g_assemblies_completed.fetch_add(1, std::memory_order_relaxed);
    } else {
        g_assemblies_failed.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordSessionsExpired(std::uint64_t count) {
    g_sessions_expired.fetch_add(count, std::memory_order_relaxed);
}

void RecordSweepFault() { g_sweep_faults.fetch_add(1, std::memory_order_relaxed); }

std::string RenderMetrics() {
    return "# HELP chunkvault_up 1 if server is up\n"
           "# TYPE chunkvault_up gauge\n"
           "chunkvault_up 1\n" +
           Counter("chunkvault_http_requests_total", "Total HTTP requests processed",
                   g_total_requests) +
           Counter("chunkvault_http_requests_2xx", "Total 2xx responses", g_requests_2xx) +
           Counter("chunkvault_http_requests_4xx", "Total 4xx responses", g_requests_4xx) +
           Counter("chunkvault_http_requests_5xx", "Total 5xx responses", g_requests_5xx) +
           Counter("chunkvault_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total) +
           Counter("chunkvault_chunks_accepted_total", "Chunks persisted and recorded",
                   g_chunks_accepted) +
           Counter("chunkvault_chunks_rejected_total", "Chunks refused by validation or state",
                   g_chunks_rejected) +
           Counter("chunkvault_chunk_bytes_accepted_total", "Payload bytes of accepted chunks",
                   g_bytes_accepted) +
           Counter("chunkvault_assemblies_completed_total", "Artifacts published",
                   g_assemblies_completed) +
           Counter("chunkvault_assemblies_failed_total", "Assemblies that failed the session",
                   g_assemblies_failed) +
           Counter("chunkvault_sessions_expired_total", "Idle sessions expired by the sweeper",
                   g_sessions_expired) +
           Counter("chunkvault_sweep_faults_total", "Per-session sweeper faults",
                   g_sweep_faults);
}

}  // namespace chunkvault::observability
