#pragma once

#include <cstdint>
#include <string>

namespace chunkvault::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);
void RecordChunkAccepted(std::uint64_t bytes);
void RecordChunkRejected();
void RecordAssembly(bool succeeded);
void RecordSessionsExpired(std::uint64_t count);
void RecordSweepFault();

}  // namespace chunkvault::observability
