#pragma once

#include <map>
#include <string>

namespace chunkvault::core {

/// Extra string fields attached to a structured log line. Empty values are omitted.
using JsonFields = std::map<std::string, std::string>;

void InitLogging(const std::string& level);
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
/// @brief Log a structured JSON line for a session lifecycle event.
void LogTransferEvent(const std::string& event,
                      const std::string& owner,
                      const std::string& filename,
                      const std::string& detail);
void LogTransferEvent(const std::string& event,
                      const std::string& owner,
                      const std::string& filename,
                      const JsonFields& fields);

}  // namespace chunkvault::core
