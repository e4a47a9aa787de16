#pragma once

#include <cstdint>
#include <string>

namespace chunkvault::core {

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Milliseconds since the Unix epoch; the unit of session timestamps.
std::int64_t NowEpochMillis();
/// @brief Formats epoch milliseconds as ISO8601 UTC.
std::string FormatIso8601(std::int64_t epoch_millis);

}  // namespace chunkvault::core
