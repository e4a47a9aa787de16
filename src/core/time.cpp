#include "chunkvault/core/time.h"

#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/Timestamp.h>

namespace chunkvault::core {

std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::int64_t NowEpochMillis() {
    return static_cast<std::int64_t>(Poco::Timestamp().epochMicroseconds() / 1000);
}

std::string FormatIso8601(std::int64_t epoch_millis) {
    const Poco::Timestamp ts(static_cast<Poco::Timestamp::TimeVal>(epoch_millis) * 1000);
    return Poco::DateTimeFormatter::format(ts, Poco::DateTimeFormat::ISO8601_FRAC_FORMAT);
}

}  // namespace chunkvault::core
