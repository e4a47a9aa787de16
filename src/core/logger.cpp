#include "chunkvault/core/logger.h"

#include <sstream>

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/FormattingChannel.h>
#include <Poco/JSON/Object.h>
#include <Poco/Logger.h>
#include <Poco/PatternFormatter.h>

namespace chunkvault::core {

namespace {
Poco::Logger& RootLogger() {
    return Poco::Logger::get("chunkvault");
}

int ToPocoLevel(const std::string& level) {
    if (level == "trace") {
        return Poco::Message::PRIO_TRACE;
    }
    if (level == "debug") {
        return Poco::Message::PRIO_DEBUG;
    }
    if (level == "warning") {
        return Poco::Message::PRIO_WARNING;
    }
    if (level == "error") {
        return Poco::Message::PRIO_ERROR;
    }
    return Poco::Message::PRIO_INFORMATION;
}

// One JSON object per line; Poco handles escaping of client-supplied strings.
void EmitLine(const Poco::JSON::Object& line, int priority) {
    if (!RootLogger().is(priority)) {
        return;
    }
    std::ostringstream out;
    line.stringify(out);
    RootLogger().log(Poco::Message("chunkvault", out.str(),
                                   static_cast<Poco::Message::Priority>(priority)));
}
}  // namespace

void InitLogging(const std::string& level) {
    Poco::AutoPtr<Poco::ConsoleChannel> console(new Poco::ConsoleChannel());
    Poco::AutoPtr<Poco::PatternFormatter> formatter(
        new Poco::PatternFormatter("%Y-%m-%dT%H:%M:%S.%iZ [%p] %t"));
    Poco::AutoPtr<Poco::FormattingChannel> channel(new Poco::FormattingChannel(formatter, console));
    RootLogger().setChannel(channel);
    RootLogger().setLevel(ToPocoLevel(level));
}

void LogInfo(const std::string& message) { RootLogger().information(message); }
void LogWarning(const std::string& message) { RootLogger().warning(message); }
void LogError(const std::string& message) { RootLogger().error(message); }
void LogDebug(const std::string& message) { RootLogger().debug(message); }

void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms) {
    Poco::JSON::Object line;
    line.set("event", "http_request");
    line.set("request_id", request_id);
    line.set("method", method);
    line.set("target", target);
    line.set("remote", remote);
    line.set("status", status);
    line.set("latency_ms", static_cast<Poco::Int64>(latency_ms));
    // Server-side failures are surfaced at warning so they survive a quieter log level.
    EmitLine(line, status >= 500 ? Poco::Message::PRIO_WARNING
                                 : Poco::Message::PRIO_INFORMATION);
}

void LogTransferEvent(const std::string& event,
                      const std::string& owner,
                      const std::string& filename,
                      const std::string& detail) {
    LogTransferEvent(event, owner, filename, JsonFields{{"detail", detail}});
}

void LogTransferEvent(const std::string& event,
                      const std::string& owner,
                      const std::string& filename,
                      const JsonFields& fields) {
    Poco::JSON::Object line;
    line.set("event", event);
    line.set("owner", owner);
    line.set("filename", filename);
    for (const auto& field : fields) {
        if (!field.second.empty()) {
            line.set(field.first, field.second);
        }
    }
    EmitLine(line, Poco::Message::PRIO_INFORMATION);
}

}  // namespace chunkvault::core
