#include "tilestitch/core/logger.h"

#include <sstream>

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/FileChannel.h>
#include <Poco/FormattingChannel.h>
#include <Poco/JSON/Object.h>
#include <Poco/Logger.h>
#include <Poco/PatternFormatter.h>
#include <Poco/SplitterChannel.h>

namespace tilestitch::core {

namespace {
constexpr const char* kPattern = "%Y-%m-%dT%H:%M:%S.%iZ [%p] %s: %t";

Poco::Logger& RootLogger() {
    return Poco::Logger::get("tilestitch");
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

Poco::AutoPtr<Poco::Channel> Formatted(const Poco::AutoPtr<Poco::Channel>& sink) {
    Poco::AutoPtr<Poco::PatternFormatter> formatter(new Poco::PatternFormatter(kPattern));
    formatter->setProperty("times", "UTC");
    Poco::AutoPtr<Poco::Channel> channel(new Poco::FormattingChannel(formatter, sink));
    return channel;
}

std::string Condensed(const Poco::JSON::Object& line) {
    std::ostringstream out;
    line.stringify(out);
    return out.str();
}
}  // namespace

void InitLogging(const std::string& level, const std::string& log_file) {
    Poco::AutoPtr<Poco::SplitterChannel> splitter(new Poco::SplitterChannel());
    Poco::AutoPtr<Poco::ConsoleChannel> console(new Poco::ConsoleChannel());
    splitter->addChannel(Formatted(Poco::AutoPtr<Poco::Channel>(console)));

    if (!log_file.empty()) {
        Poco::AutoPtr<Poco::FileChannel> file(new Poco::FileChannel(log_file));
        file->setProperty("rotation", "10 M");
        file->setProperty("archive", "timestamp");
        file->setProperty("purgeCount", "5");
        splitter->addChannel(Formatted(Poco::AutoPtr<Poco::Channel>(file)));
    }

    RootLogger().setChannel(splitter);
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
    Poco::JSON::Object line(Poco::JSON_PRESERVE_KEY_ORDER);
    line.set("event", "http_request");
    line.set("request_id", request_id);
    line.set("method", method);
    line.set("target", target);
    line.set("remote", remote);
    line.set("status", status);
    line.set("latency_ms", static_cast<Poco::Int64>(latency_ms));
    LogInfo(Condensed(line));
}

void LogEvent(const std::string& event, const LogFields& fields) {
    Poco::JSON::Object line(Poco::JSON_PRESERVE_KEY_ORDER);
    line.set("event", event);
    for (const auto& field : fields) {
        line.set(field.first, field.second);
    }
    // Failures go out at warning so they survive a quieter log level.
    const bool failure = event.find("fail") != std::string::npos;
    if (failure) {
        LogWarning(Condensed(line));
    } else {
        LogInfo(Condensed(line));
    }
}

}  // namespace tilestitch::core
