#include "tilestitch/core/time.h"

#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/Timespan.h>
#include <Poco/Timestamp.h>

namespace tilestitch::core {

std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::string NowIso8601WithOffsetSeconds(int delta_seconds) {
    Poco::Timestamp ts;
    ts += Poco::Timespan(delta_seconds, 0);
    return Poco::DateTimeFormatter::format(ts, Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::int64_t NowEpochSeconds() {
    return static_cast<std::int64_t>(Poco::Timestamp().epochTime());
}

std::int64_t NowEpochMillis() {
    return static_cast<std::int64_t>(Poco::Timestamp().epochMicroseconds() / 1000);
}

}  // namespace tilestitch::core
