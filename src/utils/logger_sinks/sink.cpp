#include "utils/logger_sinks/sink.hpp"
#include "utils/format_tools.hpp"

#include <string_view>

namespace irbridge::utils
{

// A switch on int avoids a dependency on logger.hpp for Logger::Level.
const char *Sink::level_to_string_internal(int lvl)
{
    constexpr int kTraceLevel = 0;
    constexpr int kDebugLevel = 1;
    constexpr int kInfoLevel = 2;
    constexpr int kWarnLevel = 3;
    constexpr int kErrorLevel = 4;
    constexpr int kSystemLevel = 5;
    switch (lvl)
    {
    case kTraceLevel:
        return "TRACE";
    case kDebugLevel:
        return "DEBUG";
    case kInfoLevel:
        return "INFO";
    case kWarnLevel:
        return "WARN";
    case kErrorLevel:
        return "ERROR";
    case kSystemLevel:
        return "SYSTEM";
    default:
        return "UNK";
    }
}

std::string Sink::format_logmsg(const LogMessage &msg)
{
    return fmt::format("[LOGGER] [{:<6}] [{}] [TID:{:5}] {}\n", level_to_string_internal(msg.level),
                       format_tools::formatted_time(msg.timestamp), msg.thread_id,
                       std::string_view(msg.body.data(), msg.body.size()));
}

} // namespace irbridge::utils
