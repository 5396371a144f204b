#include "utils/logger_sinks/syslog_sink.hpp"

#include <string_view>
#include <syslog.h>

namespace irbridge::utils
{

SyslogSink::SyslogSink(const char *ident, int option, int facility)
    : ident_(ident != nullptr ? ident : "irbridge")
{
    openlog(ident_.c_str(), option, facility != 0 ? facility : LOG_USER);
}

SyslogSink::~SyslogSink()
{
    closelog();
}

void SyslogSink::write(const LogMessage &msg)
{
    const std::string_view body(msg.body.data(), msg.body.size());
    syslog(level_to_syslog_priority(msg.level), "%.*s", static_cast<int>(body.size()),
           body.data());
}

void SyslogSink::flush() {}

std::string SyslogSink::description() const
{
    return "Syslog: " + ident_;
}

int SyslogSink::level_to_syslog_priority(int level)
{
    switch (level)
    {
    case 0: // TRACE
    case 1: // DEBUG
        return LOG_DEBUG;
    case 2:
        return LOG_INFO;
    case 3:
        return LOG_WARNING;
    case 4:
        return LOG_ERR;
    case 5:
        return LOG_NOTICE;
    default:
        return LOG_INFO;
    }
}

} // namespace irbridge::utils
