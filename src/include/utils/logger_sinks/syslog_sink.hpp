#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <string>

namespace irbridge::utils
{

class SyslogSink : public Sink
{
  public:
    SyslogSink(const char *ident, int option, int facility);
    ~SyslogSink() override;
    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    static int level_to_syslog_priority(int level);

    // openlog keeps the pointer, so the ident string must outlive the sink.
    std::string ident_;
};

} // namespace irbridge::utils
