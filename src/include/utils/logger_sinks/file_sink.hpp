#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>
#include <string>

namespace irbridge::utils
{

// Appends formatted lines to a file. The file is opened in the constructor;
// failure to open throws std::runtime_error.
class FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::string path_;
    std::FILE *file_{nullptr};
};

} // namespace irbridge::utils
