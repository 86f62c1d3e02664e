#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "gelf/logging/log_event.hpp"
#include "gelf/logging/logger.hpp"
#include "gelf/transport/writer.hpp"

namespace gelf::logging
{

  /**
   * Logger that sends each event to a GELF server through a Writer.
   * Sends happen on the calling thread. Failures are counted, not reported.
   */
  class GelfLogger : public Logger
  {
  public:
    /**
     * @param writer Destination; must outlive the logger.
     * @param host Host field for every record.
     * @param facility Facility used when an event has no component.
     * @param level Least severe level still sent.
     */
    GelfLogger(transport::Writer &writer,
               std::string host,
               std::string facility,
               LogLevel level = LogLevel::Info);

    using Logger::log;

    void log(LogEvent event) override;
    [[nodiscard]] LogLevel level() const override { return level_; }

    void emergency(std::string message) { send_simple(LogLevel::Emergency, std::move(message)); }
    void alert(std::string message) { send_simple(LogLevel::Alert, std::move(message)); }
    void critical(std::string message) { send_simple(LogLevel::Critical, std::move(message)); }
    void error(std::string message) { send_simple(LogLevel::Error, std::move(message)); }
    void warning(std::string message) { send_simple(LogLevel::Warning, std::move(message)); }
    void notice(std::string message) { send_simple(LogLevel::Notice, std::move(message)); }
    void info(std::string message) { send_simple(LogLevel::Info, std::move(message)); }
    void debug(std::string message) { send_simple(LogLevel::Debug, std::move(message)); }

    /**
     * Number of events the writer failed to deliver.
     * @return Failure count since construction.
     */
    [[nodiscard]] std::uint64_t failures() const { return failures_.load(); }

  private:
    void send_simple(LogLevel level, std::string message);

    transport::Writer &writer_;
    std::string host_;
    std::string facility_;
    LogLevel level_;
    std::atomic<std::uint64_t> failures_{0};
  };

} // namespace gelf::logging
