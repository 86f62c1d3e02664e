#include "gelf/logging/gelf_logger.hpp"

#include <chrono>
#include <utility>

namespace gelf::logging
{

  GelfLogger::GelfLogger(transport::Writer &writer,
                         std::string host,
                         std::string facility,
                         LogLevel level)
      : writer_(writer), host_(std::move(host)), facility_(std::move(facility)), level_(level)
  {
  }

  void GelfLogger::log(LogEvent event)
  {
    if (!should_log(event.level, level_))
    {
      return;
    }
    if (event.ts_ms == 0)
    {
      event.ts_ms = static_cast<std::uint64_t>(
          std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::system_clock::now().time_since_epoch())
              .count());
    }
    if (event.component.empty())
    {
      event.component = facility_;
    }

    auto sent = writer_.send(to_record(event, host_));
    if (!sent)
    {
      failures_.fetch_add(1);
    }
  }

  void GelfLogger::send_simple(LogLevel level, std::string message)
  {
    log(level, facility_, std::move(message));
  }

} // namespace gelf::logging
