#pragma once

#include <string>
#include <utility>

#include "gelf/logging/log_event.hpp"
#include "gelf/logging/log_level.hpp"

namespace gelf::logging
{

  // Destination for diagnostic events. Implementations filter by level().
  class Logger
  {
  public:
    virtual ~Logger() = default;

    virtual void log(LogEvent event) = 0;
    [[nodiscard]] virtual LogLevel level() const = 0;

    void log(LogLevel level, std::string component, std::string message)
    {
      log(make_event(level, std::move(component), std::move(message), {}, {}));
    }

    void log(LogLevel level, std::string component, std::string message, LogFields fields)
    {
      log(make_event(level, std::move(component), std::move(message), std::move(fields), {}));
    }

    // detail becomes the record's full_message.
    void log_detail(LogLevel level,
                    std::string component,
                    std::string message,
                    LogFields fields,
                    std::string detail)
    {
      log(make_event(level, std::move(component), std::move(message), std::move(fields),
                     std::move(detail)));
    }

  private:
    static LogEvent make_event(LogLevel level,
                               std::string component,
                               std::string message,
                               LogFields fields,
                               std::string detail)
    {
      return LogEvent{.ts_ms = 0,
                      .level = level,
                      .component = std::move(component),
                      .message = std::move(message),
                      .detail = std::move(detail),
                      .fields = std::move(fields)};
    }
  };

} // namespace gelf::logging
