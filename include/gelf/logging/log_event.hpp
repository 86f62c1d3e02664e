#pragma once

#include <cstdint>
#include <string>

#include "gelf/logging/log_fields.hpp"
#include "gelf/logging/log_level.hpp"
#include "gelf/record/record.hpp"

namespace gelf::logging
{

  struct LogEvent
  {
    std::uint64_t ts_ms;
    LogLevel level;
    std::string component;
    std::string message;
    std::string detail;
    LogFields fields;
  };

  /**
   * Convert a diagnostic event to a GELF record.
   * @param event Event to convert. component becomes the facility.
   * @param host Originating host.
   * @return Record carrying the event's fields as extensions.
   */
  [[nodiscard]] record::Record to_record(const LogEvent &event, const std::string &host);

} // namespace gelf::logging
