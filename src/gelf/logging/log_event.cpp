#include "gelf/logging/log_event.hpp"

namespace gelf::logging
{

  record::Record to_record(const LogEvent &event, const std::string &host)
  {
    return record::Record{.host = host,
                          .short_message = event.message,
                          .full_message = event.detail,
                          .timestamp = static_cast<double>(event.ts_ms) / 1000.0,
                          .level = to_gelf_level(event.level),
                          .facility = event.component,
                          .extra = event.fields.entries()};
  }

} // namespace gelf::logging
