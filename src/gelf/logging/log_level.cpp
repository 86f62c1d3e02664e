#include "gelf/logging/log_level.hpp"

#include <array>
#include <utility>

namespace gelf::logging
{

  namespace
  {

    constexpr std::array<std::pair<std::string_view, LogLevel>, 8> LEVEL_NAMES{{
        {"emergency", LogLevel::Emergency},
        {"alert", LogLevel::Alert},
        {"critical", LogLevel::Critical},
        {"error", LogLevel::Error},
        {"warning", LogLevel::Warning},
        {"notice", LogLevel::Notice},
        {"info", LogLevel::Info},
        {"debug", LogLevel::Debug},
    }};

  } // namespace

  std::string_view to_string(LogLevel level)
  {
    for (const auto &[name, value] : LEVEL_NAMES)
    {
      if (value == level)
      {
        return name;
      }
    }
    return "info";
  }

  std::optional<LogLevel> parse_log_level(std::string_view text)
  {
    for (const auto &[name, value] : LEVEL_NAMES)
    {
      if (text == name)
      {
        return value;
      }
    }
    return std::nullopt;
  }

  bool should_log(LogLevel message_level, LogLevel min_level)
  {
    return static_cast<int>(message_level) <= static_cast<int>(min_level);
  }

} // namespace gelf::logging
