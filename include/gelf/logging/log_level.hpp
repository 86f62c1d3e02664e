#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace gelf::logging
{

  /** Syslog severities, most severe first. The value is the GELF level. */
  enum class LogLevel : std::int32_t
  {
    Emergency = 0,
    Alert = 1,
    Critical = 2,
    Error = 3,
    Warning = 4,
    Notice = 5,
    Info = 6,
    Debug = 7
  };

  // Syslog keyword: "emergency" .. "debug".
  [[nodiscard]] std::string_view to_string(LogLevel level);
  /**
   * Parse a syslog keyword as written in config files.
   * @param text "emergency", "alert", "critical", "error", "warning", "notice", "info" or "debug".
   * @return LogLevel or std::nullopt for anything else, including other casing.
   */
  [[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);
  /**
   * Severity filter shared by every Logger.
   * @param message_level Severity of the event.
   * @param min_level Least severe level still emitted.
   * @return True if message_level is at least as severe as min_level.
   */
  [[nodiscard]] bool should_log(LogLevel message_level, LogLevel min_level);
  /**
   * GELF level field for a LogLevel.
   * @param level Log level.
   * @return Syslog severity number 0-7.
   */
  [[nodiscard]] constexpr std::int32_t to_gelf_level(LogLevel level)
  {
    return static_cast<std::int32_t>(level);
  }

} // namespace gelf::logging
