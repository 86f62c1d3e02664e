#pragma once

namespace gelf::record
{

  inline constexpr const char *FIELD_VERSION = "version";
  inline constexpr const char *FIELD_HOST = "host";
  inline constexpr const char *FIELD_SHORT_MESSAGE = "short_message";
  inline constexpr const char *FIELD_FULL_MESSAGE = "full_message";
  inline constexpr const char *FIELD_TIMESTAMP = "timestamp";
  inline constexpr const char *FIELD_LEVEL = "level";
  inline constexpr const char *FIELD_FACILITY = "facility";
  inline constexpr const char *FIELD_FILE = "file";
  inline constexpr const char *FIELD_LINE = "line";

  inline constexpr char EXTRA_PREFIX = '_';

} // namespace gelf::record
