#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace gelf::record
{

  /** GELF protocol version written by this client. */
  inline constexpr const char *GELF_VERSION = "1.1";

  /** Syslog severity used when none is given. */
  inline constexpr std::int32_t LEVEL_INFO = 6;

  /** Nested array or object value kept as minified JSON text. */
  struct RawJson
  {
    std::string text;

    bool operator==(const RawJson &) const = default;
  };

  // Integers up to INT64_MAX decode as std::int64_t, larger ones as std::uint64_t.
  using ExtraValue = std::variant<std::nullptr_t, bool, std::int64_t, std::uint64_t, double,
                                  std::string, RawJson>;

  // Extension fields keyed by their wire name (underscore-prefixed by convention).
  using Extra = std::map<std::string, ExtraValue>;

  /** One structured log event. */
  struct Record
  {
    std::string version = GELF_VERSION;
    std::string host;
    std::string short_message;
    std::string full_message;
    double timestamp = 0.0;
    std::int32_t level = LEVEL_INFO;
    std::string facility;
    std::optional<std::string> file;
    std::optional<std::int64_t> line;
    Extra extra;

    bool operator==(const Record &) const = default;
  };

} // namespace gelf::record
