#include "gelf/record/text_record.hpp"

namespace gelf::record
{

  namespace
  {

    constexpr std::string_view WHITESPACE = " \t\n\v\f\r";

    double to_unix_seconds(std::chrono::system_clock::time_point now)
    {
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
                    .count();
      return static_cast<double>(ms) / 1000.0;
    }

  } // namespace

  std::string_view trim_text(std::string_view text)
  {
    auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos)
    {
      return {};
    }
    auto last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
  }

  Record make_text_record(std::string_view text,
                          std::string host,
                          std::string facility,
                          std::chrono::system_clock::time_point now)
  {
    auto trimmed = trim_text(text);
    std::string_view short_message = trimmed;
    std::string_view full_message;
    if (auto newline = trimmed.find('\n'); newline != std::string_view::npos)
    {
      short_message = trimmed.substr(0, newline);
      full_message = trimmed;
    }

    return Record{.version = GELF_VERSION,
                  .host = std::move(host),
                  .short_message = std::string(short_message),
                  .full_message = std::string(full_message),
                  .timestamp = to_unix_seconds(now),
                  .level = LEVEL_INFO,
                  .facility = std::move(facility),
                  .file = std::nullopt,
                  .line = std::nullopt,
                  .extra = {}};
  }

} // namespace gelf::record
