#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "gelf/record/record.hpp"

namespace gelf::record
{

  /**
   * Strip leading and trailing ASCII whitespace.
   * @param text Input text.
   * @return View into text without surrounding whitespace.
   */
  [[nodiscard]] std::string_view trim_text(std::string_view text);

  /**
   * Build an info-level record from unstructured text.
   * Multi-line text uses the first line as short_message and the whole
   * trimmed text as full_message.
   * @param text Raw text, usually one write to a log stream.
   * @param host Originating host.
   * @param facility Facility name.
   * @param now Event time, truncated to milliseconds.
   * @return Record with no extension fields.
   */
  [[nodiscard]] Record make_text_record(std::string_view text,
                                        std::string host,
                                        std::string facility,
                                        std::chrono::system_clock::time_point now);

} // namespace gelf::record
