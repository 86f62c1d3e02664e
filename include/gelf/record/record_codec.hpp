#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "gelf/record/record.hpp"
#include "gelf/record/record_errors.hpp"

namespace gelf::record
{

  /**
   * Serialize a record as one flat GELF JSON object.
   * Extension entries are written at the top level next to the fixed fields.
   * @param record Record to encode.
   * @return JSON text or EncodeError.
   */
  [[nodiscard]] std::expected<std::string, EncodeError> encode(const Record &record);
  /**
   * Parse GELF JSON into a record.
   * Underscore-prefixed keys become extension fields, unknown keys are dropped.
   * @param json JSON text.
   * @return Record or DecodeError.
   */
  [[nodiscard]] std::expected<Record, DecodeError> decode(std::string_view json);

} // namespace gelf::record
