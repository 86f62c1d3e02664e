#pragma once

namespace gelf::record
{

  /** Errors returned while encoding a record. */
  enum class EncodeError
  {
    ReservedKey,
    NonFiniteNumber,
    InvalidRawJson
  };

  /** Errors returned while decoding a record. */
  enum class DecodeError
  {
    EmptyMessage,
    InvalidJson,
    NotAnObject,
    InvalidField
  };

  [[nodiscard]] const char *to_string(EncodeError error);
  [[nodiscard]] const char *to_string(DecodeError error);

} // namespace gelf::record
