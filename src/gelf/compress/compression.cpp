#include "gelf/compress/compression.hpp"

namespace gelf::compress
{

  std::string_view to_string(CompressionType type)
  {
    switch (type)
    {
    case CompressionType::Gzip:
      return "gzip";
    case CompressionType::Zlib:
      return "zlib";
    case CompressionType::None:
      return "none";
    }
    return "unknown";
  }

  std::optional<CompressionType> parse_compression_type(std::string_view text)
  {
    if (text == "gzip")
    {
      return CompressionType::Gzip;
    }
    if (text == "zlib")
    {
      return CompressionType::Zlib;
    }
    if (text == "none")
    {
      return CompressionType::None;
    }
    return std::nullopt;
  }

} // namespace gelf::compress
