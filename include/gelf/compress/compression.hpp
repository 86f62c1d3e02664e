#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace gelf::compress
{

  /** Payload compression applied before framing. */
  enum class CompressionType
  {
    Gzip,
    Zlib,
    None
  };

  inline constexpr int COMPRESSION_DEFAULT = -1;
  inline constexpr int COMPRESSION_NONE = 0;
  inline constexpr int COMPRESSION_BEST_SPEED = 1;
  inline constexpr int COMPRESSION_BEST = 9;

  // Leading bytes of each compressed stream, as receivers sniff them.
  inline constexpr std::array<unsigned char, 2> GZIP_MAGIC{0x1f, 0x8b};
  inline constexpr unsigned char ZLIB_MAGIC = 0x78;

  /**
   * Convert CompressionType to its config name.
   * @param type Compression type.
   * @return "gzip", "zlib" or "none".
   */
  [[nodiscard]] std::string_view to_string(CompressionType type);
  /**
   * Parse a compression config name.
   * @param text Input string.
   * @return Parsed CompressionType or std::nullopt.
   */
  [[nodiscard]] std::optional<CompressionType> parse_compression_type(std::string_view text);

} // namespace gelf::compress
