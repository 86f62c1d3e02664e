#pragma once

#include <cstdint>
#include <expected>
#include <memory>

#include "gelf/compress/compression.hpp"
#include "gelf/compress/compressor.hpp"

namespace gelf::compress
{

  /**
   * Owns at most one live compressor and rebuilds it when the requested
   * (type, level) no longer matches. Not thread-safe; the owner serializes access.
   */
  class CompressorPool
  {
  public:
    /**
     * Return the live compressor for type and level, rebuilding it on mismatch.
     * @param type Compression type.
     * @param level Compression level.
     * @return Compressor owned by the pool, or CompressError.
     * @throws std::invalid_argument if type is not a known CompressionType.
     */
    [[nodiscard]] std::expected<Compressor *, CompressError> obtain(CompressionType type,
                                                                    int level);

    /** Drop the live compressor. */
    void clear() { current_.reset(); }

    /** Number of compressors constructed so far. */
    [[nodiscard]] std::uint64_t generation() const { return generation_; }

  private:
    std::unique_ptr<Compressor> current_;
    std::uint64_t generation_ = 0;
  };

} // namespace gelf::compress
