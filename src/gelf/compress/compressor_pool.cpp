#include "gelf/compress/compressor_pool.hpp"

#include <stdexcept>
#include <string>

namespace gelf::compress
{

  std::expected<Compressor *, CompressError> CompressorPool::obtain(CompressionType type,
                                                                   int level)
  {
    if (current_ && current_->type() == type && current_->level() == level)
    {
      return current_.get();
    }
    current_.reset();

    switch (type)
    {
    case CompressionType::Gzip:
    case CompressionType::Zlib:
    {
      auto created = DeflateCompressor::create(type, level);
      if (!created)
      {
        return std::unexpected(created.error());
      }
      current_ = std::move(*created);
      break;
    }
    case CompressionType::None:
      current_ = std::make_unique<PassThroughCompressor>(level);
      break;
    default:
      throw std::invalid_argument("unknown compression type " +
                                  std::to_string(static_cast<int>(type)));
    }

    ++generation_;
    return current_.get();
  }

} // namespace gelf::compress
