#include "gelf/compress/compressor.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>

namespace gelf::compress {

namespace {

constexpr int WINDOW_BITS = 15;
constexpr int GZIP_WINDOW_BITS = WINDOW_BITS + 16;
constexpr int MEM_LEVEL = 8;
constexpr std::size_t OUTPUT_BLOCK = 16 * 1024;

} // namespace

const char *to_string(CompressError error) {
  switch (error) {
  case CompressError::InvalidLevel:
    return "invalid compression level";
  case CompressError::InitFailed:
    return "compressor init failed";
  case CompressError::StreamFailed:
    return "compression stream failed";
  case CompressError::NotReset:
    return "compressor used without reset";
  }
  return "unknown compress error";
}

DeflateCompressor::DeflateCompressor(CompressionType type, int level)
    : type_(type), level_(level) {}

DeflateCompressor::~DeflateCompressor() {
  if (initialized_) {
    deflateEnd(&stream_);
  }
}

std::expected<std::unique_ptr<DeflateCompressor>, CompressError>
DeflateCompressor::create(CompressionType type, int level) {
  int window_bits = 0;
  switch (type) {
  case CompressionType::Gzip:
    window_bits = GZIP_WINDOW_BITS;
    break;
  case CompressionType::Zlib:
    window_bits = WINDOW_BITS;
    break;
  default:
    throw std::invalid_argument("deflate compressor needs gzip or zlib type");
  }

  std::unique_ptr<DeflateCompressor> compressor(new DeflateCompressor(type, level));
  int rc = deflateInit2(&compressor->stream_, level, Z_DEFLATED, window_bits, MEM_LEVEL,
                        Z_DEFAULT_STRATEGY);
  if (rc == Z_STREAM_ERROR) {
    return std::unexpected(CompressError::InvalidLevel);
  }
  if (rc != Z_OK) {
    return std::unexpected(CompressError::InitFailed);
  }
  compressor->initialized_ = true;
  return compressor;
}

std::expected<void, CompressError> DeflateCompressor::reset(std::string &out) {
  if (deflateReset(&stream_) != Z_OK) {
    out_ = nullptr;
    return std::unexpected(CompressError::StreamFailed);
  }
  out.clear();
  out_ = &out;
  return {};
}

std::expected<void, CompressError> DeflateCompressor::write(std::string_view input) {
  if (!out_) {
    return std::unexpected(CompressError::NotReset);
  }

  // avail_in is 32-bit, so feed large inputs in slices.
  constexpr std::size_t max_slice = std::numeric_limits<uInt>::max();
  while (!input.empty()) {
    auto slice = input.substr(0, std::min(input.size(), max_slice));
    stream_.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(slice.data()));
    stream_.avail_in = static_cast<uInt>(slice.size());
    if (auto pumped = pump(Z_NO_FLUSH); !pumped) {
      return pumped;
    }
    input.remove_prefix(slice.size());
  }
  return {};
}

std::expected<void, CompressError> DeflateCompressor::finish() {
  if (!out_) {
    return std::unexpected(CompressError::NotReset);
  }
  stream_.next_in = nullptr;
  stream_.avail_in = 0;
  auto pumped = pump(Z_FINISH);
  out_ = nullptr;
  return pumped;
}

std::expected<void, CompressError> DeflateCompressor::pump(int flush) {
  std::array<unsigned char, OUTPUT_BLOCK> block;
  int rc = Z_OK;
  do {
    stream_.next_out = block.data();
    stream_.avail_out = static_cast<uInt>(block.size());
    rc = deflate(&stream_, flush);
    if (rc == Z_STREAM_ERROR) {
      return std::unexpected(CompressError::StreamFailed);
    }
    out_->append(reinterpret_cast<const char *>(block.data()),
                 block.size() - stream_.avail_out);
  } while (stream_.avail_out == 0 || (flush == Z_FINISH && rc != Z_STREAM_END));
  return {};
}

std::expected<void, CompressError> PassThroughCompressor::reset(std::string &out) {
  out.clear();
  out_ = &out;
  return {};
}

std::expected<void, CompressError> PassThroughCompressor::write(std::string_view input) {
  if (!out_) {
    return std::unexpected(CompressError::NotReset);
  }
  out_->append(input);
  return {};
}

std::expected<void, CompressError> PassThroughCompressor::finish() {
  if (!out_) {
    return std::unexpected(CompressError::NotReset);
  }
  out_ = nullptr;
  return {};
}

std::expected<std::string, CompressError> compress(Compressor &compressor,
                                                   std::string_view input) {
  std::string out;
  if (auto reset = compressor.reset(out); !reset) {
    return std::unexpected(reset.error());
  }
  if (auto written = compressor.write(input); !written) {
    return std::unexpected(written.error());
  }
  if (auto finished = compressor.finish(); !finished) {
    return std::unexpected(finished.error());
  }
  return out;
}

} // namespace gelf::compress
