#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include <zlib.h>

#include "gelf/compress/compression.hpp"

namespace gelf::compress
{

  /** Errors returned by compressors. */
  enum class CompressError
  {
    InvalidLevel,
    InitFailed,
    StreamFailed,
    NotReset
  };

  [[nodiscard]] const char *to_string(CompressError error);

  /**
   * Streaming compressor that can be reused across messages.
   * Call reset() with a fresh output buffer, write() the input, then finish().
   */
  class Compressor
  {
  public:
    virtual ~Compressor() = default;

    /**
     * Start a new stream that appends into out.
     * @param out Output buffer, cleared first. Must outlive finish().
     * @return void or CompressError.
     */
    virtual std::expected<void, CompressError> reset(std::string &out) = 0;
    /**
     * Feed input into the current stream.
     * @param input Bytes to compress.
     * @return void or CompressError.
     */
    virtual std::expected<void, CompressError> write(std::string_view input) = 0;
    /**
     * Flush buffered bytes and the stream trailer into the output buffer.
     * @return void or CompressError.
     */
    virtual std::expected<void, CompressError> finish() = 0;

    [[nodiscard]] virtual CompressionType type() const = 0;
    [[nodiscard]] virtual int level() const = 0;
  };

  /** Deflate compressor producing gzip or zlib framed streams. */
  class DeflateCompressor final : public Compressor
  {
  public:
    /**
     * Create a deflate stream for gzip or zlib framing.
     * @param type CompressionType::Gzip or CompressionType::Zlib.
     * @param level zlib level, -1 to 9.
     * @return Compressor or CompressError.
     * @throws std::invalid_argument if type is not a deflate format.
     */
    [[nodiscard]] static std::expected<std::unique_ptr<DeflateCompressor>, CompressError>
    create(CompressionType type, int level);

    ~DeflateCompressor() override;

    DeflateCompressor(const DeflateCompressor &) = delete;
    DeflateCompressor &operator=(const DeflateCompressor &) = delete;
    DeflateCompressor(DeflateCompressor &&) = delete;
    DeflateCompressor &operator=(DeflateCompressor &&) = delete;

    std::expected<void, CompressError> reset(std::string &out) override;
    std::expected<void, CompressError> write(std::string_view input) override;
    std::expected<void, CompressError> finish() override;

    [[nodiscard]] CompressionType type() const override { return type_; }
    [[nodiscard]] int level() const override { return level_; }

  private:
    DeflateCompressor(CompressionType type, int level);

    std::expected<void, CompressError> pump(int flush);

    CompressionType type_;
    int level_;
    z_stream stream_{};
    bool initialized_ = false;
    std::string *out_ = nullptr;
  };

  /** Compressor that copies input unchanged. */
  class PassThroughCompressor final : public Compressor
  {
  public:
    explicit PassThroughCompressor(int level) : level_(level) {}

    std::expected<void, CompressError> reset(std::string &out) override;
    std::expected<void, CompressError> write(std::string_view input) override;
    std::expected<void, CompressError> finish() override;

    [[nodiscard]] CompressionType type() const override { return CompressionType::None; }
    [[nodiscard]] int level() const override { return level_; }

  private:
    int level_;
    std::string *out_ = nullptr;
  };

  /**
   * Run one complete stream through a compressor.
   * @param compressor Compressor to reuse.
   * @param input Bytes to compress.
   * @return Compressed bytes or CompressError.
   */
  [[nodiscard]] std::expected<std::string, CompressError> compress(Compressor &compressor,
                                                                  std::string_view input);

} // namespace gelf::compress
