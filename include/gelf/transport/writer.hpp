#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "gelf/compress/compression.hpp"
#include "gelf/record/record.hpp"
#include "gelf/transport/chunking.hpp"

namespace gelf::transport
{

  /** Per-call delivery errors. */
  enum class SendError
  {
    EncodeFailed,
    CompressFailed,
    TooManyChunks,
    RandomFailed,
    WriteFailed,
    ShortWrite,
    ResolveFailed,
    ConnectFailed,
    TlsHandshakeFailed,
    ReadFailed,
    Timeout,
    UnexpectedStatus
  };

  /** Errors returned while constructing a writer. */
  enum class WriterError
  {
    InvalidAddress,
    ResolveFailed,
    ConnectFailed,
    HostnameFailed,
    InvalidChunkSize,
    TlsInitFailed
  };

  [[nodiscard]] const char *to_string(SendError error);
  [[nodiscard]] const char *to_string(WriterError error);

  /** Construction-time writer settings. */
  struct WriterOptions
  {
    // "host:port" for UDP, or an http:// / https:// URL for the HTTP transport.
    std::string address;
    compress::CompressionType compression_type = compress::CompressionType::Gzip;
    int compression_level = compress::COMPRESSION_BEST_SPEED;
    // Empty means the running program's name.
    std::string facility;
    // Empty means the local hostname.
    std::string host;
    std::size_t chunk_size = CHUNK_SIZE;
    std::chrono::milliseconds http_timeout{10000};
  };

  /** Delivers records to a GELF server. */
  class Writer
  {
  public:
    virtual ~Writer() = default;

    /**
     * Deliver one record. No retry is attempted.
     * @param record Record to send.
     * @return void or SendError.
     */
    [[nodiscard]] virtual std::expected<void, SendError> send(const record::Record &record) = 0;
  };

  /**
   * Fill empty host and facility with the local hostname and program name.
   * @param options Options to complete.
   * @return Completed options or WriterError::HostnameFailed.
   */
  [[nodiscard]] std::expected<WriterOptions, WriterError> with_defaults(WriterOptions options);

  /**
   * True if the address selects the HTTP transport.
   * @param address Configured address.
   * @return True for http:// and https:// URLs.
   */
  [[nodiscard]] bool is_http_address(std::string_view address);

  /**
   * Create the writer matching the address form.
   * @param options Writer options.
   * @return HttpWriter for URLs, UdpWriter otherwise, or WriterError.
   */
  [[nodiscard]] std::expected<std::unique_ptr<Writer>, WriterError> make_writer(
      WriterOptions options);

} // namespace gelf::transport
