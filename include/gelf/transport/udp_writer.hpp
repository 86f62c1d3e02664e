#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include "gelf/compress/compression.hpp"
#include "gelf/compress/compressor_pool.hpp"
#include "gelf/transport/chunking.hpp"
#include "gelf/transport/writer.hpp"

namespace gelf::transport
{

  /** Parsed host:port pair. */
  struct UdpAddress
  {
    std::string host;
    std::string port;
  };

  /**
   * Parse "host:port" or "[v6addr]:port".
   * @param address Address string.
   * @return UdpAddress or WriterError::InvalidAddress.
   */
  [[nodiscard]] std::expected<UdpAddress, WriterError> parse_udp_address(std::string_view address);

  /**
   * Sends compressed, optionally chunked GELF datagrams over a connected UDP socket.
   * Safe for concurrent use: each send runs start to finish under one lock.
   */
  class UdpWriter final : public Writer
  {
  public:
    /**
     * Resolve and connect the socket once.
     * @param options Writer options; address must be host:port.
     * @return UdpWriter or WriterError.
     */
    [[nodiscard]] static std::expected<std::unique_ptr<UdpWriter>, WriterError> create(
        WriterOptions options);

    UdpWriter(const UdpWriter &) = delete;
    UdpWriter &operator=(const UdpWriter &) = delete;
    UdpWriter(UdpWriter &&) = delete;
    UdpWriter &operator=(UdpWriter &&) = delete;

    /**
     * Encode, compress, frame and write one record.
     * A failure part way through a chunked message leaves earlier chunks sent.
     * @param record Record to send.
     * @return void or SendError.
     */
    [[nodiscard]] std::expected<void, SendError> send(const record::Record &record) override;

    /**
     * Send unstructured text as an info record from this writer's host and facility.
     * @param text Text to send.
     * @return Number of bytes of trimmed text sent, or SendError.
     */
    [[nodiscard]] std::expected<std::size_t, SendError> write(std::string_view text);

    /**
     * Change compression for subsequent sends. The live compressor is rebuilt lazily.
     * @param type Compression type.
     * @param level Compression level.
     */
    void set_compression(compress::CompressionType type, int level);

    [[nodiscard]] compress::CompressionType compression_type() const;
    [[nodiscard]] int compression_level() const;
    /** Number of compressors built so far. */
    [[nodiscard]] std::uint64_t compressor_generation() const;

    [[nodiscard]] const std::string &host() const { return host_; }
    [[nodiscard]] const std::string &facility() const { return facility_; }

  private:
    explicit UdpWriter(WriterOptions options);

    std::expected<void, WriterError> connect(const UdpAddress &address);
    std::expected<void, SendError> write_datagram(std::string_view datagram);

    mutable std::mutex mutex_;
    boost::asio::io_context ioc_;
    boost::asio::ip::udp::socket socket_;
    std::string host_;
    std::string facility_;
    compress::CompressionType compression_type_;
    int compression_level_;
    compress::CompressorPool compressors_;
    Framer framer_;
  };

} // namespace gelf::transport
