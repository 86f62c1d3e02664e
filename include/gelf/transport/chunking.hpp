#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gelf::transport
{

  /** Default datagram budget, below a typical path MTU minus UDP/IP headers. */
  inline constexpr std::size_t CHUNK_SIZE = 1420;
  /** Magic (2) + message id (8) + sequence index (1) + total count (1). */
  inline constexpr std::size_t CHUNK_HEADER_SIZE = 12;
  /** The total count is a single byte on the wire. */
  inline constexpr std::size_t MAX_CHUNKS = 255;
  /** Largest UDP payload over IPv4. */
  inline constexpr std::size_t MAX_DATAGRAM_SIZE = 65507;

  inline constexpr std::array<std::uint8_t, 2> CHUNK_MAGIC{0x1e, 0x0f};

  using MessageId = std::array<std::uint8_t, 8>;

  /** Errors returned while framing a payload. */
  enum class FrameError
  {
    ChunkSizeTooSmall,
    TooManyChunks,
    RandomFailed
  };

  [[nodiscard]] const char *to_string(FrameError error);

  /**
   * Number of datagrams needed for a payload.
   * @param payload_size Compressed payload length.
   * @param chunk_size Datagram budget, must exceed CHUNK_HEADER_SIZE.
   * @return 1 if the payload fits one datagram, else ceil(size / (chunk_size - 12)).
   */
  [[nodiscard]] std::size_t num_chunks(std::size_t payload_size,
                                       std::size_t chunk_size = CHUNK_SIZE);

  /**
   * Draw a message id from OpenSSL's CSPRNG.
   * @return MessageId or FrameError::RandomFailed.
   */
  [[nodiscard]] std::expected<MessageId, FrameError> random_message_id();

  /** Splits compressed payloads into GELF chunked datagrams. */
  class Framer
  {
  public:
    using IdSource = std::function<std::expected<MessageId, FrameError>()>;

    explicit Framer(std::size_t chunk_size = CHUNK_SIZE, IdSource ids = random_message_id)
        : chunk_size_(chunk_size), ids_(std::move(ids)) {}

    /**
     * Produce the datagrams for one message.
     * A payload that fits chunk_size is returned as the single, unframed datagram.
     * @param payload Compressed message bytes.
     * @return Datagrams in send order or FrameError.
     */
    [[nodiscard]] std::expected<std::vector<std::string>, FrameError>
    frame(std::string_view payload) const;

    [[nodiscard]] std::size_t chunk_size() const { return chunk_size_; }

  private:
    std::size_t chunk_size_;
    IdSource ids_;
  };

} // namespace gelf::transport
