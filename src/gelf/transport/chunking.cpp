#include "gelf/transport/chunking.hpp"

#include <algorithm>
#include <limits>

#include <openssl/rand.h>

namespace gelf::transport {

const char *to_string(FrameError error) {
  switch (error) {
  case FrameError::ChunkSizeTooSmall:
    return "chunk size does not exceed the chunk header";
  case FrameError::TooManyChunks:
    return "message too large, needs more than 255 chunks";
  case FrameError::RandomFailed:
    return "could not read a random message id";
  }
  return "unknown frame error";
}

std::size_t num_chunks(std::size_t payload_size, std::size_t chunk_size) {
  if (payload_size <= chunk_size) {
    return 1;
  }
  if (chunk_size <= CHUNK_HEADER_SIZE) {
    return std::numeric_limits<std::size_t>::max();
  }
  const std::size_t data_size = chunk_size - CHUNK_HEADER_SIZE;
  return (payload_size + data_size - 1) / data_size;
}

std::expected<MessageId, FrameError> random_message_id() {
  MessageId id{};
  if (RAND_bytes(id.data(), static_cast<int>(id.size())) != 1) {
    return std::unexpected(FrameError::RandomFailed);
  }
  return id;
}

std::expected<std::vector<std::string>, FrameError>
Framer::frame(std::string_view payload) const {
  if (chunk_size_ <= CHUNK_HEADER_SIZE) {
    return std::unexpected(FrameError::ChunkSizeTooSmall);
  }

  const std::size_t total = num_chunks(payload.size(), chunk_size_);
  if (total == 1) {
    return std::vector<std::string>{std::string(payload)};
  }
  if (total > MAX_CHUNKS) {
    return std::unexpected(FrameError::TooManyChunks);
  }

  auto id = ids_();
  if (!id) {
    return std::unexpected(id.error());
  }

  const std::size_t data_size = chunk_size_ - CHUNK_HEADER_SIZE;
  std::vector<std::string> chunks;
  chunks.reserve(total);

  std::size_t offset = 0;
  for (std::size_t index = 0; index < total; ++index) {
    const std::size_t length = std::min(data_size, payload.size() - offset);

    // Every header field is a single byte or a byte string, so no byte order applies.
    std::string chunk;
    chunk.reserve(CHUNK_HEADER_SIZE + length);
    chunk.push_back(static_cast<char>(CHUNK_MAGIC[0]));
    chunk.push_back(static_cast<char>(CHUNK_MAGIC[1]));
    chunk.append(reinterpret_cast<const char *>(id->data()), id->size());
    chunk.push_back(static_cast<char>(index));
    chunk.push_back(static_cast<char>(total));
    chunk.append(payload.substr(offset, length));

    offset += length;
    chunks.push_back(std::move(chunk));
  }

  return chunks;
}

} // namespace gelf::transport
