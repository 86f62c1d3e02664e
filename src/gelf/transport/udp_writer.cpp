#include "gelf/transport/udp_writer.hpp"

#include <charconv>
#include <chrono>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>

#include "gelf/record/record_codec.hpp"
#include "gelf/record/text_record.hpp"

namespace gelf::transport {

namespace {

bool valid_port(std::string_view port) {
  unsigned value = 0;
  auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
  return ec == std::errc() && end == port.data() + port.size() && value > 0 &&
         value <= 65535;
}

SendError to_send_error(FrameError error) {
  switch (error) {
  case FrameError::TooManyChunks:
    return SendError::TooManyChunks;
  case FrameError::RandomFailed:
    return SendError::RandomFailed;
  case FrameError::ChunkSizeTooSmall:
    break;
  }
  return SendError::WriteFailed;
}

} // namespace

std::expected<UdpAddress, WriterError> parse_udp_address(std::string_view address) {
  std::string_view host;
  std::string_view port;

  if (!address.empty() && address.front() == '[') {
    auto close = address.find(']');
    if (close == std::string_view::npos || close + 1 >= address.size() ||
        address[close + 1] != ':') {
      return std::unexpected(WriterError::InvalidAddress);
    }
    host = address.substr(1, close - 1);
    port = address.substr(close + 2);
  } else {
    auto colon = address.rfind(':');
    if (colon == std::string_view::npos) {
      return std::unexpected(WriterError::InvalidAddress);
    }
    host = address.substr(0, colon);
    port = address.substr(colon + 1);
    if (host.find(':') != std::string_view::npos) {
      return std::unexpected(WriterError::InvalidAddress);
    }
  }

  if (host.empty() || !valid_port(port)) {
    return std::unexpected(WriterError::InvalidAddress);
  }
  return UdpAddress{std::string(host), std::string(port)};
}

UdpWriter::UdpWriter(WriterOptions options)
  : socket_(ioc_),
    host_(std::move(options.host)),
    facility_(std::move(options.facility)),
    compression_type_(options.compression_type),
    compression_level_(options.compression_level),
    framer_(options.chunk_size) {}

std::expected<std::unique_ptr<UdpWriter>, WriterError> UdpWriter::create(WriterOptions options) {
  if (options.chunk_size <= CHUNK_HEADER_SIZE || options.chunk_size > MAX_DATAGRAM_SIZE) {
    return std::unexpected(WriterError::InvalidChunkSize);
  }

  auto address = parse_udp_address(options.address);
  if (!address) {
    return std::unexpected(address.error());
  }

  auto completed = with_defaults(std::move(options));
  if (!completed) {
    return std::unexpected(completed.error());
  }

  std::unique_ptr<UdpWriter> writer(new UdpWriter(std::move(*completed)));
  if (auto connected = writer->connect(*address); !connected) {
    return std::unexpected(connected.error());
  }
  return writer;
}

std::expected<void, WriterError> UdpWriter::connect(const UdpAddress &address) {
  boost::asio::ip::udp::resolver resolver(ioc_);
  boost::system::error_code ec;
  auto results = resolver.resolve(address.host, address.port, ec);
  if (ec || results.empty()) {
    return std::unexpected(WriterError::ResolveFailed);
  }

  boost::asio::connect(socket_, results, ec);
  if (ec) {
    return std::unexpected(WriterError::ConnectFailed);
  }
  return {};
}

std::expected<void, SendError> UdpWriter::send(const record::Record &record) {
  std::scoped_lock lock(mutex_);

  auto encoded = record::encode(record);
  if (!encoded) {
    return std::unexpected(SendError::EncodeFailed);
  }

  auto compressor = compressors_.obtain(compression_type_, compression_level_);
  if (!compressor) {
    return std::unexpected(SendError::CompressFailed);
  }

  auto compressed = compress::compress(**compressor, *encoded);
  if (!compressed) {
    return std::unexpected(SendError::CompressFailed);
  }

  auto datagrams = framer_.frame(*compressed);
  if (!datagrams) {
    return std::unexpected(to_send_error(datagrams.error()));
  }

  for (const auto &datagram : *datagrams) {
    if (auto written = write_datagram(datagram); !written) {
      return written;
    }
  }
  return {};
}

std::expected<std::size_t, SendError> UdpWriter::write(std::string_view text) {
  auto trimmed = record::trim_text(text);
  auto message =
    record::make_text_record(trimmed, host_, facility_, std::chrono::system_clock::now());
  if (auto sent = send(message); !sent) {
    return std::unexpected(sent.error());
  }
  return trimmed.size();
}

void UdpWriter::set_compression(compress::CompressionType type, int level) {
  std::scoped_lock lock(mutex_);
  compression_type_ = type;
  compression_level_ = level;
}

compress::CompressionType UdpWriter::compression_type() const {
  std::scoped_lock lock(mutex_);
  return compression_type_;
}

int UdpWriter::compression_level() const {
  std::scoped_lock lock(mutex_);
  return compression_level_;
}

std::uint64_t UdpWriter::compressor_generation() const {
  std::scoped_lock lock(mutex_);
  return compressors_.generation();
}

std::expected<void, SendError> UdpWriter::write_datagram(std::string_view datagram) {
  boost::system::error_code ec;
  auto written = socket_.send(boost::asio::buffer(datagram.data(), datagram.size()), 0, ec);
  if (ec) {
    return std::unexpected(SendError::WriteFailed);
  }
  if (written != datagram.size()) {
    return std::unexpected(SendError::ShortWrite);
  }
  return {};
}

} // namespace gelf::transport
