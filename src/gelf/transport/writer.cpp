#include "gelf/transport/writer.hpp"

#include <filesystem>
#include <system_error>

#include <boost/asio/ip/host_name.hpp>

#include "gelf/transport/http_writer.hpp"
#include "gelf/transport/udp_writer.hpp"

namespace gelf::transport
{

  namespace
  {

    constexpr std::string_view FALLBACK_FACILITY = "gelf";

    bool starts_with(std::string_view s, std::string_view prefix)
    {
      return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    std::string running_program_name()
    {
      std::error_code ec;
      auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
      if (ec || exe.filename().empty())
      {
        return std::string(FALLBACK_FACILITY);
      }
      return exe.filename().string();
    }

  } // namespace

  const char *to_string(SendError error)
  {
    switch (error)
    {
    case SendError::EncodeFailed:
      return "encode failed";
    case SendError::CompressFailed:
      return "compress failed";
    case SendError::TooManyChunks:
      return "message too large for 255 chunks";
    case SendError::RandomFailed:
      return "random message id failed";
    case SendError::WriteFailed:
      return "write failed";
    case SendError::ShortWrite:
      return "short write";
    case SendError::ResolveFailed:
      return "resolve failed";
    case SendError::ConnectFailed:
      return "connect failed";
    case SendError::TlsHandshakeFailed:
      return "tls handshake failed";
    case SendError::ReadFailed:
      return "read failed";
    case SendError::Timeout:
      return "timed out";
    case SendError::UnexpectedStatus:
      return "unexpected http status, expected 202";
    }
    return "unknown send error";
  }

  const char *to_string(WriterError error)
  {
    switch (error)
    {
    case WriterError::InvalidAddress:
      return "invalid address";
    case WriterError::ResolveFailed:
      return "resolve failed";
    case WriterError::ConnectFailed:
      return "connect failed";
    case WriterError::HostnameFailed:
      return "local hostname lookup failed";
    case WriterError::InvalidChunkSize:
      return "invalid chunk size";
    case WriterError::TlsInitFailed:
      return "tls init failed";
    }
    return "unknown writer error";
  }

  std::expected<WriterOptions, WriterError> with_defaults(WriterOptions options)
  {
    if (options.host.empty())
    {
      boost::system::error_code ec;
      auto name = boost::asio::ip::host_name(ec);
      if (ec || name.empty())
      {
        return std::unexpected(WriterError::HostnameFailed);
      }
      options.host = std::move(name);
    }
    if (options.facility.empty())
    {
      options.facility = running_program_name();
    }
    return options;
  }

  bool is_http_address(std::string_view address)
  {
    return starts_with(address, HTTP_PREFIX) || starts_with(address, HTTPS_PREFIX);
  }

  std::expected<std::unique_ptr<Writer>, WriterError> make_writer(WriterOptions options)
  {
    if (is_http_address(options.address))
    {
      auto http = HttpWriter::create(std::move(options));
      if (!http)
      {
        return std::unexpected(http.error());
      }
      return std::unique_ptr<Writer>(std::move(*http));
    }

    auto udp = UdpWriter::create(std::move(options));
    if (!udp)
    {
      return std::unexpected(udp.error());
    }
    return std::unique_ptr<Writer>(std::move(*udp));
  }

} // namespace gelf::transport
