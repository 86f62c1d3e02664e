#include "gelf/transport/http_writer.hpp"

#include <optional>
#include <type_traits>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/ssl.h>

#include "gelf/record/record_codec.hpp"

namespace gelf::transport {

namespace {

namespace beast = boost::beast;
namespace http = boost::beast::http;

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// One POST over a fresh connection, driven to completion by run().
template <typename Stream>
class PostSession {
public:
  template <typename... StreamArgs>
  PostSession(boost::asio::io_context& ioc,
              const HttpUrl& url,
              std::string body,
              std::chrono::milliseconds timeout,
              StreamArgs&&... stream_args)
    : ioc_(ioc),
      resolver_(ioc),
      stream_(ioc, std::forward<StreamArgs>(stream_args)...),
      url_(url),
      timeout_(timeout) {
    request_.method(http::verb::post);
    request_.target(url_.target);
    request_.version(11);
    request_.set(http::field::host, url_.host.find(':') == std::string::npos
                                        ? url_.host
                                        : "[" + url_.host + "]");
    request_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request_.set(http::field::content_type, "application/json");
    request_.body() = std::move(body);
    request_.prepare_payload();
  }

  std::expected<http::status, SendError> run() {
    resolver_.async_resolve(url_.host, url_.port,
                            beast::bind_front_handler(&PostSession::on_resolve, this));
    ioc_.run();
    if (error_) {
      return std::unexpected(*error_);
    }
    return response_.result();
  }

private:
  static constexpr bool is_tls = !std::is_same_v<Stream, beast::tcp_stream>;

  void on_resolve(beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results) {
    if (ec) {
      fail(SendError::ResolveFailed, ec);
      return;
    }

    beast::get_lowest_layer(stream_).expires_after(timeout_);
    beast::get_lowest_layer(stream_).async_connect(
      results, beast::bind_front_handler(&PostSession::on_connect, this));
  }

  void on_connect(beast::error_code ec,
                  boost::asio::ip::tcp::resolver::results_type::endpoint_type) {
    if (ec) {
      fail(SendError::ConnectFailed, ec);
      return;
    }

    if constexpr (is_tls) {
      if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
        error_ = SendError::TlsHandshakeFailed;
        return;
      }
      stream_.set_verify_callback(boost::asio::ssl::host_name_verification(url_.host));
      beast::get_lowest_layer(stream_).expires_after(timeout_);
      stream_.async_handshake(boost::asio::ssl::stream_base::client,
                              beast::bind_front_handler(&PostSession::on_handshake, this));
    } else {
      write_request();
    }
  }

  void on_handshake(beast::error_code ec) {
    if (ec) {
      fail(SendError::TlsHandshakeFailed, ec);
      return;
    }
    write_request();
  }

  void write_request() {
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    http::async_write(stream_, request_,
                      beast::bind_front_handler(&PostSession::on_write, this));
  }

  void on_write(beast::error_code ec, std::size_t) {
    if (ec) {
      fail(SendError::WriteFailed, ec);
      return;
    }
    http::async_read(stream_, buffer_, response_,
                     beast::bind_front_handler(&PostSession::on_read, this));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec) {
      fail(SendError::ReadFailed, ec);
      return;
    }

    // The peer may already have closed; only the response matters here.
    beast::error_code shutdown_ec;
    beast::get_lowest_layer(stream_).socket().shutdown(
      boost::asio::ip::tcp::socket::shutdown_both, shutdown_ec);
  }

  void fail(SendError error, beast::error_code ec) {
    error_ = ec == beast::error::timeout ? SendError::Timeout : error;
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::resolver resolver_;
  Stream stream_;
  const HttpUrl& url_;
  std::chrono::milliseconds timeout_;
  http::request<http::string_body> request_;
  beast::flat_buffer buffer_;
  http::response<http::string_body> response_;
  std::optional<SendError> error_;
};

} // namespace

std::expected<HttpUrl, WriterError> parse_http_url(std::string_view url) {
  HttpUrl parsed;
  std::string_view rest;
  std::string_view port;
  if (starts_with(url, HTTPS_PREFIX)) {
    parsed.tls = true;
    rest = url.substr(HTTPS_PREFIX.size());
    port = "443";
  } else if (starts_with(url, HTTP_PREFIX)) {
    rest = url.substr(HTTP_PREFIX.size());
    port = "80";
  } else {
    return std::unexpected(WriterError::InvalidAddress);
  }

  auto slash = rest.find('/');
  std::string_view host_port = rest.substr(0, slash);
  std::string_view target = slash == std::string_view::npos ? "/" : rest.substr(slash);

  if (host_port.empty()) {
    return std::unexpected(WriterError::InvalidAddress);
  }

  std::string_view host = host_port;
  if (host_port.front() == '[') {
    // [v6] or [v6]:port
    auto close = host_port.find(']');
    if (close == std::string_view::npos) {
      return std::unexpected(WriterError::InvalidAddress);
    }
    host = host_port.substr(1, close - 1);
    auto after = host_port.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return std::unexpected(WriterError::InvalidAddress);
      }
      port = after.substr(1);
    }
  } else {
    auto colon = host_port.find(':');
    if (colon != std::string_view::npos) {
      host = host_port.substr(0, colon);
      port = host_port.substr(colon + 1);
      if (port.find(':') != std::string_view::npos) {
        return std::unexpected(WriterError::InvalidAddress);
      }
    }
  }

  if (host.empty() || port.empty()) {
    return std::unexpected(WriterError::InvalidAddress);
  }

  parsed.host = std::string(host);
  parsed.port = std::string(port);
  parsed.target = std::string(target);
  return parsed;
}

std::expected<std::unique_ptr<HttpWriter>, WriterError> HttpWriter::create(WriterOptions options) {
  auto url = parse_http_url(options.address);
  if (!url) {
    return std::unexpected(url.error());
  }

  std::unique_ptr<boost::asio::ssl::context> ssl_ctx;
  if (url->tls) {
    ssl_ctx = std::make_unique<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
    boost::system::error_code ec;
    ssl_ctx->set_default_verify_paths(ec);
    if (ec) {
      return std::unexpected(WriterError::TlsInitFailed);
    }
    ssl_ctx->set_verify_mode(boost::asio::ssl::verify_peer, ec);
    if (ec) {
      return std::unexpected(WriterError::TlsInitFailed);
    }
  }

  return std::unique_ptr<HttpWriter>(
    new HttpWriter(std::move(*url), std::move(ssl_ctx), options.http_timeout));
}

std::expected<void, SendError> HttpWriter::send(const record::Record& record) {
  auto body = record::encode(record);
  if (!body) {
    return std::unexpected(SendError::EncodeFailed);
  }

  boost::asio::io_context ioc;
  std::expected<http::status, SendError> status;
  if (url_.tls) {
    PostSession<beast::ssl_stream<beast::tcp_stream>> session(
      ioc, url_, std::move(*body), timeout_, *ssl_ctx_);
    status = session.run();
  } else {
    PostSession<beast::tcp_stream> session(ioc, url_, std::move(*body), timeout_);
    status = session.run();
  }

  if (!status) {
    return std::unexpected(status.error());
  }
  if (*status != http::status::accepted) {
    return std::unexpected(SendError::UnexpectedStatus);
  }
  return {};
}

} // namespace gelf::transport
