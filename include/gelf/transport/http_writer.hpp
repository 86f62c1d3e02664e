#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/ssl/context.hpp>

#include "gelf/transport/writer.hpp"

namespace gelf::transport
{

  inline constexpr std::string_view HTTP_PREFIX = "http://";
  inline constexpr std::string_view HTTPS_PREFIX = "https://";

  /** Parsed http(s) URL parts. */
  struct HttpUrl
  {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target;
  };

  /**
   * Parse http:// or https:// URL into host/port/target.
   * @param url URL string.
   * @return HttpUrl or WriterError::InvalidAddress.
   */
  [[nodiscard]] std::expected<HttpUrl, WriterError> parse_http_url(std::string_view url);

  /**
   * Posts each record as JSON to a GELF HTTP input, expecting 202 Accepted.
   * Every send uses its own connection; no state is shared between calls.
   */
  class HttpWriter final : public Writer
  {
  public:
    /**
     * Validate the URL and prepare TLS settings.
     * @param options Writer options; address must be an http(s) URL.
     * @return HttpWriter or WriterError.
     */
    [[nodiscard]] static std::expected<std::unique_ptr<HttpWriter>, WriterError> create(
        WriterOptions options);

    HttpWriter(const HttpWriter &) = delete;
    HttpWriter &operator=(const HttpWriter &) = delete;

    /**
     * POST one record and wait for the response.
     * @param record Record to send.
     * @return void or SendError.
     */
    [[nodiscard]] std::expected<void, SendError> send(const record::Record &record) override;

    [[nodiscard]] const HttpUrl &url() const { return url_; }

  private:
    HttpWriter(HttpUrl url,
               std::unique_ptr<boost::asio::ssl::context> ssl_ctx,
               std::chrono::milliseconds timeout)
        : url_(std::move(url)), ssl_ctx_(std::move(ssl_ctx)), timeout_(timeout) {}

    HttpUrl url_;
    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::chrono::milliseconds timeout_;
  };

} // namespace gelf::transport
