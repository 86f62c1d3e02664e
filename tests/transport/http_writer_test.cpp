/*
 * http_writer_test.cpp
 *
 * Tests for the HTTP fallback transport.
 *
 * A one-shot HTTP server thread accepts a single connection on 127.0.0.1,
 * records the request and answers with a fixed status.
 *
 * Exit code: 0 = all tests passed, non-zero = failure.
 */

#include "gelf/record/record.hpp"
#include "gelf/record/record_codec.hpp"
#include "gelf/transport/http_writer.hpp"
#include "gelf/transport/writer.hpp"

#include "../test_harness.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <string>
#include <thread>

using namespace gelf;
using namespace gelf::transport;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using boost::asio::ip::tcp;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

template <typename View>
static std::string as_string(const View& view) {
    return std::string(view.data(), view.size());
}

struct CapturedRequest {
    std::string method;
    std::string target;
    std::string content_type;
    std::string body;
};

class OneShotServer {
public:
    explicit OneShotServer(http::status status, bool respond = true)
        : acceptor_(ioc_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)),
          status_(status),
          respond_(respond) {
        thread_ = std::thread([this] { serve(); });
    }

    ~OneShotServer() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + path;
    }

    // Valid once the writer's send() has returned.
    const CapturedRequest& request() {
        if (thread_.joinable()) {
            thread_.join();
        }
        return captured_;
    }

private:
    void serve() {
        beast::error_code ec;
        tcp::socket socket(ioc_);
        acceptor_.accept(socket, ec);
        if (ec) {
            return;
        }

        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(socket, buffer, req, ec);
        if (ec) {
            return;
        }
        captured_.method = as_string(req.method_string());
        captured_.target = as_string(req.target());
        captured_.content_type = as_string(req[http::field::content_type]);
        captured_.body = req.body();

        if (respond_) {
            http::response<http::string_body> res{status_, req.version()};
            res.keep_alive(false);
            res.prepare_payload();
            http::write(socket, res, ec);
        }
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    http::status status_;
    bool respond_;
    CapturedRequest captured_;
    std::thread thread_;
};

static record::Record sample_record() {
    record::Record r;
    r.host = "web-1";
    r.short_message = "checkout failed";
    r.timestamp = 1700000000.25;
    r.level = 3;
    r.facility = "shop";
    r.extra["_order_id"] = std::int64_t{991};
    return r;
}

static std::unique_ptr<Writer> make_http(const std::string& url,
                                         std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto w = make_writer(WriterOptions{.address = url,
                                       .facility = "f",
                                       .host = "h",
                                       .http_timeout = timeout});
    EXPECT(w.has_value());
    EXPECT(dynamic_cast<HttpWriter*>(w->get()) != nullptr);
    return std::move(*w);
}

// ---------------------------------------------------------------------------
// URL parsing
// ---------------------------------------------------------------------------

TEST(test_parse_http_url_defaults) {
    auto plain = parse_http_url("http://graylog.local");
    EXPECT(plain.has_value());
    EXPECT(!plain->tls);
    EXPECT(plain->host == "graylog.local");
    EXPECT(plain->port == "80");
    EXPECT(plain->target == "/");

    auto tls = parse_http_url("https://graylog.local/gelf");
    EXPECT(tls.has_value());
    EXPECT(tls->tls);
    EXPECT(tls->port == "443");
    EXPECT(tls->target == "/gelf");
}

TEST(test_parse_http_url_explicit_port) {
    auto u = parse_http_url("http://10.0.0.5:12201/gelf?x=1");
    EXPECT(u.has_value());
    EXPECT(u->host == "10.0.0.5");
    EXPECT(u->port == "12201");
    EXPECT(u->target == "/gelf?x=1");
}

TEST(test_parse_http_url_bracketed_ipv6) {
    auto u = parse_http_url("http://[::1]:12201/gelf");
    EXPECT(u.has_value());
    EXPECT(u->host == "::1");
    EXPECT(u->port == "12201");
    EXPECT(u->target == "/gelf");

    auto tls = parse_http_url("https://[fe80::2]/x");
    EXPECT(tls.has_value());
    EXPECT(tls->host == "fe80::2");
    EXPECT(tls->port == "443");
    EXPECT(tls->target == "/x");

    EXPECT(!parse_http_url("http://[::1/gelf").has_value());
    EXPECT(!parse_http_url("http://[::1]x/gelf").has_value());
    EXPECT(!parse_http_url("http://[::1]:/gelf").has_value());
    EXPECT(!parse_http_url("http://[]:80/").has_value());
    EXPECT(!parse_http_url("http://::1:80/").has_value());
}

TEST(test_parse_http_url_invalid) {
    EXPECT(!parse_http_url("ftp://host/").has_value());
    EXPECT(!parse_http_url("http://").has_value());
    EXPECT(!parse_http_url("http:///gelf").has_value());
    EXPECT(!parse_http_url("http://host:/gelf").has_value());
}

// ---------------------------------------------------------------------------
// Sending
// ---------------------------------------------------------------------------

TEST(test_post_accepted) {
    OneShotServer server(http::status::accepted);
    auto w = make_http(server.url("/gelf"));
    const auto rec = sample_record();

    auto sent = w->send(rec);
    EXPECT(sent.has_value());

    const auto& req = server.request();
    EXPECT(req.method == "POST");
    EXPECT(req.target == "/gelf");
    EXPECT(req.content_type == "application/json");
    auto decoded = record::decode(req.body);
    EXPECT(decoded.has_value());
    EXPECT(*decoded == rec);
}

TEST(test_non_202_is_failure) {
    OneShotServer server(http::status::ok);
    auto w = make_http(server.url("/gelf"));
    auto sent = w->send(sample_record());
    EXPECT(!sent.has_value());
    EXPECT(sent.error() == SendError::UnexpectedStatus);
}

TEST(test_server_error_is_failure) {
    OneShotServer server(http::status::internal_server_error);
    auto w = make_http(server.url("/"));
    auto sent = w->send(sample_record());
    EXPECT(!sent.has_value());
    EXPECT(sent.error() == SendError::UnexpectedStatus);
}

TEST(test_connection_closed_without_response) {
    OneShotServer server(http::status::accepted, false);
    auto w = make_http(server.url("/gelf"));
    auto sent = w->send(sample_record());
    EXPECT(!sent.has_value());
    EXPECT(sent.error() == SendError::ReadFailed);
}

TEST(test_connection_refused) {
    std::string url;
    {
        // Grab a free port, then close it so nothing listens there.
        boost::asio::io_context ioc;
        tcp::acceptor probe(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        url = "http://127.0.0.1:" + std::to_string(probe.local_endpoint().port()) + "/gelf";
    }
    auto w = make_http(url);
    auto sent = w->send(sample_record());
    EXPECT(!sent.has_value());
    EXPECT(sent.error() == SendError::ConnectFailed);
}

TEST(test_encode_failure_skips_request) {
    auto w = make_http("http://127.0.0.1:9/gelf");
    record::Record rec = sample_record();
    rec.extra["host"] = std::string("shadow");
    auto sent = w->send(rec);
    EXPECT(!sent.has_value());
    EXPECT(sent.error() == SendError::EncodeFailed);
}

TEST(test_invalid_url_rejected) {
    auto w = make_writer(WriterOptions{.address = "http://", .facility = "f", .host = "h"});
    EXPECT(!w.has_value());
    EXPECT(w.error() == WriterError::InvalidAddress);
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main() {
    std::printf("=== http writer tests ===\n\n");

    std::printf("--- url parsing ---\n");
    RUN(test_parse_http_url_defaults);
    RUN(test_parse_http_url_explicit_port);
    RUN(test_parse_http_url_bracketed_ipv6);
    RUN(test_parse_http_url_invalid);

    std::printf("\n--- loopback ---\n");
    RUN(test_post_accepted);
    RUN(test_non_202_is_failure);
    RUN(test_server_error_is_failure);
    RUN(test_connection_closed_without_response);
    RUN(test_connection_refused);
    RUN(test_encode_failure_skips_request);
    RUN(test_invalid_url_rejected);

    std::printf("\n=== Results: %d/%d passed ===\n", g_passed, g_total);
    return (g_failed == 0) ? 0 : 1;
}
