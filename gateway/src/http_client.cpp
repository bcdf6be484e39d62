#include "http_client.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <type_traits>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace smsgw::gateway {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr const char* kUserAgent = "smtp2sms/1.0";

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

// One request/response exchange. The chain is resolve, connect, (TLS
// handshake), write, read; the caller drives the io_context and may abort.
template <typename Stream>
class Exchange {
public:
    Exchange(asio::io_context& io, Stream stream, const Url& url,
             http::request<http::string_body> request)
        : resolver_(io)
        , stream_(std::move(stream))
        , url_(url)
        , request_(std::move(request)) {
        parser_.body_limit(HttpClient::kMaxResponseBody);
    }

    void start() {
        resolver_.async_resolve(url_.host, std::to_string(url_.port),
            [this](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) return finish(ec, "resolve");
                beast::get_lowest_layer(stream_).async_connect(results,
                    [this](beast::error_code ec, const tcp::endpoint&) {
                        on_connect(ec);
                    });
            });
    }

    void abort() {
        resolver_.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().close(ignored);
    }

    bool done() const { return done_; }
    const beast::error_code& error() const { return error_; }
    const char* stage() const { return stage_; }
    const http::response<http::string_body>& response() const { return parser_.get(); }

private:
    void on_connect(beast::error_code ec) {
        if (ec) return finish(ec, "connect");

        if constexpr (std::is_same_v<Stream, TlsStream>) {
            stream_.async_handshake(asio::ssl::stream_base::client,
                [this](beast::error_code ec) {
                    if (ec) return finish(ec, "TLS handshake");
                    send();
                });
        } else {
            send();
        }
    }

    void send() {
        http::async_write(stream_, request_,
            [this](beast::error_code ec, std::size_t) {
                if (ec) return finish(ec, "write");
                http::async_read(stream_, buffer_, parser_,
                    [this](beast::error_code ec, std::size_t) {
                        finish(ec, "read");
                    });
            });
    }

    void finish(beast::error_code ec, const char* stage) {
        error_ = ec;
        stage_ = stage;
        done_ = true;

        // Connection: close was requested, no reuse
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
    }

    tcp::resolver resolver_;
    Stream stream_;
    Url url_;
    http::request<http::string_body> request_;
    http::response_parser<http::string_body> parser_;
    beast::flat_buffer buffer_;

    bool done_ = false;
    beast::error_code error_;
    const char* stage_ = "";
};

template <typename Stream>
HttpResponse drive(asio::io_context& io, Exchange<Stream>& exchange,
                   std::chrono::steady_clock::time_point deadline,
                   const CancellationToken& cancel) {
    HttpResponse response;

    exchange.start();
    while (!exchange.done()) {
        io.run_one_for(kPollInterval);
        if (exchange.done()) {
            break;
        }
        if (cancel.cancelled()) {
            exchange.abort();
            response.error = "cancelled";
            return response;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            exchange.abort();
            response.error = "timeout";
            return response;
        }
    }

    if (exchange.error()) {
        response.error = std::string(exchange.stage()) + ": " + exchange.error().message();
        return response;
    }

    const auto& res = exchange.response();
    response.success = true;
    response.status = static_cast<int>(res.result_int());
    response.body = res.body();
    return response;
}

}  // namespace

std::string Url::authority() const {
    bool default_port = (scheme == "https" && port == 443) || (scheme == "http" && port == 80);
    std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return default_port ? host_part : host_part + ":" + std::to_string(port);
}

std::optional<Url> Url::parse(const std::string& text) {
    auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme == "https") {
        url.port = 443;
    } else if (url.scheme == "http") {
        url.port = 80;
    } else {
        return std::nullopt;
    }

    size_t authority_start = scheme_end + 3;
    size_t authority_end = text.find_first_of("/?", authority_start);
    std::string authority = text.substr(authority_start,
        authority_end == std::string::npos ? std::string::npos : authority_end - authority_start);

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        // [IPv6]:port
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            port_text = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (url.host.empty()) {
        return std::nullopt;
    }

    if (!port_text.empty()) {
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port == 0 || port > 65535) {
            return std::nullopt;
        }
        url.port = static_cast<uint16_t>(port);
    }

    if (authority_end != std::string::npos) {
        url.target = text.substr(authority_end);
        if (url.target.front() == '?') {
            url.target.insert(0, "/");
        }
    }

    return url;
}

std::string join_url(const std::string& base, const std::string& path) {
    if (path.find("://") != std::string::npos) {
        return path;
    }

    std::string relative = path;
    while (!relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    }

    if (!base.empty() && base.back() == '/') {
        return base + relative;
    }
    return base + "/" + relative;
}

std::string percent_encode(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += '%';
            out += kHex[uc >> 4];
            out += kHex[uc & 0x0F];
        }
    }
    return out;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string query;
    for (const auto& [name, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += percent_encode(name) + "=" + percent_encode(value);
    }
    return query;
}

HttpClient::HttpClient(std::chrono::milliseconds timeout, std::shared_ptr<SSLContext> tls)
    : timeout_(timeout)
    , tls_(std::move(tls)) {
}

HttpResponse HttpClient::perform(const HttpRequest& request, const CancellationToken& cancel) {
    HttpResponse response;

    auto url = Url::parse(request.url);
    if (!url) {
        response.error = "invalid URL: " + request.url;
        return response;
    }
    if (cancel.cancelled()) {
        response.error = "cancelled";
        return response;
    }

    http::request<http::string_body> req;
    req.method_string(request.method);
    req.target(url->target);
    req.version(11);
    req.set(http::field::host, url->authority());
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::connection, "close");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.body.empty() || request.method == "POST" || request.method == "PUT") {
        req.body() = request.body;
        req.prepare_payload();
    }

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    LOG_DEBUG_FMT("HTTP {} {}://{}{}", request.method, url->scheme, url->authority(),
                  url->target.substr(0, url->target.find('?')));

    asio::io_context io;

    if (!url->is_tls()) {
        Exchange<PlainStream> exchange(io, PlainStream(io), *url, std::move(req));
        return drive(io, exchange, deadline, cancel);
    }

    if (!tls_ || !tls_->is_initialized()) {
        response.error = "TLS is not configured";
        return response;
    }

    TlsStream stream(io, tls_->native());

    // SNI, then certificate name check against the same host
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
        response.error = "TLS SNI: " + ec.message();
        return response;
    }
    if (tls_->verify_peer()) {
        stream.set_verify_callback(asio::ssl::host_name_verification(url->host));
    }

    Exchange<TlsStream> exchange(io, std::move(stream), *url, std::move(req));
    return drive(io, exchange, deadline, cancel);
}

}  // namespace smsgw::gateway
