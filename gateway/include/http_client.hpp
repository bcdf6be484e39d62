#pragma once

#include "net/cancellation.hpp"
#include "ssl_context.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <optional>
#include <memory>
#include <chrono>
#include <cstdint>

namespace smsgw::gateway {

struct Url {
    std::string scheme;  // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string target = "/";  // path + query

    bool is_tls() const { return scheme == "https"; }

    // Host header value; the port is omitted when it is the scheme default
    std::string authority() const;

    // "https://host[:port]/path?query"; nullopt for other schemes or junk
    static std::optional<Url> parse(const std::string& text);
};

// Resolves `path` against a base URL the way a directory base does:
// join("https://h/API/v1/", "login") == "https://h/API/v1/login"
std::string join_url(const std::string& base, const std::string& path);

// RFC 3986 unreserved characters pass; everything else becomes %XX
std::string percent_encode(std::string_view value);

// "a=1&b=x%20y"
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

// success is false only when no HTTP response was received; `error` then
// holds "timeout", "cancelled" or the transport error text.
struct HttpResponse {
    bool success = false;
    int status = 0;
    std::string body;
    std::string error;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse perform(const HttpRequest& request,
                                 const CancellationToken& cancel) = 0;
};

// Blocking HTTP/1.1 client on Boost.Beast. Each call runs its own
// io_context on the calling thread, so one instance serves many workers.
class HttpClient : public HttpTransport {
public:
    static constexpr size_t kMaxResponseBody = 1024 * 1024;

    // `tls` may be null when only plain http:// URLs are used
    HttpClient(std::chrono::milliseconds timeout, std::shared_ptr<SSLContext> tls);

    HttpResponse perform(const HttpRequest& request,
                         const CancellationToken& cancel) override;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
    std::shared_ptr<SSLContext> tls_;
};

}  // namespace smsgw::gateway
