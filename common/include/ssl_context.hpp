#pragma once

#include <memory>
#include <string>
#include <filesystem>
#include <boost/asio/ssl.hpp>

namespace smsgw {

namespace ssl = boost::asio::ssl;

// Client-side TLS context used for HTTPS calls to the SMS provider.
class SSLContext {
public:
    enum class Protocol {
        TLS_1_2,
        TLS_1_3,
        TLS_Auto  // Negotiate highest available
    };

    explicit SSLContext(Protocol protocol = Protocol::TLS_Auto);
    ~SSLContext();

    SSLContext(const SSLContext&) = delete;
    SSLContext& operator=(const SSLContext&) = delete;
    SSLContext(SSLContext&&) noexcept;
    SSLContext& operator=(SSLContext&&) noexcept;

    bool use_default_verify_paths();
    bool load_ca_file(const std::filesystem::path& ca_file);
    void set_verify_mode(bool verify_peer);
    bool verify_peer() const { return verify_peer_; }

    bool is_initialized() const { return initialized_; }
    std::string last_error() const { return last_error_; }

    ssl::context& native() { return *context_; }
    const ssl::context& native() const { return *context_; }

    static SSLContext create_client_context(
        const std::filesystem::path& ca_file = "",
        bool verify_server = true);

private:
    void set_error(const std::string& msg);

    std::unique_ptr<ssl::context> context_;
    bool initialized_ = false;
    bool verify_peer_ = true;
    std::string last_error_;
    Protocol protocol_;
};

}  // namespace smsgw
