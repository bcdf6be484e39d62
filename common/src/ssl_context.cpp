#include "ssl_context.hpp"
#include "logger.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace smsgw {

SSLContext::SSLContext(Protocol protocol)
    : protocol_(protocol) {
    ssl::context::method method;

    switch (protocol) {
        case Protocol::TLS_1_2:
            method = ssl::context::tlsv12_client;
            break;
        case Protocol::TLS_1_3:
            method = ssl::context::tlsv13_client;
            break;
        case Protocol::TLS_Auto:
        default:
            method = ssl::context::tls_client;
            break;
    }

    context_ = std::make_unique<ssl::context>(method);

    context_->set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1
    );
}

SSLContext::~SSLContext() = default;

SSLContext::SSLContext(SSLContext&& other) noexcept
    : context_(std::move(other.context_))
    , initialized_(other.initialized_)
    , verify_peer_(other.verify_peer_)
    , last_error_(std::move(other.last_error_))
    , protocol_(other.protocol_) {
    other.initialized_ = false;
}

SSLContext& SSLContext::operator=(SSLContext&& other) noexcept {
    if (this != &other) {
        context_ = std::move(other.context_);
        initialized_ = other.initialized_;
        verify_peer_ = other.verify_peer_;
        last_error_ = std::move(other.last_error_);
        protocol_ = other.protocol_;
        other.initialized_ = false;
    }
    return *this;
}

bool SSLContext::use_default_verify_paths() {
    if (!context_) {
        set_error("SSL context not initialized");
        return false;
    }

    try {
        context_->set_default_verify_paths();
        return true;
    } catch (const boost::system::system_error& e) {
        set_error(std::string("Failed to load default CA paths: ") + e.what());
        return false;
    }
}

bool SSLContext::load_ca_file(const std::filesystem::path& ca_file) {
    if (!context_) {
        set_error("SSL context not initialized");
        return false;
    }

    try {
        context_->load_verify_file(ca_file.string());
        return true;
    } catch (const boost::system::system_error& e) {
        set_error(std::string("Failed to load CA file: ") + e.what());
        return false;
    }
}

void SSLContext::set_verify_mode(bool verify_peer) {
    if (!context_) return;

    verify_peer_ = verify_peer;
    context_->set_verify_mode(verify_peer ? ssl::verify_peer : ssl::verify_none);
}

void SSLContext::set_error(const std::string& msg) {
    last_error_ = msg;
    unsigned long err;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        last_error_ += std::string(" [") + buf + "]";
    }
    LOG_ERROR(last_error_);
}

SSLContext SSLContext::create_client_context(
    const std::filesystem::path& ca_file,
    bool verify_server) {

    SSLContext ctx(Protocol::TLS_Auto);

    if (!ctx.use_default_verify_paths()) {
        return ctx;
    }

    if (!ca_file.empty() && !ctx.load_ca_file(ca_file)) {
        return ctx;
    }

    ctx.set_verify_mode(verify_server);
    if (!verify_server) {
        LOG_WARNING("TLS peer verification disabled for SMS API connections");
    }
    ctx.initialized_ = true;

    return ctx;
}

}  // namespace smsgw
