#include "smtp_server.hpp"
#include "logger.hpp"

namespace smsgw::smtp {

SMTPServer::SMTPServer(const SMTPConfig& config,
                       std::shared_ptr<TransactionHandler> handler,
                       size_t worker_threads)
    : config_(config)
    , handler_(std::move(handler))
    , workers_(worker_threads == 0 ? 1 : worker_threads) {
}

SMTPServer::~SMTPServer() {
    stop();
    workers_.join();
}

void SMTPServer::start() {
    if (smtp_server_) return;

    auto server = std::make_unique<Server<SMTPSession>>(
        "SMTP",
        config_.bind_address,
        config_.port,
        config_.thread_pool_size
    );

    server->set_session_factory(
        [this](asio::io_context& io_ctx, tcp::socket socket) {
            SessionLimits limits;
            limits.max_message_size = config_.max_message_size;
            limits.max_recipients = config_.max_recipients;

            return std::make_shared<SMTPSession>(
                io_ctx, std::move(socket), handler_, workers_,
                config_.hostname, config_.local_domains, limits
            );
        }
    );

    server->set_max_connections(config_.max_connections);
    server->set_connection_timeout(config_.connection_timeout);

    LOG_INFO_FMT("Starting SMTP server on {}:{}", config_.bind_address, config_.port);
    server->start();
    smtp_server_ = std::move(server);
}

void SMTPServer::stop() {
    if (smtp_server_) {
        // Closing the sessions cancels their in-flight transactions; the
        // workers must drain before the sessions' io_context goes away
        smtp_server_->stop();
        workers_.join();
        smtp_server_.reset();
        LOG_INFO("SMTP server stopped");
    }
}

bool SMTPServer::is_running() const {
    return smtp_server_ && smtp_server_->is_running();
}

uint16_t SMTPServer::port() const {
    return smtp_server_ ? smtp_server_->local_port() : 0;
}

}  // namespace smsgw::smtp
