#pragma once

#include "net/server.hpp"
#include "config.hpp"
#include "smtp_session.hpp"
#include "transaction_handler.hpp"
#include <boost/asio/thread_pool.hpp>
#include <memory>

namespace smsgw::smtp {

// SMTP listener feeding completed transactions to a TransactionHandler
class SMTPServer {
public:
    SMTPServer(const SMTPConfig& config,
               std::shared_ptr<TransactionHandler> handler,
               size_t worker_threads = 4);

    ~SMTPServer();

    SMTPServer(const SMTPServer&) = delete;
    SMTPServer& operator=(const SMTPServer&) = delete;

    // Throws boost::system::system_error when the port cannot be bound
    void start();
    void stop();

    bool is_running() const;
    uint16_t port() const;

private:
    SMTPConfig config_;
    std::shared_ptr<TransactionHandler> handler_;
    asio::thread_pool workers_;

    std::unique_ptr<Server<SMTPSession>> smtp_server_;
};

}  // namespace smsgw::smtp
