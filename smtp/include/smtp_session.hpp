#pragma once

#include "net/session.hpp"
#include "net/cancellation.hpp"
#include "smtp_commands.hpp"
#include "transaction_handler.hpp"
#include <boost/asio/thread_pool.hpp>
#include <memory>
#include <vector>

namespace smsgw::smtp {

enum class SessionState {
    CONNECTED,      // Initial state
    GREETED,        // After HELO/EHLO
    MAIL,           // After MAIL FROM
    RCPT,           // After at least one RCPT TO
    DATA,           // During DATA reception
    PROCESSING,     // Transaction handed to the handler, awaiting its reply
    QUIT            // After QUIT
};

struct Envelope {
    std::string mail_from;
    std::vector<std::string> rcpt_to;

    void clear() {
        mail_from.clear();
        rcpt_to.clear();
    }
};

struct SessionLimits {
    size_t max_message_size = 1024 * 1024;
    size_t max_recipients = 100;
};

class SMTPSession : public Session {
public:
    SMTPSession(asio::io_context& io_context, tcp::socket socket,
                std::shared_ptr<TransactionHandler> handler,
                asio::thread_pool& workers,
                const std::string& hostname,
                const std::vector<std::string>& local_domains,
                SessionLimits limits = {});

    ~SMTPSession() override = default;

    SessionState state() const { return state_; }
    void set_state(SessionState state) { state_ = state; }

    Envelope& envelope() { return envelope_; }
    const Envelope& envelope() const { return envelope_; }

    const std::string& client_hostname() const { return client_hostname_; }
    void set_client_hostname(const std::string& hostname) { client_hostname_ = hostname; }

    // True when no domain list is configured or the domain is on it
    bool is_local_domain(const std::string& domain) const;

    const std::string& hostname() const { return hostname_; }
    size_t max_message_size() const { return limits_.max_message_size; }
    size_t max_recipients() const { return limits_.max_recipients; }

protected:
    void on_connect() override;
    void on_data(const std::string& data) override;
    void on_disconnect() override;

private:
    void process_command(const std::string& line);
    void process_data_line(const std::string& line);
    void dispatch_transaction();
    void complete_transaction(const Reply& result);
    void reset_transaction();
    std::string received_header() const;

    SessionState state_ = SessionState::CONNECTED;
    Envelope envelope_;
    std::string client_hostname_;

    std::shared_ptr<TransactionHandler> handler_;
    asio::thread_pool& workers_;
    std::string hostname_;
    std::vector<std::string> local_domains_;
    SessionLimits limits_;

    std::string data_buffer_;
    bool data_overflow_ = false;
    CancellationToken cancel_;
};

}  // namespace smsgw::smtp
