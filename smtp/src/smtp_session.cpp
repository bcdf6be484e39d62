#include "smtp_session.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <boost/asio/post.hpp>

namespace smsgw::smtp {

namespace {

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S %z");
    return oss.str();
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

}  // namespace

SMTPSession::SMTPSession(asio::io_context& io_context, tcp::socket socket,
                         std::shared_ptr<TransactionHandler> handler,
                         asio::thread_pool& workers,
                         const std::string& hostname,
                         const std::vector<std::string>& local_domains,
                         SessionLimits limits)
    : Session(io_context, std::move(socket))
    , handler_(std::move(handler))
    , workers_(workers)
    , hostname_(hostname)
    , local_domains_(local_domains)
    , limits_(limits) {
}

void SMTPSession::on_connect() {
    Session::on_connect();
    LOG_INFO_FMT("SMTP connection from {}:{}", remote_address(), remote_port());

    send_line(reply::make(reply::SERVICE_READY, hostname_ + " ESMTP SMS gateway ready"));
}

void SMTPSession::on_disconnect() {
    // Abandon any transaction still running on a worker
    cancel_.cancel();
    if (state_ == SessionState::PROCESSING) {
        LOG_WARNING_FMT("Client {}:{} disconnected while its transaction was in flight",
                        remote_address(), remote_port());
    }
    Session::on_disconnect();
}

void SMTPSession::on_data(const std::string& data) {
    if (state_ == SessionState::DATA) {
        process_data_line(data);
    } else if (state_ != SessionState::PROCESSING && state_ != SessionState::QUIT) {
        process_command(data);
    }
}

void SMTPSession::process_command(const std::string& line) {
    LOG_DEBUG_FMT("SMTP command: {}", line);

    Command cmd = Command::parse(line);

    if (cmd.type == CommandType::UNKNOWN) {
        send_line(reply::make(reply::SYNTAX_ERROR, "Unrecognized command"));
        return;
    }

    std::string response = CommandHandler::execute(*this, cmd);

    if (!response.empty()) {
        send_line(response);
    }

    if (cmd.type == CommandType::QUIT) {
        pause_reading();
        close_after_flush();
    }
}

void SMTPSession::process_data_line(const std::string& line) {
    if (line == ".") {
        if (data_overflow_) {
            send_line(reply::make(reply::EXCEEDED_STORAGE, "Message exceeds fixed maximum message size"));
            reset_transaction();
            return;
        }
        dispatch_transaction();
        return;
    }

    if (data_overflow_) {
        return;  // Discard until the terminating dot
    }

    // Undo dot-stuffing
    std::string content_line = line;
    if (!content_line.empty() && content_line[0] == '.') {
        content_line.erase(0, 1);
    }

    if (data_buffer_.size() + content_line.size() + 2 > limits_.max_message_size) {
        LOG_WARNING_FMT("Message from {} exceeds {} bytes", remote_address(), limits_.max_message_size);
        data_overflow_ = true;
        data_buffer_.clear();
        return;
    }

    data_buffer_ += content_line + "\r\n";
}

void SMTPSession::dispatch_transaction() {
    MailTransaction transaction;
    transaction.peer = remote_address() + ":" + std::to_string(remote_port());
    transaction.mail_from = envelope_.mail_from;
    transaction.rcpt_to = envelope_.rcpt_to;
    transaction.data = received_header() + data_buffer_;
    data_buffer_.clear();

    LOG_INFO_FMT("Mail from {} <{}> to <{}> ({} recipient(s), {} bytes)",
                 transaction.peer, transaction.mail_from,
                 transaction.rcpt_to.empty() ? std::string() : transaction.rcpt_to.front(),
                 transaction.rcpt_to.size(), transaction.data.size());

    state_ = SessionState::PROCESSING;
    pause_reading();

    auto self = std::static_pointer_cast<SMTPSession>(shared_from_this());
    auto handler = handler_;
    auto cancel = cancel_;

    // The handler blocks on HTTP calls; keep it off the I/O threads
    asio::post(workers_, [self, handler, cancel, transaction = std::move(transaction)]() {
        Reply result;
        try {
            result = handler->handle(transaction, cancel);
        } catch (const std::exception& e) {
            LOG_ERROR_FMT("Transaction handler failed: {}", e.what());
            result = Reply{reply::LOCAL_ERROR, "Requested action aborted: local error in processing"};
        }

        asio::post(self->strand(), [self, result]() {
            self->complete_transaction(result);
        });
    });
}

void SMTPSession::complete_transaction(const Reply& result) {
    if (is_stopped()) {
        return;  // Client went away; nobody to answer
    }

    send_line(result.to_string());
    reset_transaction();
    reset_timeout();
    resume_reading();
}

void SMTPSession::reset_transaction() {
    envelope_.clear();
    data_buffer_.clear();
    data_overflow_ = false;
    state_ = SessionState::GREETED;
}

std::string SMTPSession::received_header() const {
    std::ostringstream received;
    received << "Received: from " << (client_hostname_.empty() ? "unknown" : client_hostname_)
             << " (" << remote_address() << ")\r\n"
             << "\tby " << hostname_ << " with ESMTP;\r\n"
             << "\t" << get_timestamp() << "\r\n";
    return received.str();
}

bool SMTPSession::is_local_domain(const std::string& domain) const {
    if (local_domains_.empty()) {
        return true;
    }
    return std::any_of(local_domains_.begin(), local_domains_.end(),
                       [&domain](const std::string& local) { return iequals(local, domain); });
}

}  // namespace smsgw::smtp
