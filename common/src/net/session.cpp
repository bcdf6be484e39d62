#include "net/session.hpp"
#include "logger.hpp"

namespace smsgw {

Session::Session(asio::io_context& io_context, tcp::socket socket)
    : io_context_(io_context)
    , strand_(asio::make_strand(io_context))
    , socket_(std::move(socket))
    , read_buffer_(kMaxBufferedInput)
    , timeout_timer_(strand_) {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        cached_address_ = endpoint.address().to_string();
        cached_port_ = endpoint.port();
    }
}

void Session::start() {
    auto self = shared_from_this();
    asio::dispatch(strand_, [this, self]() {
        on_connect();
        reset_timeout();
        do_read();
    });
}

void Session::stop() {
    auto self = shared_from_this();
    asio::dispatch(strand_, [this, self]() {
        do_stop();
    });
}

void Session::do_stop() {
    if (stopped_) return;
    stopped_ = true;

    timeout_timer_.cancel();
    on_disconnect();
    close_socket();

    if (close_callback_) {
        auto callback = std::move(close_callback_);
        close_callback_ = nullptr;
        callback();
    }
}

void Session::close_socket() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

std::string Session::remote_address() const {
    return cached_address_;
}

uint16_t Session::remote_port() const {
    return cached_port_;
}

void Session::set_timeout(std::chrono::seconds timeout) {
    timeout_ = timeout;
}

void Session::reset_timeout() {
    if (stopped_) return;

    timeout_timer_.expires_after(timeout_);
    auto self = shared_from_this();
    timeout_timer_.async_wait([this, self](const boost::system::error_code& ec) {
        handle_timeout(ec);
    });
}

void Session::handle_timeout(const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted) {
        return;  // Timer was rearmed or cancelled
    }
    if (!stopped_) {
        LOG_DEBUG_FMT("Session timeout for {}:{}", cached_address_, cached_port_);
        do_stop();
    }
}

void Session::send(const std::string& data) {
    auto self = shared_from_this();
    asio::post(strand_, [this, self, data]() {
        if (stopped_) return;
        bool was_empty = write_queue_.empty();
        write_queue_.push_back(data);
        if (was_empty) {
            do_write();
        }
    });
}

void Session::send_line(const std::string& line) {
    send(line + "\r\n");
}

void Session::close_after_flush() {
    auto self = shared_from_this();
    asio::post(strand_, [this, self]() {
        if (write_queue_.empty()) {
            do_stop();
        } else {
            close_when_flushed_ = true;
        }
    });
}

void Session::pause_reading() {
    reading_paused_ = true;
    watch_for_hangup();
}

void Session::watch_for_hangup() {
    if (stopped_ || watching_hangup_ || peer_closed_) return;

    watching_hangup_ = true;
    auto self = shared_from_this();
    socket_.async_wait(tcp::socket::wait_read,
        asio::bind_executor(strand_, [this, self](const boost::system::error_code& ec) {
            watching_hangup_ = false;
            if (stopped_ || !reading_paused_) return;

            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    do_stop();
                }
                return;
            }

            // Readable with nothing to read means EOF; input still in the
            // kernel is left for resume_reading()
            boost::system::error_code avail_ec;
            std::size_t available = socket_.available(avail_ec);
            if (avail_ec) {
                do_stop();
                return;
            }
            if (available > 0) return;

            if (read_buffer_.size() > 0) {
                // Half-closed after pipelining: answer what was sent, then close
                LOG_DEBUG_FMT("{}:{} half-closed with pipelined input pending", cached_address_, cached_port_);
                peer_closed_ = true;
                return;
            }
            if (close_when_flushed_) return;

            LOG_DEBUG_FMT("{}:{} hung up while input was paused", cached_address_, cached_port_);
            do_stop();
        }));
}

void Session::resume_reading() {
    auto self = shared_from_this();
    asio::post(strand_, [this, self]() {
        reading_paused_ = false;
        if (!stopped_ && !read_in_progress_) {
            do_read();
        }
    });
}

void Session::do_read() {
    if (stopped_ || reading_paused_ || read_in_progress_) return;

    read_in_progress_ = true;
    auto self = shared_from_this();
    asio::async_read_until(
        socket_,
        read_buffer_,
        "\r\n",
        asio::bind_executor(strand_,
            [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
                handle_read(ec, bytes_transferred);
            }));
}

void Session::handle_read(const boost::system::error_code& ec, std::size_t /* bytes_transferred */) {
    read_in_progress_ = false;
    if (stopped_) return;

    if (!ec) {
        reset_timeout();

        std::istream is(&read_buffer_);
        std::string line;
        std::getline(is, line);

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        on_line(line);

        do_read();
    } else if (ec == asio::error::eof && !write_queue_.empty()) {
        // Peer finished sending; deliver the replies still queued
        peer_closed_ = true;
        close_when_flushed_ = true;
    } else {
        on_error(ec);
        do_stop();
    }
}

void Session::do_write() {
    if (stopped_ || write_queue_.empty()) return;

    auto self = shared_from_this();
    asio::async_write(
        socket_,
        asio::buffer(write_queue_.front()),
        asio::bind_executor(strand_,
            [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
                handle_write(ec, bytes_transferred);
            }));
}

void Session::handle_write(const boost::system::error_code& ec, std::size_t /* bytes_transferred */) {
    if (stopped_) return;

    if (!ec) {
        write_queue_.pop_front();
        if (!write_queue_.empty()) {
            do_write();
        } else if (close_when_flushed_) {
            do_stop();
        }
    } else {
        on_error(ec);
        do_stop();
    }
}

void Session::on_connect() {
    LOG_DEBUG_FMT("New connection from {}:{}", cached_address_, cached_port_);
}

void Session::on_line(const std::string& line) {
    on_data(line);
}

void Session::on_disconnect() {
    LOG_DEBUG_FMT("Connection closed from {}:{}", cached_address_, cached_port_);
}

void Session::on_error(const boost::system::error_code& ec) {
    if (ec == asio::error::eof || ec == asio::error::connection_reset ||
        ec == asio::error::operation_aborted) {
        return;  // Normal disconnection
    }
    if (ec == asio::error::not_found) {
        LOG_WARNING_FMT("Line too long from {}:{}, closing", cached_address_, cached_port_);
        return;
    }
    LOG_ERROR_FMT("Session error: {}", ec.message());
}

}  // namespace smsgw
