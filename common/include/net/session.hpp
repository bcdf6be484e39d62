#pragma once

#include <memory>
#include <string>
#include <deque>
#include <functional>
#include <chrono>
#include <utility>
#include <boost/asio.hpp>

namespace smsgw {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Line-oriented TCP session. All socket, timer and state access happens on
// the session's strand; send() and stop() may be called from any thread.
class Session : public std::enable_shared_from_this<Session> {
public:
    using Strand = asio::strand<asio::io_context::executor_type>;

    static constexpr size_t kMaxBufferedInput = 64 * 1024;

    Session(asio::io_context& io_context, tcp::socket socket);
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    virtual void start();
    virtual void stop();

    void send(const std::string& data);
    void send_line(const std::string& line);

    // Closes the connection once everything queued by send() is written
    void close_after_flush();

    std::string remote_address() const;
    uint16_t remote_port() const;

    void set_timeout(std::chrono::seconds timeout);
    void set_close_callback(std::function<void()> callback) { close_callback_ = std::move(callback); }

protected:
    virtual void on_connect();
    virtual void on_data(const std::string& data) = 0;
    virtual void on_line(const std::string& line);
    virtual void on_disconnect();
    virtual void on_error(const boost::system::error_code& ec);

    // Stop consuming input until resume_reading(); queued input stays buffered.
    // A peer that hangs up while paused stops the session, unless it
    // half-closed with pipelined input still buffered.
    void pause_reading();
    void resume_reading();

    bool is_stopped() const { return stopped_; }
    Strand& strand() { return strand_; }

    void do_read();
    void do_write();
    void reset_timeout();
    void close_socket();

    asio::io_context& io_context_;
    Strand strand_;
    tcp::socket socket_;

    asio::streambuf read_buffer_;
    std::deque<std::string> write_queue_;

    asio::steady_timer timeout_timer_;
    std::chrono::seconds timeout_{300};

    bool stopped_ = false;
    bool reading_paused_ = false;
    bool read_in_progress_ = false;
    bool close_when_flushed_ = false;

private:
    void do_stop();
    void handle_read(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void handle_write(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void handle_timeout(const boost::system::error_code& ec);
    void watch_for_hangup();

    std::string cached_address_ = "unknown";
    uint16_t cached_port_ = 0;
    std::function<void()> close_callback_;
    bool watching_hangup_ = false;
    bool peer_closed_ = false;
};

}  // namespace smsgw
