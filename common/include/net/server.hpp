#pragma once

#include <memory>
#include <string>
#include <vector>
#include <thread>
#include <atomic>
#include <functional>
#include <set>
#include <mutex>
#include <type_traits>
#include <utility>
#include <boost/asio.hpp>

#include "session.hpp"
#include "logger.hpp"

namespace smsgw {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

template<typename SessionType>
class Server {
public:
    Server(const std::string& name, const std::string& bind_address,
           uint16_t port, size_t thread_count = 4);

    virtual ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds and listens; throws boost::system::system_error when the
    // endpoint cannot be bound.
    void start();
    void stop();

    bool is_running() const { return running_; }
    size_t connection_count() const;

    // Actual listening port, useful when bound to port 0
    uint16_t local_port() const { return local_port_; }

    void set_max_connections(size_t max) { max_connections_ = max; }
    void set_connection_timeout(std::chrono::seconds timeout) { connection_timeout_ = timeout; }

    // Callback for session creation customization
    using SessionFactory = std::function<std::shared_ptr<SessionType>(
        asio::io_context&, tcp::socket)>;
    void set_session_factory(SessionFactory factory) { session_factory_ = std::move(factory); }

protected:
    virtual std::shared_ptr<SessionType> create_session(
        asio::io_context& io_ctx, tcp::socket socket);

    virtual void on_session_start(std::shared_ptr<SessionType> session);
    virtual void on_session_end(std::shared_ptr<SessionType> session);

private:
    void do_accept();
    void remove_session(const std::shared_ptr<SessionType>& session);

    std::string name_;
    std::string bind_address_;
    uint16_t port_;
    uint16_t local_port_ = 0;

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;

    std::atomic<bool> running_{false};
    size_t thread_count_;
    size_t max_connections_ = 1000;
    std::chrono::seconds connection_timeout_{300};

    std::set<std::shared_ptr<SessionType>> sessions_;
    mutable std::mutex sessions_mutex_;

    SessionFactory session_factory_;
};

// Template implementation

template<typename SessionType>
Server<SessionType>::Server(const std::string& name, const std::string& bind_address,
                            uint16_t port, size_t thread_count)
    : name_(name)
    , bind_address_(bind_address)
    , port_(port)
    , acceptor_(io_context_)
    , thread_count_(thread_count == 0 ? 1 : thread_count) {
}

template<typename SessionType>
Server<SessionType>::~Server() {
    stop();
}

template<typename SessionType>
void Server<SessionType>::start() {
    if (running_) return;

    tcp::endpoint endpoint(asio::ip::make_address(bind_address_), port_);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    local_port_ = acceptor_.local_endpoint().port();

    running_ = true;
    do_accept();

    for (size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this]() {
            io_context_.run();
        });
    }

    LOG_INFO_FMT("{} listening on {}:{}", name_, bind_address_, local_port_);
}

template<typename SessionType>
void Server<SessionType>::stop() {
    if (!running_.exchange(false)) return;

    asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });

    std::set<std::shared_ptr<SessionType>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    for (auto& session : sessions) {
        session->stop();
    }
    sessions.clear();

    // Threads return once the acceptor and every session have wound down
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    LOG_INFO_FMT("{} stopped", name_);
}

template<typename SessionType>
size_t Server<SessionType>::connection_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

template<typename SessionType>
void Server<SessionType>::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !running_) {
                return;
            }

            if (ec) {
                LOG_WARNING_FMT("{} accept failed: {}", name_, ec.message());
            } else if (connection_count() >= max_connections_) {
                LOG_WARNING_FMT("{} connection limit ({}) reached, dropping client",
                                name_, max_connections_);
                boost::system::error_code ignored;
                socket.close(ignored);
            } else if (auto session = create_session(io_context_, std::move(socket))) {
                {
                    std::lock_guard<std::mutex> lock(sessions_mutex_);
                    sessions_.insert(session);
                }
                std::weak_ptr<SessionType> weak = session;
                session->set_close_callback([this, weak]() {
                    if (auto closed = weak.lock()) {
                        on_session_end(closed);
                    }
                });
                session->set_timeout(connection_timeout_);
                on_session_start(session);
                session->start();
            }

            if (running_) {
                do_accept();
            }
        });
}

template<typename SessionType>
std::shared_ptr<SessionType> Server<SessionType>::create_session(
    asio::io_context& io_ctx, tcp::socket socket) {
    if (session_factory_) {
        return session_factory_(io_ctx, std::move(socket));
    }
    if constexpr (std::is_constructible_v<SessionType, asio::io_context&, tcp::socket>) {
        return std::make_shared<SessionType>(io_ctx, std::move(socket));
    } else {
        LOG_ERROR_FMT("{} has no session factory", name_);
        return nullptr;
    }
}

template<typename SessionType>
void Server<SessionType>::on_session_start(std::shared_ptr<SessionType> /* session */) {
    // Override in derived class if needed
}

template<typename SessionType>
void Server<SessionType>::on_session_end(std::shared_ptr<SessionType> session) {
    remove_session(session);
}

template<typename SessionType>
void Server<SessionType>::remove_session(const std::shared_ptr<SessionType>& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session);
}

}  // namespace smsgw
