#include <catch2/catch_test_macros.hpp>
#include "smtp_server.hpp"
#include "gateway_handler.hpp"
#include "session_cache.hpp"
#include "sms_api_client.hpp"
#include "http_client.hpp"
#include "config.hpp"
#include "test_doubles.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

using namespace smsgw;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

// Helper to create a temporary directory for tests
class TempDirectory {
public:
    TempDirectory() {
        path_ = std::filesystem::temp_directory_path() / "smtp2sms_test" /
                std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Loopback HTTP endpoint standing in for the SMS provider. Serves a fixed
// number of connections, one request each.
class StubHttpServer {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using Responder = std::function<Response(const Request&)>;

    StubHttpServer(size_t connections, Responder responder)
        : acceptor_(io_, tcp::endpoint(asio::ip::address_v4::loopback(), 0))
        , responder_(std::move(responder))
        , remaining_(connections) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this] { run(); });
    }

    ~StubHttpServer() {
        // Unblock accept() if a test bailed out before using every connection
        while (!done_) {
            boost::system::error_code ec;
            tcp::socket poke(io_);
            poke.connect(tcp::endpoint(asio::ip::address_v4::loopback(), port_), ec);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        thread_.join();
    }

    std::string base_url() const {
        return "http://127.0.0.1:" + std::to_string(port_) + "/API/v1.0/REST/";
    }

    std::vector<Request> requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void run() {
        for (; remaining_ > 0; --remaining_) {
            tcp::socket socket(io_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec) break;

            beast::flat_buffer buffer;
            Request request;
            http::read(socket, buffer, request, ec);
            if (ec) continue;

            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
            }

            Response response = responder_(request);
            response.version(request.version());
            response.prepare_payload();
            http::write(socket, response, ec);
            socket.shutdown(tcp::socket::shutdown_both, ec);
        }
        done_ = true;
    }

    asio::io_context io_;
    tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    Responder responder_;
    size_t remaining_;
    std::atomic<bool> done_{false};
    std::thread thread_;

    std::mutex mutex_;
    std::vector<Request> requests_;
};

StubHttpServer::Response make_response(http::status status, std::string body) {
    StubHttpServer::Response response{status, 11};
    response.body() = std::move(body);
    return response;
}

// Blocking SMTP client for driving the listener
class SmtpClient {
public:
    explicit SmtpClient(uint16_t port) : socket_(io_) {
        socket_.connect(tcp::endpoint(asio::ip::address_v4::loopback(), port));
    }

    // Reads a possibly multi-line reply and returns its code
    int read_reply() {
        last_reply_.clear();
        for (;;) {
            asio::read_until(socket_, buffer_, "\r\n");
            std::istream stream(&buffer_);
            std::string line;
            std::getline(stream, line);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            last_reply_ += line + "\n";
            if (line.size() < 4 || line[3] != '-') {
                return line.size() >= 3 ? std::stoi(line.substr(0, 3)) : 0;
            }
        }
    }

    int command(const std::string& line) {
        send(line + "\r\n");
        return read_reply();
    }

    void send(const std::string& data) {
        asio::write(socket_, asio::buffer(data));
    }

    void close() {
        boost::system::error_code ec;
        socket_.close(ec);
    }

    void shutdown_send() {
        socket_.shutdown(tcp::socket::shutdown_send);
    }

    const std::string& last_reply() const { return last_reply_; }

private:
    asio::io_context io_;
    tcp::socket socket_;
    asio::streambuf buffer_;
    std::string last_reply_;
};

SMTPConfig loopback_smtp_config() {
    SMTPConfig config;
    config.bind_address = "127.0.0.1";
    config.port = 0;
    config.hostname = "gateway.local";
    config.local_domains = {"gateway.local"};
    config.thread_pool_size = 2;
    config.max_message_size = 4096;
    return config;
}

const std::string kOtpMessage =
    "From: portal@example.net\r\n"
    "To: 15551234567@gateway.local\r\n"
    "Subject: OTP\r\n"
    "\r\n"
    "Your code is 4821\r\n"
    ".\r\n";

}  // namespace

TEST_CASE("Configuration loading", "[integration][config]") {
    TempDirectory temp;
    auto config_path = temp.path() / "smtp2sms.conf";

    {
        std::ofstream file(config_path);
        file << "# gateway settings\n"
             << "[smtp]\n"
             << "bind_address = 127.0.0.1\n"
             << "port = 2526\n"
             << "hostname = gateway.local\n"
             << "local_domains = Gateway.Local, sms.example.com\n"
             << "max_message_size = 65536\n"
             << "\n"
             << "[sms_api]\n"
             << "base_url = https://smspanel.aruba.it/API/v1.0/REST/\n"
             << "username = portal\n"
             << "password = \"s3cret;pass\"\n"
             << "request_timeout = 5\n"
             << "\n"
             << "[gateway]\n"
             << "sender = ACME\n"
             << "message_quality = standard\n"
             << "return_credits = yes\n"
             << "session_ttl = 600\n"
             << "auth_retries = 2\n"
             << "\n"
             << "[log]\n"
             << "level = debug\n"
             << "console = false\n";
    }

    auto& config = Config::instance();
    config.reset();
    REQUIRE(config.load(config_path));

    SECTION("SMTP configuration") {
        REQUIRE(config.smtp().bind_address == "127.0.0.1");
        REQUIRE(config.smtp().port == 2526);
        REQUIRE(config.smtp().hostname == "gateway.local");
        std::vector<std::string> domains = {"gateway.local", "sms.example.com"};
        REQUIRE(config.smtp().local_domains == domains);
        REQUIRE(config.smtp().max_message_size == 65536);
    }

    SECTION("SMS API configuration") {
        REQUIRE(config.sms_api().base_url == "https://smspanel.aruba.it/API/v1.0/REST/");
        REQUIRE(config.sms_api().username == "portal");
        REQUIRE(config.sms_api().password == "s3cret;pass");
        REQUIRE(config.sms_api().request_timeout == std::chrono::seconds(5));
        REQUIRE(config.sms_api().verify_peer);
    }

    SECTION("Gateway configuration") {
        REQUIRE(config.gateway().sender == "ACME");
        REQUIRE(config.gateway().quality == MessageQuality::Standard);
        REQUIRE(config.gateway().return_credits);
        REQUIRE(config.gateway().session_ttl == std::chrono::seconds(600));
        REQUIRE(config.gateway().auth_retries == 2);
    }

    SECTION("Log configuration") {
        REQUIRE(config.log().level == LogConfig::Level::Debug);
        REQUIRE_FALSE(config.log().log_to_console);
    }

    SECTION("Complete configuration validates") {
        REQUIRE(config.validate().empty());
    }

    config.reset();
}

TEST_CASE("Configuration validation", "[integration][config]") {
    auto& config = Config::instance();
    config.reset();

    SECTION("Defaults lack credentials") {
        auto problems = config.validate();
        REQUIRE(problems.size() == 2);
    }

    SECTION("Unknown quality and bad URL are reported") {
        REQUIRE(config.load_from_string(
            "[api]\n"
            "url = ftp://example.com/\n"
            "username = u\n"
            "password = p\n"
            "[gateway]\n"
            "quality = premium\n"));
        auto problems = config.validate();
        REQUIRE(problems.size() == 2);
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(config.load("/nonexistent/smtp2sms.conf"));
    }

    SECTION("Missing optional file keeps the defaults") {
        REQUIRE(config.load_if_present("/nonexistent/smtp2sms.conf"));
        REQUIRE(config.smtp().port == 2525);
        REQUIRE(config.gateway().sender == "ACME");
    }

    SECTION("Zero message length means no limit") {
        REQUIRE(config.load_from_string(
            "[sms_api]\n"
            "username = u\n"
            "password = p\n"
            "[gateway]\n"
            "max_message_length = 0\n"));
        REQUIRE(config.gateway().max_message_length == 0);
        REQUIRE(config.validate().empty());
    }

    config.reset();
}

TEST_CASE("SMTP conversation delivers an SMS", "[integration][flow]") {
    auto api = std::make_shared<gateway::testing::StubSmsApi>();
    auto sessions = std::make_shared<gateway::SessionCache>(api, "portal", "secret", std::chrono::seconds(3600));
    auto handler = std::make_shared<gateway::GatewayHandler>(api, sessions, GatewayConfig{});

    smtp::SMTPServer server(loopback_smtp_config(), handler, 2);
    server.start();
    REQUIRE(server.port() != 0);

    SmtpClient client(server.port());
    REQUIRE(client.read_reply() == 220);

    SECTION("One-time code") {
        REQUIRE(client.command("EHLO portal.example.net") == 250);
        REQUIRE(client.command("MAIL FROM:<portal@example.net>") == 250);
        REQUIRE(client.command("RCPT TO:<15551234567@gateway.local>") == 250);
        REQUIRE(client.command("DATA") == 354);

        client.send(kOtpMessage);
        REQUIRE(client.read_reply() == 250);
        REQUIRE(client.last_reply() == "250 OK\n");

        REQUIRE(client.command("QUIT") == 221);

        REQUIRE(api->sent.size() == 1);
        REQUIRE(api->sent.front().recipient == "15551234567");
        REQUIRE(api->sent.front().message == "Your code is 4821");
        REQUIRE(api->sent.front().sender == "ACME");
    }

    SECTION("Two transactions on one connection share the session") {
        REQUIRE(client.command("HELO portal") == 250);
        for (int i = 0; i < 2; ++i) {
            REQUIRE(client.command("MAIL FROM:<portal@example.net>") == 250);
            REQUIRE(client.command("RCPT TO:<15551234567@gateway.local>") == 250);
            REQUIRE(client.command("DATA") == 354);
            client.send(kOtpMessage);
            REQUIRE(client.read_reply() == 250);
        }
        REQUIRE(api->sent.size() == 2);
        REQUIRE(api->login_calls == 1);
    }

    SECTION("Invalid recipient is rejected after DATA") {
        REQUIRE(client.command("HELO portal") == 250);
        REQUIRE(client.command("MAIL FROM:<portal@example.net>") == 250);
        REQUIRE(client.command("RCPT TO:<alice@gateway.local>") == 250);
        REQUIRE(client.command("DATA") == 354);
        client.send(kOtpMessage);
        REQUIRE(client.read_reply() == 550);
        REQUIRE(api->sent.empty());

        // The session is usable again after a rejection
        REQUIRE(client.command("NOOP") == 250);
    }

    SECTION("Foreign domains are not relayed") {
        REQUIRE(client.command("HELO portal") == 250);
        REQUIRE(client.command("MAIL FROM:<portal@example.net>") == 250);
        REQUIRE(client.command("RCPT TO:<15551234567@elsewhere.example>") == 550);
    }

    SECTION("Command sequence is enforced") {
        REQUIRE(client.command("MAIL FROM:<portal@example.net>") == 503);
        REQUIRE(client.command("HELO portal") == 250);
        REQUIRE(client.command("DATA") == 503);
        REQUIRE(client.command("BOGUS") == 500);
    }

    SECTION("Oversized message") {
        REQUIRE(client.command("HELO portal") == 250);
        REQUIRE(client.command("MAIL FROM:<portal@example.net>") == 250);
        REQUIRE(client.command("RCPT TO:<15551234567@gateway.local>") == 250);
        REQUIRE(client.command("DATA") == 354);
        std::string line(100, 'x');
        for (int i = 0; i < 60; ++i) {
            client.send(line + "\r\n");
        }
        client.send(".\r\n");
        REQUIRE(client.read_reply() == 552);
        REQUIRE(api->sent.empty());
    }

    SECTION("Pipelined client that half-closes still gets every reply") {
        api->login_delay = std::chrono::milliseconds(300);
        client.send("EHLO portal.example.net\r\n"
                    "MAIL FROM:<portal@example.net>\r\n"
                    "RCPT TO:<15551234567@gateway.local>\r\n"
                    "DATA\r\n" +
                    kOtpMessage +
                    "QUIT\r\n");
        client.shutdown_send();

        REQUIRE(client.read_reply() == 250);
        REQUIRE(client.read_reply() == 250);
        REQUIRE(client.read_reply() == 250);
        REQUIRE(client.read_reply() == 354);
        REQUIRE(client.read_reply() == 250);
        REQUIRE(client.last_reply() == "250 OK\n");
        REQUIRE(client.read_reply() == 221);

        REQUIRE(api->sent.size() == 1);
        REQUIRE(api->sent.front().message == "Your code is 4821");
    }

    SECTION("Client leaving mid-transaction does not disturb the listener") {
        api->login_delay = std::chrono::milliseconds(300);
        REQUIRE(client.command("HELO portal") == 250);
        REQUIRE(client.command("MAIL FROM:<portal@example.net>") == 250);
        REQUIRE(client.command("RCPT TO:<15551234567@gateway.local>") == 250);
        REQUIRE(client.command("DATA") == 354);
        client.send(kOtpMessage);
        client.close();

        // The abandoned login is not shared with the next client
        SmtpClient second(server.port());
        REQUIRE(second.read_reply() == 220);
        REQUIRE(second.command("HELO portal") == 250);
        REQUIRE(second.command("MAIL FROM:<portal@example.net>") == 250);
        REQUIRE(second.command("RCPT TO:<15551234567@gateway.local>") == 250);
        REQUIRE(second.command("DATA") == 354);
        second.send(kOtpMessage);
        REQUIRE(second.read_reply() == 250);
    }

    server.stop();
}

TEST_CASE("Gateway against a loopback HTTP provider", "[integration][http]") {
    CancellationToken cancel;

    SECTION("Login and submit over HTTP") {
        StubHttpServer provider(2, [](const StubHttpServer::Request& request) {
            std::string target(request.target());
            if (target.rfind("/API/v1.0/REST/login", 0) == 0) {
                return make_response(http::status::ok, "UK1;SK1");
            }
            return make_response(http::status::created, R"({"result":"OK","order_id":"ORD-9"})");
        });

        auto transport = std::make_shared<gateway::HttpClient>(std::chrono::seconds(5), nullptr);
        auto api = std::make_shared<gateway::SmsApiClient>(provider.base_url(), transport);
        auto sessions = std::make_shared<gateway::SessionCache>(api, "portal", "p w", std::chrono::seconds(3600));
        gateway::GatewayHandler handler(api, sessions, GatewayConfig{});

        smtp::MailTransaction transaction;
        transaction.peer = "127.0.0.1:1";
        transaction.mail_from = "portal@example.net";
        transaction.rcpt_to = {"15551234567@gateway.local"};
        transaction.data = "Subject: OTP\r\n\r\nYour code is 4821\r\n";

        auto reply = handler.handle(transaction, cancel);
        REQUIRE(reply.code == 250);
        REQUIRE(reply.message == "OK ORD-9");

        auto requests = provider.requests();
        REQUIRE(requests.size() == 2);

        REQUIRE(requests[0].method() == http::verb::get);
        REQUIRE(std::string(requests[0].target()) == "/API/v1.0/REST/login?username=portal&password=p%20w");

        REQUIRE(requests[1].method() == http::verb::post);
        REQUIRE(std::string(requests[1].target()) == "/API/v1.0/REST/sms");
        REQUIRE(std::string(requests[1]["user_key"]) == "UK1");
        REQUIRE(std::string(requests[1]["Session_key"]) == "SK1");
        REQUIRE(std::string(requests[1][http::field::content_type]) == "application/json");
        REQUIRE(requests[1].body() ==
                R"({"message":"Your code is 4821","message_type":"N","returnCredits":false,)"
                R"("recipient":["15551234567"],"sender":"ACME"})");
    }

    SECTION("Slow provider times out") {
        StubHttpServer provider(1, [](const StubHttpServer::Request&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(800));
            return make_response(http::status::ok, "UK1;SK1");
        });

        gateway::HttpClient client(std::chrono::milliseconds(200), nullptr);
        gateway::HttpRequest request;
        request.url = provider.base_url() + "login";

        auto started = std::chrono::steady_clock::now();
        auto response = client.perform(request, cancel);
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE_FALSE(response.success);
        REQUIRE(response.error == "timeout");
        REQUIRE(elapsed < std::chrono::milliseconds(700));
    }

    SECTION("Cancellation aborts an in-flight call") {
        StubHttpServer provider(1, [](const StubHttpServer::Request&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(800));
            return make_response(http::status::ok, "UK1;SK1");
        });

        gateway::HttpClient client(std::chrono::seconds(5), nullptr);
        gateway::HttpRequest request;
        request.url = provider.base_url() + "login";

        CancellationToken abort;
        std::thread canceller([abort]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
            abort.cancel();
        });

        auto response = client.perform(request, abort);
        canceller.join();

        REQUIRE_FALSE(response.success);
        REQUIRE(response.error == "cancelled");
    }

    SECTION("Connection refused is a transport error") {
        uint16_t closed_port = 0;
        {
            asio::io_context io;
            tcp::acceptor reserved(io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
            closed_port = reserved.local_endpoint().port();
        }

        gateway::HttpClient client(std::chrono::seconds(2), nullptr);
        gateway::HttpRequest request;
        request.url = "http://127.0.0.1:" + std::to_string(closed_port) + "/login";

        auto response = client.perform(request, cancel);
        REQUIRE_FALSE(response.success);
        REQUIRE(response.error.rfind("connect", 0) == 0);
    }
}
