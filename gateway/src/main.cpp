#include "smtp_server.hpp"
#include "gateway_handler.hpp"
#include "session_cache.hpp"
#include "sms_api_client.hpp"
#include "http_client.hpp"
#include "ssl_context.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>

namespace {
    std::atomic<bool> g_running{true};
}

void signal_handler(int) {
    g_running = false;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>    Configuration file path\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n";
}

int main(int argc, char* argv[]) {
    std::string config_file = "/etc/smtp2sms/smtp2sms.conf";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "smtp2sms v1.0.0\n";
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Console only until the configured sinks are known
    smsgw::Logger::instance().init(smsgw::LogLevel::Info, true);

    auto& config = smsgw::Config::instance();
    if (!config.load_if_present(config_file)) {
        LOG_FATAL_FMT("Could not load config file: {}", config_file);
        return 1;
    }

    smsgw::Logger::instance().init(config.log());
    LOG_INFO("smtp2sms starting...");

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            LOG_FATAL_FMT("Configuration error: {}", problem);
        }
        return 1;
    }

    const auto& api_config = config.sms_api();

    std::shared_ptr<smsgw::SSLContext> tls;
    if (api_config.base_url.rfind("https://", 0) == 0) {
        tls = std::make_shared<smsgw::SSLContext>(
            smsgw::SSLContext::create_client_context(api_config.ca_file, api_config.verify_peer));
        if (!tls->is_initialized()) {
            LOG_FATAL_FMT("TLS setup failed: {}", tls->last_error());
            return 1;
        }
    }

    auto transport = std::make_shared<smsgw::gateway::HttpClient>(
        std::chrono::duration_cast<std::chrono::milliseconds>(api_config.request_timeout), tls);
    auto api = std::make_shared<smsgw::gateway::SmsApiClient>(api_config.base_url, transport);
    auto sessions = std::make_shared<smsgw::gateway::SessionCache>(
        api, api_config.username, api_config.password, config.gateway().session_ttl);
    auto handler = std::make_shared<smsgw::gateway::GatewayHandler>(api, sessions, config.gateway());

    smsgw::smtp::SMTPServer server(config.smtp(), handler, config.gateway().worker_threads);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        server.start();
        LOG_INFO_FMT("Forwarding mail on port {} to {}", server.port(), api_config.base_url);

        while (g_running && server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    } catch (const std::exception& e) {
        LOG_FATAL_FMT("Server error: {}", e.what());
        return 1;
    }

    LOG_INFO("Shutting down...");
    server.stop();
    LOG_INFO("smtp2sms shutdown complete");
    return 0;
}
