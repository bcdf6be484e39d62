#pragma once

#include <string>
#include <chrono>
#include <filesystem>
#include <optional>
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace smsgw {

struct LogConfig {
    enum class Level { Trace, Debug, Info, Warning, Error, Fatal };
    Level level = Level::Info;
    std::filesystem::path file;
    bool log_to_console = true;
    bool log_to_file = false;
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

struct SMTPConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 2525;
    std::string hostname = "localhost";
    std::vector<std::string> local_domains;
    size_t max_connections = 100;
    size_t max_message_size = 1024 * 1024;  // 1 MB
    size_t max_recipients = 100;
    size_t thread_pool_size = 2;
    std::chrono::seconds connection_timeout{300};
};

struct SmsApiConfig {
    std::string base_url = "https://smspanel.aruba.it/API/v1.0/REST/";
    std::string username;
    std::string password;
    std::chrono::seconds request_timeout{10};
    std::filesystem::path ca_file;
    bool verify_peer = true;
};

enum class MessageQuality {
    High,       // message_type "N"
    Standard    // message_type "L"
};

struct GatewayConfig {
    std::string sender = "ACME";
    MessageQuality quality = MessageQuality::High;
    bool return_credits = false;
    std::chrono::seconds session_ttl{3600};  // 0 = no age limit
    int auth_retries = 1;
    size_t max_message_length = 1000;  // code points
    size_t worker_threads = 4;
};

class Config {
public:
    static Config& instance();

    bool load(const std::filesystem::path& config_file);
    // Like load(), but a file that does not exist leaves the defaults in place
    bool load_if_present(const std::filesystem::path& config_file);
    bool load_from_string(const std::string& content);

    // Restores every section to its defaults
    void reset();

    // Problems that prevent the gateway from starting; empty when usable
    std::vector<std::string> validate() const;

    const LogConfig& log() const { return log_; }
    const SMTPConfig& smtp() const { return smtp_; }
    const SmsApiConfig& sms_api() const { return sms_api_; }
    const GatewayConfig& gateway() const { return gateway_; }

    LogConfig& log() { return log_; }
    SMTPConfig& smtp() { return smtp_; }
    SmsApiConfig& sms_api() { return sms_api_; }
    GatewayConfig& gateway() { return gateway_; }

    std::optional<std::string> get(const std::string& key) const;
    void set(const std::string& key, const std::string& value);

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void parse_section(const std::string& section, const std::string& key, const std::string& value);

    LogConfig log_;
    SMTPConfig smtp_;
    SmsApiConfig sms_api_;
    GatewayConfig gateway_;
    std::vector<std::string> errors_;

    std::unordered_map<std::string, std::string> custom_values_;
};

}  // namespace smsgw
