#include "config.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace smsgw {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool to_bool(const std::string& v) {
    std::string lower = to_lower(v);
    return lower == "true" || lower == "yes" || lower == "1" || lower == "on";
}

int64_t to_int(const std::string& v) {
    try {
        return std::stoll(v);
    } catch (const std::exception&) {
        return 0;
    }
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(to_lower(item));
        }
    }
    return items;
}

}  // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::filesystem::path& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

bool Config::load_if_present(const std::filesystem::path& config_file) {
    std::error_code ec;
    if (!std::filesystem::exists(config_file, ec) && !ec) {
        LOG_WARNING_FMT("Config file {} not found, using defaults", config_file.string());
        return true;
    }
    return load(config_file);
}

bool Config::load_from_string(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    std::string current_section;

    while (std::getline(stream, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = to_lower(trim(line.substr(1, line.length() - 2)));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = to_lower(trim(line.substr(0, eq_pos)));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from value
        if (value.length() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        parse_section(current_section, key, value);
    }

    return true;
}

void Config::reset() {
    log_ = LogConfig{};
    smtp_ = SMTPConfig{};
    sms_api_ = SmsApiConfig{};
    gateway_ = GatewayConfig{};
    errors_.clear();
    custom_values_.clear();
}

void Config::parse_section(const std::string& section, const std::string& key,
                           const std::string& value) {
    if (section == "log" || section == "logging") {
        if (key == "level") {
            std::string level = to_lower(value);
            if (level == "trace") log_.level = LogConfig::Level::Trace;
            else if (level == "debug") log_.level = LogConfig::Level::Debug;
            else if (level == "info") log_.level = LogConfig::Level::Info;
            else if (level == "warning" || level == "warn") log_.level = LogConfig::Level::Warning;
            else if (level == "error") log_.level = LogConfig::Level::Error;
            else if (level == "fatal") log_.level = LogConfig::Level::Fatal;
        } else if (key == "file") {
            log_.file = value;
            log_.log_to_file = !value.empty();
        } else if (key == "console") {
            log_.log_to_console = to_bool(value);
        } else if (key == "max_file_size") {
            log_.max_file_size = static_cast<size_t>(to_int(value));
        } else if (key == "max_files") {
            log_.max_files = static_cast<size_t>(to_int(value));
        }
    } else if (section == "smtp") {
        if (key == "bind_address" || key == "address") {
            smtp_.bind_address = value;
        } else if (key == "port") {
            smtp_.port = static_cast<uint16_t>(to_int(value));
        } else if (key == "hostname") {
            smtp_.hostname = value;
        } else if (key == "max_connections") {
            smtp_.max_connections = static_cast<size_t>(to_int(value));
        } else if (key == "max_message_size") {
            smtp_.max_message_size = static_cast<size_t>(to_int(value));
        } else if (key == "max_recipients") {
            smtp_.max_recipients = static_cast<size_t>(to_int(value));
        } else if (key == "thread_pool_size" || key == "threads") {
            smtp_.thread_pool_size = static_cast<size_t>(std::max<int64_t>(1, to_int(value)));
        } else if (key == "connection_timeout") {
            smtp_.connection_timeout = std::chrono::seconds(to_int(value));
        } else if (key == "local_domains") {
            smtp_.local_domains = split_list(value);
        }
    } else if (section == "sms_api" || section == "api") {
        if (key == "base_url" || key == "url") {
            sms_api_.base_url = value;
        } else if (key == "username") {
            sms_api_.username = value;
        } else if (key == "password") {
            sms_api_.password = value;
        } else if (key == "request_timeout" || key == "timeout") {
            sms_api_.request_timeout = std::chrono::seconds(to_int(value));
        } else if (key == "ca_file") {
            sms_api_.ca_file = value;
        } else if (key == "verify_peer") {
            sms_api_.verify_peer = to_bool(value);
        }
    } else if (section == "gateway") {
        if (key == "sender") {
            gateway_.sender = value;
        } else if (key == "message_quality" || key == "quality") {
            std::string quality = to_lower(value);
            if (quality == "high" || quality == "n") {
                gateway_.quality = MessageQuality::High;
            } else if (quality == "standard" || quality == "l") {
                gateway_.quality = MessageQuality::Standard;
            } else {
                errors_.push_back("gateway.message_quality: unknown value '" + value + "'");
            }
        } else if (key == "return_credits") {
            gateway_.return_credits = to_bool(value);
        } else if (key == "session_ttl") {
            gateway_.session_ttl = std::chrono::seconds(std::max<int64_t>(0, to_int(value)));
        } else if (key == "auth_retries") {
            gateway_.auth_retries = static_cast<int>(std::max<int64_t>(0, to_int(value)));
        } else if (key == "max_message_length") {
            gateway_.max_message_length = static_cast<size_t>(to_int(value));
        } else if (key == "worker_threads") {
            gateway_.worker_threads = static_cast<size_t>(std::max<int64_t>(1, to_int(value)));
        }
    } else {
        // Store in custom values
        std::string full_key = section.empty() ? key : section + "." + key;
        custom_values_[full_key] = value;
    }
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems = errors_;

    const auto& url = sms_api_.base_url;
    if (url.empty()) {
        problems.push_back("sms_api.base_url is not set");
    } else if (url.rfind("https://", 0) != 0 && url.rfind("http://", 0) != 0) {
        problems.push_back("sms_api.base_url must start with http:// or https://");
    }
    if (sms_api_.username.empty()) {
        problems.push_back("sms_api.username is not set");
    }
    if (sms_api_.password.empty()) {
        problems.push_back("sms_api.password is not set");
    }
    if (sms_api_.request_timeout.count() <= 0) {
        problems.push_back("sms_api.request_timeout must be positive");
    }
    if (gateway_.sender.empty()) {
        problems.push_back("gateway.sender is not set");
    }

    return problems;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = custom_values_.find(key);
    if (it != custom_values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void Config::set(const std::string& key, const std::string& value) {
    custom_values_[key] = value;
}

}  // namespace smsgw
