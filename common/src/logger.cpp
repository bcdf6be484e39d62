#include "logger.hpp"
#include "config.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace smsgw {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(LogLevel level, bool console, const std::filesystem::path& file,
                  size_t max_file_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);

    level_ = level;
    console_ = console;
    max_file_size_ = max_file_size;
    max_files_ = max_files;

    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    log_file_.clear();
    current_size_ = 0;

    if (!file.empty()) {
        log_file_ = file;
        std::error_code ec;
        if (auto parent = file.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        file_stream_.open(file, std::ios::app);
        if (file_stream_.is_open()) {
            current_size_ = std::filesystem::file_size(file, ec);
            if (ec) current_size_ = 0;
        } else {
            std::cerr << "Cannot open log file " << file.string() << ", logging to console\n";
            console_ = true;
        }
    }
}

void Logger::init(const LogConfig& config) {
    LogLevel level = LogLevel::Info;
    switch (config.level) {
        case LogConfig::Level::Trace:   level = LogLevel::Trace; break;
        case LogConfig::Level::Debug:   level = LogLevel::Debug; break;
        case LogConfig::Level::Info:    level = LogLevel::Info; break;
        case LogConfig::Level::Warning: level = LogLevel::Warning; break;
        case LogConfig::Level::Error:   level = LogLevel::Error; break;
        case LogConfig::Level::Fatal:   level = LogLevel::Fatal; break;
    }

    init(level,
         config.log_to_console,
         config.log_to_file ? config.file : std::filesystem::path{},
         config.max_file_size,
         config.max_files);
}

void Logger::trace(std::string_view msg, const std::source_location& loc) {
    emit(LogLevel::Trace, msg, loc);
}

void Logger::debug(std::string_view msg, const std::source_location& loc) {
    emit(LogLevel::Debug, msg, loc);
}

void Logger::info(std::string_view msg, const std::source_location& loc) {
    emit(LogLevel::Info, msg, loc);
}

void Logger::warning(std::string_view msg, const std::source_location& loc) {
    emit(LogLevel::Warning, msg, loc);
}

void Logger::error(std::string_view msg, const std::source_location& loc) {
    emit(LogLevel::Error, msg, loc);
}

void Logger::fatal(std::string_view msg, const std::source_location& loc) {
    emit(LogLevel::Fatal, msg, loc);
}

void Logger::emit(LogLevel level, std::string_view msg, const std::source_location& loc) {
    if (level >= level_) {
        write(level, loc, std::string(msg));
    }
}

void Logger::write(LogLevel level, const std::source_location& loc, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string filename = std::filesystem::path(loc.file_name()).filename().string();

    std::string formatted = std::format("[{}] [{}] [{}:{}] {}",
                                        get_timestamp(), level_to_string(level),
                                        filename, loc.line(),
                                        message);

    if (console_) {
        std::cerr << level_color(level) << formatted << "\033[0m\n";
    }

    if (file_stream_.is_open()) {
        rotate_if_needed();
        file_stream_ << formatted << "\n";
        file_stream_.flush();
        current_size_ += formatted.length() + 1;
    }
}

void Logger::rotate_if_needed() {
    if (current_size_ < max_file_size_) return;

    file_stream_.close();

    std::error_code ec;
    auto numbered = [this](size_t n) {
        std::filesystem::path p = log_file_;
        p += "." + std::to_string(n);
        return p;
    };

    // file.N-1 -> file.N ... file.1 -> file.2; the oldest falls off the end
    std::filesystem::remove(numbered(max_files_), ec);
    for (size_t i = max_files_; i > 1; --i) {
        if (std::filesystem::exists(numbered(i - 1), ec)) {
            std::filesystem::rename(numbered(i - 1), numbered(i), ec);
        }
    }
    std::filesystem::rename(log_file_, numbered(1), ec);

    file_stream_.open(log_file_, std::ios::app);
    current_size_ = 0;
}

const char* Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO ";
        case LogLevel::Warning: return "WARN ";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

const char* Logger::level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return "\033[90m";  // Gray
        case LogLevel::Debug:   return "\033[36m";  // Cyan
        case LogLevel::Info:    return "\033[32m";  // Green
        case LogLevel::Warning: return "\033[33m";  // Yellow
        case LogLevel::Error:   return "\033[31m";  // Red
        case LogLevel::Fatal:   return "\033[35m";  // Magenta
    }
    return "";
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

}  // namespace smsgw
