#include "Logger.hpp"
#include <filesystem>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <system_error>
#include <fmt/format.h>
#include <fmt/chrono.h>

namespace excelpic {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

bool Logger::initialize(const std::string& log_file_path,
                        Level level,
                        bool enable_console,
                        size_t max_file_size,
                        size_t max_files,
                        WriteMode write_mode) {
    std::lock_guard<std::mutex> lock(mutex_);

    // 允许重新配置：先关闭旧的文件
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }

    current_level_.store(level);
    enable_console_.store(enable_console);
    log_file_path_ = log_file_path;
    max_file_size_ = max_file_size;
    max_files_ = std::max<size_t>(1, max_files);

    // 创建日志目录
    std::error_code ec;
    std::filesystem::path log_dir = std::filesystem::path(log_file_path_).parent_path();
    if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            std::cerr << "Logger initialization failed: cannot create " << log_dir.string()
                      << ": " << ec.message() << std::endl;
            initialized_.store(false);
            return false;
        }
    }

    std::ios::openmode open_mode = (write_mode == WriteMode::APPEND) ?
                                   (std::ios::out | std::ios::app) :
                                   (std::ios::out | std::ios::trunc);
    file_stream_.open(log_file_path_, open_mode);
    if (!file_stream_.is_open()) {
        std::cerr << "Logger initialization failed: cannot open " << log_file_path_ << std::endl;
        initialized_.store(false);
        return false;
    }

    if (write_mode == WriteMode::APPEND) {
        file_stream_.seekp(0, std::ios::end);
        current_file_size_ = static_cast<size_t>(file_stream_.tellp());
    } else {
        current_file_size_ = 0;
    }

    initialized_.store(true);
    return true;
}

void Logger::setLevel(Level level) {
    current_level_.store(level);
}

Logger::Level Logger::getLevel() const {
    return current_level_.load();
}

bool Logger::should_log(Level level) const {
    // 未配置输出时直接丢弃
    return initialized_.load() &&
           level != Level::OFF &&
           static_cast<int>(level) >= static_cast<int>(current_level_.load());
}

void Logger::log(Level level, const char* name, const std::string& message) {
    if (!should_log(level)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_.load()) return;

    write_line(format_message(level, name, message));

    if (level >= Level::WARN) {
        file_stream_.flush();
    }
}

void Logger::write_line(const std::string& line) {
    if (enable_console_.load()) {
        std::cerr << line << std::endl;
    }

    if (!file_stream_.is_open()) {
        return;
    }

    rotate_file_if_needed();

    file_stream_ << line << '\n';
    current_file_size_ += line.length() + 1;
}

void Logger::rotate_file_if_needed() {
    if (current_file_size_ < max_file_size_) {
        return;
    }

    file_stream_.close();

    std::error_code ec;
    for (size_t i = max_files_; i > 1; --i) {
        std::string old_file = get_rotated_filename(i - 1);
        if (std::filesystem::exists(old_file, ec)) {
            std::filesystem::rename(old_file, get_rotated_filename(i), ec);
        }
    }

    // 将当前文件重命名为 .1
    if (std::filesystem::exists(log_file_path_, ec)) {
        std::filesystem::rename(log_file_path_, get_rotated_filename(1), ec);
    }

    file_stream_.open(log_file_path_, std::ios::out | std::ios::trunc);
    current_file_size_ = 0;
}

std::string Logger::get_rotated_filename(size_t index) const {
    if (index == 0) {
        return log_file_path_;
    }
    return fmt::format("{}.{}", log_file_path_, index);
}

std::string Logger::format_message(Level level, const char* name, const std::string& message) const {
    return fmt::format("[{}] [{}] [{}] {}",
                       get_timestamp(),
                       name ? name : "excelpic",
                       levelToString(level),
                       message);
}

const char* Logger::levelToString(Level level) {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO ";
        case Level::WARN:     return "WARN ";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRIT ";
        default:              return "UNKN ";
    }
}

Logger::Level Logger::parseLevel(const std::string& text, Level fallback) {
    std::string lvl = text;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (lvl == "TRACE") return Level::TRACE;
    if (lvl == "DEBUG") return Level::DEBUG;
    if (lvl == "INFO") return Level::INFO;
    if (lvl == "WARN" || lvl == "WARNING") return Level::WARN;
    if (lvl == "ERROR") return Level::ERROR;
    if (lvl == "CRITICAL" || lvl == "CRIT") return Level::CRITICAL;
    if (lvl == "OFF" || lvl == "NONE") return Level::OFF;
    return fallback;
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", now);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
    initialized_.store(false);
}

Logger::~Logger() {
    shutdown();
}

} // namespace excelpic
