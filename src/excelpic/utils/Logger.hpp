#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstddef>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace excelpic {

/**
 * @brief 进程级日志器
 *
 * 每行格式: [时间戳] [日志器名称] [等级] 消息
 * 未调用 initialize() 之前所有日志都会被丢弃。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式
        APPEND = 1     // 追加模式（默认）
    };

    static constexpr size_t kDefaultMaxFileSize = 50 * 1024 * 1024;
    static constexpr size_t kDefaultMaxFiles = 3;

    static Logger& getInstance();

    /**
     * @brief 配置文件输出
     * @param log_file_path 日志文件路径，目录不存在时自动创建
     * @param level 最低输出等级
     * @param enable_console 是否同时输出到标准错误
     * @param max_file_size 单个文件大小上限，超过后轮转
     * @param max_files 保留的轮转文件个数
     * @return 文件是否成功打开
     */
    bool initialize(const std::string& log_file_path,
                    Level level = Level::INFO,
                    bool enable_console = false,
                    size_t max_file_size = kDefaultMaxFileSize,
                    size_t max_files = kDefaultMaxFiles,
                    WriteMode write_mode = WriteMode::APPEND);

    void setLevel(Level level);
    Level getLevel() const;

    bool isInitialized() const { return initialized_.load(); }
    const std::string& getFilePath() const { return log_file_path_; }

    void log(Level level, const char* name, const std::string& message);

    template<typename... Args>
    inline void logf(Level level, const char* name, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) {
            return;
        }
        std::string message;
        try {
            message = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error&) {
            message = fmt_str;
        }
        log(level, name, message);
    }

    void flush();
    void shutdown();

    static Level parseLevel(const std::string& text, Level fallback = Level::INFO);
    static const char* levelToString(Level level);

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void write_line(const std::string& line);
    std::string format_message(Level level, const char* name, const std::string& message) const;
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = kDefaultMaxFileSize;
    size_t max_files_ = kDefaultMaxFiles;
};

} // namespace excelpic

#define EXCELPIC_LOG(level, name, fmt, ...) \
    excelpic::Logger::getInstance().logf(excelpic::Logger::Level::level, name, fmt, ##__VA_ARGS__)

#define EXCELPIC_LOG_TRACE(name, fmt, ...)    EXCELPIC_LOG(TRACE, name, fmt, ##__VA_ARGS__)
#define EXCELPIC_LOG_DEBUG(name, fmt, ...)    EXCELPIC_LOG(DEBUG, name, fmt, ##__VA_ARGS__)
#define EXCELPIC_LOG_INFO(name, fmt, ...)     EXCELPIC_LOG(INFO, name, fmt, ##__VA_ARGS__)
#define EXCELPIC_LOG_WARN(name, fmt, ...)     EXCELPIC_LOG(WARN, name, fmt, ##__VA_ARGS__)
#define EXCELPIC_LOG_ERROR(name, fmt, ...)    EXCELPIC_LOG(ERROR, name, fmt, ##__VA_ARGS__)
#define EXCELPIC_LOG_CRITICAL(name, fmt, ...) EXCELPIC_LOG(CRITICAL, name, fmt, ##__VA_ARGS__)
