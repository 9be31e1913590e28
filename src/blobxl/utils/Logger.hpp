#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef ERROR
#undef ERROR
#endif

namespace blobxl {

/**
 * @brief 进程级日志器
 *
 * 控制台彩色输出 + 按大小轮转的日志文件。首次写日志时若尚未初始化，
 * 使用默认参数自动初始化。
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
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "logs/blobxl.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isInitialized() const { return initialized_.load(); }

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    template<typename... Args>
    void log(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        std::string message;
        try {
            message = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error&) {
            message = fmt_str;
        }
        write(level, message);
    }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}",
            baseFilename(file), line, extractFunctionName(func), fmt_str);
        log(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

    /**
     * @brief 解析级别名称（trace/debug/info/warn/error/critical/off，大小写不敏感）
     * @return 解析成功返回 true
     */
    static bool parseLevel(const std::string& name, Level& out);

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void write(Level level, const std::string& message);
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    static std::string extractFunctionName(const char* func_sig) {
        if (!func_sig) return "";
        std::string sig(func_sig);
        size_t last_colon = sig.rfind("::");
        if (last_colon != std::string::npos) {
            sig = sig.substr(last_colon + 2);
        }
        size_t paren = sig.find('(');
        if (paren != std::string::npos) {
            sig = sig.substr(0, paren);
        }
        return sig;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    std::atomic<size_t> current_file_size_{0};
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#define BLOBXL_FUNC __func__

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define BLOBXL_LOG_TRACE(fmt, ...)    ::blobxl::Logger::getInstance().logCtx(::blobxl::Logger::Level::TRACE,    __FILE__, __LINE__, BLOBXL_FUNC, fmt, ##__VA_ARGS__)
#define BLOBXL_LOG_DEBUG(fmt, ...)    ::blobxl::Logger::getInstance().logCtx(::blobxl::Logger::Level::DEBUG,    __FILE__, __LINE__, BLOBXL_FUNC, fmt, ##__VA_ARGS__)
#define BLOBXL_LOG_INFO(fmt, ...)     ::blobxl::Logger::getInstance().logCtx(::blobxl::Logger::Level::INFO,     __FILE__, __LINE__, BLOBXL_FUNC, fmt, ##__VA_ARGS__)
#define BLOBXL_LOG_WARN(fmt, ...)     ::blobxl::Logger::getInstance().logCtx(::blobxl::Logger::Level::WARN,     __FILE__, __LINE__, BLOBXL_FUNC, fmt, ##__VA_ARGS__)
#define BLOBXL_LOG_ERROR(fmt, ...)    ::blobxl::Logger::getInstance().logCtx(::blobxl::Logger::Level::ERROR,    __FILE__, __LINE__, BLOBXL_FUNC, fmt, ##__VA_ARGS__)
#define BLOBXL_LOG_CRITICAL(fmt, ...) ::blobxl::Logger::getInstance().logCtx(::blobxl::Logger::Level::CRITICAL, __FILE__, __LINE__, BLOBXL_FUNC, fmt, ##__VA_ARGS__)

} // namespace blobxl
