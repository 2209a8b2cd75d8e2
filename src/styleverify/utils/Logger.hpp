#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <mutex>
#include <chrono>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef ERROR
#undef ERROR
#endif

namespace styleverify {

/**
 * @brief 进程级日志器
 *
 * - 控制台彩色输出 + 文件输出（按大小轮转）
 * - 基于fmt的格式化接口
 * - 线程安全
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

    void initialize(const std::string& log_file_path = "logs/styleverify.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;

    /**
     * @brief 从字符串解析日志级别（trace/debug/info/warn/error/critical/off）
     * @return 无法识别时返回INFO
     */
    static Level parseLevel(const std::string& name);

    void trace(const std::string& message)    { write(Level::TRACE, message); }
    void debug(const std::string& message)    { write(Level::DEBUG, message); }
    void info(const std::string& message)     { write(Level::INFO, message); }
    void warn(const std::string& message)     { write(Level::WARN, message); }
    void error(const std::string& message)    { write(Level::ERROR, message); }
    void critical(const std::string& message) { write(Level::CRITICAL, message); }

    template<typename... Args>
    inline void log(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        write(level, formatSafe(fmt_str, args...));
    }

    void flush();
    void shutdown();

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        write(level, fmt::format("[{}:{}:{}] {}", baseFilename(file), line,
                                 extractFunctionName(func), formatSafe(fmt_str, args...)));
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    static std::string formatSafe(const std::string& fmt_str, Args&... args) {
        if constexpr (sizeof...(Args) == 0) {
            return fmt_str;
        } else {
            try {
                return fmt::vformat(fmt_str, fmt::make_format_args(args...));
            } catch (const fmt::format_error&) {
                // 格式串与参数不匹配时保留原始格式串
                return fmt_str;
            }
        }
    }

    void write(Level level, const std::string& message);
    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    // 提取函数名（去除命名空间和参数）
    static inline std::string extractFunctionName(const char* func_sig) {
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

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define STYLEVERIFY_FUNC __FUNCTION__
#else
#  define STYLEVERIFY_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define STYLEVERIFY_LOG_AT(level, fmt, ...) \
    styleverify::Logger::getInstance().logCtx(level, __FILE__, __LINE__, STYLEVERIFY_FUNC, fmt, ##__VA_ARGS__)

#define STYLEVERIFY_LOG_TRACE(fmt, ...)    STYLEVERIFY_LOG_AT(styleverify::Logger::Level::TRACE, fmt, ##__VA_ARGS__)
#define STYLEVERIFY_LOG_DEBUG(fmt, ...)    STYLEVERIFY_LOG_AT(styleverify::Logger::Level::DEBUG, fmt, ##__VA_ARGS__)
#define STYLEVERIFY_LOG_INFO(fmt, ...)     STYLEVERIFY_LOG_AT(styleverify::Logger::Level::INFO, fmt, ##__VA_ARGS__)
#define STYLEVERIFY_LOG_WARN(fmt, ...)     STYLEVERIFY_LOG_AT(styleverify::Logger::Level::WARN, fmt, ##__VA_ARGS__)
#define STYLEVERIFY_LOG_ERROR(fmt, ...)    STYLEVERIFY_LOG_AT(styleverify::Logger::Level::ERROR, fmt, ##__VA_ARGS__)
#define STYLEVERIFY_LOG_CRITICAL(fmt, ...) STYLEVERIFY_LOG_AT(styleverify::Logger::Level::CRITICAL, fmt, ##__VA_ARGS__)

} // namespace styleverify
