#ifndef CHAINMETA_LOGGER_H
#define CHAINMETA_LOGGER_H

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace ChainMeta {

/// Log severity, lower is more severe.
enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

const char* log_level_name(LogLevel level);

// Compile-time filename extraction to avoid runtime filesystem operations
namespace detail {
    constexpr const char* extract_filename(const char* path) {
        const char* file = path;
        while (*path) {
            if (*path == '/' || *path == '\\') {
                file = path + 1;
            }
            ++path;
        }
        return file;
    }

    // Simple printf-style formatting
    template<typename... Args>
    std::string format(const char* fmt, Args... args) {
        int size = std::snprintf(nullptr, 0, fmt, args...);
        if (size <= 0) { return ""; }

        std::string result(size + 1, '\0');
        std::snprintf(result.data(), result.size(), fmt, args...);
        result.resize(size);
        return result;
    }
}

#define CHAINMETA_FILENAME ::ChainMeta::detail::extract_filename(__FILE__)

// Default log level - can be overridden at compile time
#ifndef CHAINMETA_LOG_LEVEL
    #ifdef NDEBUG
        #define CHAINMETA_LOG_LEVEL ::ChainMeta::LogLevel::INFO
    #else
        #define CHAINMETA_LOG_LEVEL ::ChainMeta::LogLevel::DEBUG
    #endif
#endif

/**
 * @brief Receives every log record that passes the compile-time filter.
 *
 * The default sink writes `[LEVEL] file:line target: message` to stderr.
 * Install a different one with set_log_sink(), typically once at start-up.
 */
using LogSink = void (*)(LogLevel level, std::string_view message,
                         std::string_view target, std::string_view filename,
                         uint32_t line_number);

void set_log_sink(LogSink sink);
LogSink default_log_sink();

/// Runtime threshold on top of CHAINMETA_LOG_LEVEL. Records above it are dropped.
void set_log_threshold(LogLevel level);
LogLevel log_threshold();

/**
 * @brief Logging with caller information.
 * @param level The severity level of the message.
 * @param message The message to log.
 * @param target The function/method name.
 * @param filename The source file name (just filename, not full path).
 * @param line_number The source line number.
 */
void log_with_caller_info(LogLevel level, std::string_view message,
                          std::string_view target = "",
                          std::string_view filename = "",
                          uint32_t line_number = 0);

inline void log(LogLevel level, std::string_view message) {
    log_with_caller_info(level, message, "", "", 0);
}

// Logging macros with compile-time level filtering
#define LOG_ERROR(message) \
    do { \
        if constexpr (CHAINMETA_LOG_LEVEL >= ::ChainMeta::LogLevel::ERROR) { \
            ::ChainMeta::log_with_caller_info(::ChainMeta::LogLevel::ERROR, (message), __func__, CHAINMETA_FILENAME, __LINE__); \
        } \
    } while(0)

#define LOG_WARN(message) \
    do { \
        if constexpr (CHAINMETA_LOG_LEVEL >= ::ChainMeta::LogLevel::WARN) { \
            ::ChainMeta::log_with_caller_info(::ChainMeta::LogLevel::WARN, (message), __func__, CHAINMETA_FILENAME, __LINE__); \
        } \
    } while(0)

#define LOG_INFO(message) \
    do { \
        if constexpr (CHAINMETA_LOG_LEVEL >= ::ChainMeta::LogLevel::INFO) { \
            ::ChainMeta::log_with_caller_info(::ChainMeta::LogLevel::INFO, (message), __func__, CHAINMETA_FILENAME, __LINE__); \
        } \
    } while(0)

#define LOG_DEBUG(message) \
    do { \
        if constexpr (CHAINMETA_LOG_LEVEL >= ::ChainMeta::LogLevel::DEBUG) { \
            ::ChainMeta::log_with_caller_info(::ChainMeta::LogLevel::DEBUG, (message), __func__, CHAINMETA_FILENAME, __LINE__); \
        } \
    } while(0)

#define LOG_TRACE(message) \
    do { \
        if constexpr (CHAINMETA_LOG_LEVEL >= ::ChainMeta::LogLevel::TRACE) { \
            ::ChainMeta::log_with_caller_info(::ChainMeta::LogLevel::TRACE, (message), __func__, CHAINMETA_FILENAME, __LINE__); \
        } \
    } while(0)

// Printf-style logging macros for convenience
#define LOG_INFO_F(fmt, ...) LOG_INFO(::ChainMeta::detail::format(fmt, ##__VA_ARGS__))
#define LOG_DEBUG_F(fmt, ...) LOG_DEBUG(::ChainMeta::detail::format(fmt, ##__VA_ARGS__))
#define LOG_TRACE_F(fmt, ...) LOG_TRACE(::ChainMeta::detail::format(fmt, ##__VA_ARGS__))

/**
 * @brief RAII timer that logs the duration of a scope at DEBUG level.
 *
 * @code
 * {
 *     LogStopwatch timer("decode_v16");
 *     // ... decode ...
 * }   // "decode_v16 took 132us"
 * @endcode
 */
class LogStopwatch {
public:
    explicit LogStopwatch(std::string_view name)
        : name_(name), ended_(false), start_time_(std::chrono::steady_clock::now()) {}

    ~LogStopwatch() {
        if (!ended_) {
            end();
        }
    }

    void end() {
        if (!ended_) {
            end_time_ = std::chrono::steady_clock::now();
            ended_ = true;
            log(LogLevel::DEBUG, detail::format("%s took %lluus", name_.c_str(),
                                                static_cast<unsigned long long>(elapsed_microseconds())));
        }
    }

    uint64_t elapsed_microseconds() const {
        auto stop = ended_ ? end_time_ : std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::microseconds>(stop - start_time_).count();
    }

    LogStopwatch(const LogStopwatch&) = delete;
    LogStopwatch& operator=(const LogStopwatch&) = delete;

private:
    std::string name_;
    bool ended_;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point end_time_;
};

} // namespace ChainMeta

#endif // CHAINMETA_LOGGER_H
