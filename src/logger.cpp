#include "chainmeta/logger.h"

#include <atomic>

namespace ChainMeta {

namespace {

void stderr_sink(LogLevel level, std::string_view message,
                 std::string_view target, std::string_view filename,
                 uint32_t line_number) {
    if (filename.empty()) {
        std::fprintf(stderr, "[%s] %.*s\n", log_level_name(level),
                     static_cast<int>(message.size()), message.data());
        return;
    }
    std::fprintf(stderr, "[%s] %.*s:%u %.*s: %.*s\n", log_level_name(level),
                 static_cast<int>(filename.size()), filename.data(), line_number,
                 static_cast<int>(target.size()), target.data(),
                 static_cast<int>(message.size()), message.data());
}

std::atomic<LogSink> g_sink{&stderr_sink};
std::atomic<LogLevel> g_threshold{LogLevel::TRACE};

} // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "UNKNOWN";
}

void set_log_sink(LogSink sink) {
    g_sink.store(sink ? sink : &stderr_sink);
}

LogSink default_log_sink() {
    return &stderr_sink;
}

void set_log_threshold(LogLevel level) {
    g_threshold.store(level);
}

LogLevel log_threshold() {
    return g_threshold.load();
}

void log_with_caller_info(LogLevel level, std::string_view message,
                          std::string_view target, std::string_view filename,
                          uint32_t line_number) {
    if (level > g_threshold.load()) {
        return;
    }
    g_sink.load()(level, message, target, filename, line_number);
}

} // namespace ChainMeta
