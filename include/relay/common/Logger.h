#pragma once

#include <functional>
#include <string>
#include <mutex>
#include <sstream>

namespace relay {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    // Receives the bare message (no timestamp/location decoration).
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }
    LogLevel ParseLevel(const std::string& levelStr);
    void Log(LogLevel level, const char* file, int line, const std::string& msg);

    // Extra sink invoked after the console write; pass {} to remove.
    void SetSink(Sink sink);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    bool color_ = true;
    Sink sink_;
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line) 
        : level_(level), file_(file), line_(line) {}
    
    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace relay

#define LOG_DEBUG \
    if (relay::common::LogLevel::DEBUG >= relay::common::Logger::Instance().GetLevel()) \
    relay::common::LogStream(relay::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (relay::common::LogLevel::INFO >= relay::common::Logger::Instance().GetLevel()) \
    relay::common::LogStream(relay::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (relay::common::LogLevel::WARN >= relay::common::Logger::Instance().GetLevel()) \
    relay::common::LogStream(relay::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (relay::common::LogLevel::ERROR >= relay::common::Logger::Instance().GetLevel()) \
    relay::common::LogStream(relay::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (relay::common::LogLevel::FATAL >= relay::common::Logger::Instance().GetLevel()) \
    relay::common::LogStream(relay::common::LogLevel::FATAL, __FILE__, __LINE__)
