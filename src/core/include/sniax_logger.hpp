#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <atomic>
#include <utility>
#include <chrono>
#include <iomanip>
#include <ctime>

namespace sniax {

/**
 * @brief Logging levels for sniax
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    NONE  = 6
};

/**
 * @brief Thread-safe diagnostic logger
 *
 * Console output always goes to stderr: stdout carries discovered
 * hostnames only. An optional log file receives the same lines.
 * The level is checked before the lock so filtered probe chatter from
 * many workers does not contend.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) { level_.store(level); }

    bool enabled(LogLevel level) const { return level >= level_.load(); }

    void setConsoleOutput(bool on) {
        std::lock_guard<std::mutex> lock(mtx_);
        console_enabled_ = on;
    }

    bool setFileOutput(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
        file_enabled_ = file_.is_open();
        return file_enabled_;
    }

    void trace(const std::string& msg) { log(LogLevel::TRACE, msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg)  { log(LogLevel::INFO,  msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN,  msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }
    void fatal(const std::string& msg) { log(LogLevel::FATAL, msg); }

    void log(LogLevel level, const std::string& msg) {
        if (!enabled(level)) return;
        std::string formatted = formatMessage(level, msg);

        std::lock_guard<std::mutex> lock(mtx_);

        if (console_enabled_) {
            std::cerr << formatted << std::endl;
        }

        if (file_enabled_ && file_.is_open()) {
            file_ << formatted << std::endl;
            file_.flush();
        }
    }

    static LogLevel levelFromString(const std::string& s) {
        if (s == "trace") return LogLevel::TRACE;
        if (s == "debug") return LogLevel::DEBUG;
        if (s == "info")  return LogLevel::INFO;
        if (s == "warn" || s == "warning") return LogLevel::WARN;
        if (s == "error") return LogLevel::ERROR;
        if (s == "fatal") return LogLevel::FATAL;
        if (s == "none")  return LogLevel::NONE;
        return LogLevel::INFO;
    }

private:
    Logger()
        : level_(LogLevel::INFO)
        , console_enabled_(true)
        , file_enabled_(false)
    {}

    ~Logger() {
        if (file_.is_open()) file_.close();
    }

    static std::string formatMessage(LogLevel level, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << levelToString(level) << "] " << msg;
        return oss.str();
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default:              return "?????";
        }
    }

    std::atomic<LogLevel> level_;
    bool console_enabled_;
    bool file_enabled_;
    std::ofstream file_;
    std::mutex mtx_;
};

/**
 * @brief Tags diagnostics with the phase, target domain and, for AXFR,
 *        the name server they concern
 *
 * Lines come out as "[AXFR example.com @ns1.example.com] message".
 */
class LogContext {
public:
    explicit LogContext(std::string operation, std::string domain,
                        std::string nameserver = "")
        : operation_(std::move(operation))
        , domain_(std::move(domain))
        , nameserver_(std::move(nameserver))
    {}

    LogContext via(const std::string& nameserver) const {
        return LogContext(operation_, domain_, nameserver);
    }

    std::string tag() const {
        std::string out = "[" + operation_ + " " + domain_;
        if (!nameserver_.empty()) out += " @" + nameserver_;
        return out + "]";
    }

    void trace(const std::string& msg) const { emit(LogLevel::TRACE, msg); }
    void debug(const std::string& msg) const { emit(LogLevel::DEBUG, msg); }
    void info(const std::string& msg)  const { emit(LogLevel::INFO,  msg); }
    void warn(const std::string& msg)  const { emit(LogLevel::WARN,  msg); }
    void error(const std::string& msg) const { emit(LogLevel::ERROR, msg); }

    const std::string& domain() const { return domain_; }
    const std::string& nameserver() const { return nameserver_; }

private:
    void emit(LogLevel level, const std::string& msg) const {
        Logger& log = Logger::instance();
        if (log.enabled(level)) log.log(level, tag() + " " + msg);
    }

    std::string operation_;
    std::string domain_;
    std::string nameserver_;
};

// Convenience macros
#define SNIAX_LOG_TRACE(msg) sniax::Logger::instance().trace(msg)
#define SNIAX_LOG_DEBUG(msg) sniax::Logger::instance().debug(msg)
#define SNIAX_LOG_INFO(msg)  sniax::Logger::instance().info(msg)
#define SNIAX_LOG_WARN(msg)  sniax::Logger::instance().warn(msg)
#define SNIAX_LOG_ERROR(msg) sniax::Logger::instance().error(msg)
#define SNIAX_LOG_FATAL(msg) sniax::Logger::instance().fatal(msg)

} // namespace sniax
