#pragma once

/**
 * @file logger.hpp
 * @brief spdlog-backed logging for the structural solver
 *
 * One process-wide logger named "pls". Until configure() is called it writes
 * info and above to the console. Iteration-level detail (Jacobian builds,
 * assembly sizes, hinge deformation) is logged at debug.
 */

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pls {

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    enum class Level {
        Trace = SPDLOG_LEVEL_TRACE,
        Debug = SPDLOG_LEVEL_DEBUG,
        Info = SPDLOG_LEVEL_INFO,
        Warn = SPDLOG_LEVEL_WARN,
        Error = SPDLOG_LEVEL_ERROR,
        Critical = SPDLOG_LEVEL_CRITICAL,
        Off = SPDLOG_LEVEL_OFF
    };

    struct Options {
        Level console_level = Level::Info;
        bool console = true;

        /// Empty: no file output
        std::string file;
        Level file_level = Level::Debug;

        /// Rotate the log file at this size (0 keeps a single file)
        std::size_t rotate_bytes = 0;
        std::size_t rotate_files = 3;
    };

    template<typename... Args>
    using FormatString = spdlog::format_string_t<Args...>;

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /// Replace the sinks; the logger level is the lowest sink level
    void configure(const Options& options) {
        std::vector<spdlog::sink_ptr> sinks;
        Level lowest = Level::Off;

        if (options.console) {
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            sink->set_level(to_spdlog(options.console_level));
            sinks.push_back(sink);
            lowest = std::min(lowest, options.console_level);
        }
        if (!options.file.empty()) {
            spdlog::sink_ptr sink;
            if (options.rotate_bytes > 0) {
                sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    options.file, options.rotate_bytes, options.rotate_files);
            } else {
                sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file);
            }
            sink->set_level(to_spdlog(options.file_level));
            sinks.push_back(sink);
            lowest = std::min(lowest, options.file_level);
        }

        logger_ = std::make_shared<spdlog::logger>("pls", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog(lowest));
        logger_->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(logger_);
    }

    void set_level(Level level) {
        logger_->set_level(to_spdlog(level));
    }

    template<typename... Args>
    void trace(FormatString<Args...> fmt, Args&&... args) {
        logger_->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(FormatString<Args...> fmt, Args&&... args) {
        logger_->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(FormatString<Args...> fmt, Args&&... args) {
        logger_->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(FormatString<Args...> fmt, Args&&... args) {
        logger_->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(FormatString<Args...> fmt, Args&&... args) {
        logger_->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(FormatString<Args...> fmt, Args&&... args) {
        logger_->critical(fmt, std::forward<Args>(args)...);
    }

    void flush() {
        logger_->flush();
    }

private:
    Logger() {
        configure(Options{});
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum to_spdlog(Level level) {
        return static_cast<spdlog::level::level_enum>(level);
    }

    std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define PLS_LOG_TRACE(...)    ::pls::Logger::instance().trace(__VA_ARGS__)
#define PLS_LOG_DEBUG(...)    ::pls::Logger::instance().debug(__VA_ARGS__)
#define PLS_LOG_INFO(...)     ::pls::Logger::instance().info(__VA_ARGS__)
#define PLS_LOG_WARN(...)     ::pls::Logger::instance().warn(__VA_ARGS__)
#define PLS_LOG_ERROR(...)    ::pls::Logger::instance().error(__VA_ARGS__)
#define PLS_LOG_CRITICAL(...) ::pls::Logger::instance().critical(__VA_ARGS__)

// ============================================================================
// Scoped Timer
// ============================================================================

/// Logs the wall time of a scope at debug level
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label)
        : label_(std::move(label))
        , start_(std::chrono::steady_clock::now())
    {}

    ~ScopedTimer() {
        const auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
        PLS_LOG_DEBUG("{}: {:.3f} ms", label_, elapsed);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

#define PLS_TIMER_CONCAT_(a, b) a##b
#define PLS_TIMER_NAME_(line) PLS_TIMER_CONCAT_(pls_scoped_timer_, line)
#define PLS_SCOPED_TIMER(label) ::pls::ScopedTimer PLS_TIMER_NAME_(__LINE__)(label)

} // namespace pls
