#pragma once

/**
 * @file core.hpp
 * @brief Core types, exceptions, logging and library start-up
 */

#include <planingsim/core/types.hpp>
#include <planingsim/core/exception.hpp>
#include <planingsim/core/logger.hpp>

namespace pls {

namespace version {

inline constexpr int major = 0;
inline constexpr int minor = 3;
inline constexpr int patch = 1;
inline constexpr const char* string = "0.3.1";

} // namespace version

// ============================================================================
// Start-up
// ============================================================================

struct InitOptions {
    Logger::Level log_level = Logger::Level::Info;

    /// Also log to this file at debug level (empty: console only)
    std::string log_file;
};

inline void initialize(const InitOptions& options = InitOptions{}) {
    Logger::Options log;
    log.console_level = options.log_level;
    log.file = options.log_file;
    Logger::instance().configure(log);

    PLS_LOG_INFO("PlaningSim {} (spdlog {}.{}.{})", version::string,
                 SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH);
}

inline void finalize() {
    Logger::instance().flush();
}

/// Initializes on construction, flushes the log on destruction
class Context {
public:
    explicit Context(const InitOptions& options = InitOptions{}) {
        initialize(options);
    }

    ~Context() {
        finalize();
    }

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
};

} // namespace pls
