#pragma once

/**
 * @file exception.hpp
 * @brief Exception hierarchy and precondition macros
 *
 * Every exception records where it was raised. The message carries the
 * location prefix so a bare what() is enough in logs.
 */

#include <source_location>
#include <stdexcept>
#include <string>

namespace pls {

using SourceLocation = std::source_location;

// ============================================================================
// Base
// ============================================================================

class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message,
                       const SourceLocation& location = SourceLocation::current())
        : std::runtime_error(std::string(location.file_name()) + ":" +
                             std::to_string(location.line()) + ": " + message)
        , location_(location)
    {}

    const char* file() const noexcept { return location_.file_name(); }
    int line() const noexcept { return static_cast<int>(location_.line()); }
    const char* function() const noexcept { return location_.function_name(); }

private:
    SourceLocation location_;
};

// ============================================================================
// Categories
// ============================================================================

/// Broken internal invariant
class LogicError : public Exception {
public:
    using Exception::Exception;
};

/// Bad input: configuration, mesh data, names, parameter ranges
class InvalidArgumentError : public Exception {
public:
    using Exception::Exception;
};

class OutOfRangeError : public Exception {
public:
    using Exception::Exception;
};

class FileIOError : public Exception {
public:
    FileIOError(const std::string& filename,
                const std::string& operation,
                const SourceLocation& location = SourceLocation::current())
        : Exception("cannot " + operation + " '" + filename + "'", location)
        , filename_(filename)
    {}

    const std::string& filename() const noexcept { return filename_; }

private:
    std::string filename_;
};

/// Reduced stiffness or Jacobian with free DOFs that cannot be factorized
class SingularMatrixError : public Exception {
public:
    SingularMatrixError(const std::string& owner,
                        std::size_t size,
                        const SourceLocation& location = SourceLocation::current())
        : Exception("singular " + std::to_string(size) + "x" + std::to_string(size) +
                    " system in " + owner, location)
        , owner_(owner)
    {}

    const std::string& owner() const noexcept { return owner_; }

private:
    std::string owner_;
};

// ============================================================================
// Precondition Macros
// ============================================================================

#define PLS_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            throw ::pls::LogicError(std::string(#condition " violated: ") + (message)); \
        } \
    } while (false)

#define PLS_REQUIRE(condition, message) \
    do { \
        if (!(condition)) { \
            throw ::pls::InvalidArgumentError(message); \
        } \
    } while (false)

#define PLS_CHECK_RANGE(index, size) \
    do { \
        if ((index) >= (size)) { \
            throw ::pls::OutOfRangeError("index " + std::to_string(index) + \
                                         " not below " + std::to_string(size)); \
        } \
    } while (false)

} // namespace pls
