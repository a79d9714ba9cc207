#ifndef GUARD_ERRORS_HPP
#define GUARD_ERRORS_HPP

#include <stdexcept>
#include <string>

// Base for every error raised by the access-control engine and its collaborators
class GuardError : public std::runtime_error {
public:
    explicit GuardError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed input (address, command argument). Raised before any state is touched.
class ValidationError : public GuardError {
public:
    explicit ValidationError(const std::string& message) : GuardError(message) {}
};

// Bad configuration value
class ConfigError : public ValidationError {
public:
    explicit ConfigError(const std::string& message) : ValidationError(message) {}
};

// List file unreadable or unwritable. In-memory list state is left unchanged.
class PersistenceError : public GuardError {
public:
    PersistenceError(const std::string& message, int error_code = 0)
        : GuardError(message), error_code_(error_code) {}

    int error_code() const { return error_code_; }

private:
    int error_code_;
};

// Packet-filter command failed. List state may already be committed; reconcile repairs it.
class FilterCommandError : public GuardError {
public:
    FilterCommandError(const std::string& message, int exit_status = -1)
        : GuardError(message), exit_status_(exit_status) {}

    int exit_status() const { return exit_status_; }

private:
    int exit_status_;
};

// Authentication log missing or rotated away; the tailer retries with backoff
class SourceUnavailableError : public GuardError {
public:
    SourceUnavailableError(const std::string& message, int error_code = 0)
        : GuardError(message), error_code_(error_code) {}

    int error_code() const { return error_code_; }

private:
    int error_code_;
};

#endif // GUARD_ERRORS_HPP
