#ifndef LOG_MONITOR_HPP
#define LOG_MONITOR_HPP

#include "line_source.hpp"
#include <atomic>
#include <cstdint>
#include <string>

class AccessControlEngine;

/**
 * @brief Turns authentication-failure log lines into engine calls
 *
 *   WAITING_FOR_DATA -> LINE_AVAILABLE -> (MATCH | NO_MATCH) -> WAITING_FOR_DATA
 *
 * A line matches when it contains the failure signature. The first valid IPv4
 * address in a matching line is the offender; a matching line without one is
 * logged and skipped. Engine errors on a single line are logged and the loop
 * carries on with the next line.
 */
class LogMonitor {
public:
    static constexpr const char* kDefaultFailureSignature = "authentication failed";

    enum class State : std::uint8_t {
        WAITING_FOR_DATA,
        LINE_AVAILABLE,
        MATCH,
        NO_MATCH,
        STOPPED
    };

    enum class LineOutcome : std::uint8_t {
        NO_MATCH,
        NO_ADDRESS,
        IGNORED_ALLOWED,
        ALREADY_DENIED,
        ATTEMPT_RECORDED,
        DENIED,
        FAILED
    };

    struct Stats {
        uint64_t lines_read;
        uint64_t failure_lines;
        uint64_t lines_without_address;
        uint64_t addresses_denied;
        uint64_t errors;
    };

    LogMonitor(LineSource& source, AccessControlEngine& engine,
               std::string failure_signature = kDefaultFailureSignature);

    // Consumes the source until it ends or stop() is called
    void run();

    // Wakes run() and makes it return; callable from any thread
    void stop();

    LineOutcome process_line(const std::string& line);

    State state() const { return state_.load(std::memory_order_acquire); }
    Stats get_stats() const;

    static const char* state_to_string(State state);

private:
    LineSource& source_;
    AccessControlEngine& engine_;
    std::string failure_signature_;

    std::atomic<State> state_{State::WAITING_FOR_DATA};
    std::atomic<bool> stop_requested_{false};

    std::atomic<uint64_t> lines_read_{0};
    std::atomic<uint64_t> failure_lines_{0};
    std::atomic<uint64_t> lines_without_address_{0};
    std::atomic<uint64_t> addresses_denied_{0};
    std::atomic<uint64_t> errors_{0};
};

#endif // LOG_MONITOR_HPP
