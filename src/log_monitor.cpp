#include "log_monitor.hpp"
#include "access_control_engine.hpp"
#include "guard_errors.hpp"
#include "file_logger.hpp"
#include "ip_address.hpp"

namespace {

constexpr size_t kMaxLoggedLineLength = 200;

std::string excerpt(const std::string& line) {
    if (line.size() <= kMaxLoggedLineLength) {
        return line;
    }
    return line.substr(0, kMaxLoggedLineLength) + "...";
}

} // namespace

LogMonitor::LogMonitor(LineSource& source, AccessControlEngine& engine,
                       std::string failure_signature)
    : source_(source), engine_(engine), failure_signature_(std::move(failure_signature)) {
    if (failure_signature_.empty()) {
        throw ValidationError("Failure signature must not be empty");
    }
}

void LogMonitor::run() {
    GUARD_LOG_INFO("Log monitor started, watching for '" + failure_signature_ + "'");

    while (!stop_requested_.load(std::memory_order_acquire)) {
        state_.store(State::WAITING_FOR_DATA, std::memory_order_release);
        auto line = source_.next_line();
        if (!line) {
            break;
        }
        state_.store(State::LINE_AVAILABLE, std::memory_order_release);
        process_line(*line);
    }

    state_.store(State::STOPPED, std::memory_order_release);

    Stats stats = get_stats();
    GUARD_LOG_INFO("Log monitor stopped: " + std::to_string(stats.lines_read) + " lines, " +
                   std::to_string(stats.failure_lines) + " failures, " +
                   std::to_string(stats.addresses_denied) + " addresses denied, " +
                   std::to_string(stats.errors) + " errors");
}

void LogMonitor::stop() {
    stop_requested_.store(true, std::memory_order_release);
    source_.cancel();
}

LogMonitor::LineOutcome LogMonitor::process_line(const std::string& line) {
    lines_read_.fetch_add(1, std::memory_order_relaxed);

    if (line.find(failure_signature_) == std::string::npos) {
        state_.store(State::NO_MATCH, std::memory_order_release);
        return LineOutcome::NO_MATCH;
    }

    state_.store(State::MATCH, std::memory_order_release);
    failure_lines_.fetch_add(1, std::memory_order_relaxed);

    auto ip = ip_address::extract_first_ipv4(line);
    if (!ip) {
        lines_without_address_.fetch_add(1, std::memory_order_relaxed);
        GUARD_LOG_WARNING("Failure line without a usable address skipped: " + excerpt(line));
        return LineOutcome::NO_ADDRESS;
    }

    try {
        if (engine_.is_allowed(*ip)) {
            GUARD_LOG_DEBUG("Failed attempt from allowed address " + *ip + " ignored");
            return LineOutcome::IGNORED_ALLOWED;
        }

        switch (engine_.on_failure_observed(*ip)) {
            case FailureOutcome::IGNORED_ALLOWED:
                return LineOutcome::IGNORED_ALLOWED;
            case FailureOutcome::ALREADY_DENIED:
                return LineOutcome::ALREADY_DENIED;
            case FailureOutcome::ATTEMPT_RECORDED:
                return LineOutcome::ATTEMPT_RECORDED;
            case FailureOutcome::DENIED:
                addresses_denied_.fetch_add(1, std::memory_order_relaxed);
                return LineOutcome::DENIED;
        }
    } catch (const GuardError& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        GUARD_LOG_ERROR("Failed to handle attempt from " + *ip + ": " + e.what());
        g_file_logger.write_audit_record("Could not process failed attempt from " + *ip + ": " +
                                         e.what());
    } catch (const std::exception& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        GUARD_LOG_ERROR("Unexpected error handling attempt from " + *ip + ": " + e.what());
    }
    return LineOutcome::FAILED;
}

LogMonitor::Stats LogMonitor::get_stats() const {
    Stats stats;
    stats.lines_read = lines_read_.load(std::memory_order_relaxed);
    stats.failure_lines = failure_lines_.load(std::memory_order_relaxed);
    stats.lines_without_address = lines_without_address_.load(std::memory_order_relaxed);
    stats.addresses_denied = addresses_denied_.load(std::memory_order_relaxed);
    stats.errors = errors_.load(std::memory_order_relaxed);
    return stats;
}

const char* LogMonitor::state_to_string(State state) {
    switch (state) {
        case State::WAITING_FOR_DATA: return "WAITING_FOR_DATA";
        case State::LINE_AVAILABLE: return "LINE_AVAILABLE";
        case State::MATCH: return "MATCH";
        case State::NO_MATCH: return "NO_MATCH";
        case State::STOPPED: return "STOPPED";
        default: return "UNKNOWN";
    }
}
