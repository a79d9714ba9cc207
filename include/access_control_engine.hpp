#ifndef ACCESS_CONTROL_ENGINE_HPP
#define ACCESS_CONTROL_ENGINE_HPP

#include "attempt_tracker.hpp"
#include "list_store.hpp"
#include "rule_engine.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

enum class ListChange : std::uint8_t {
    ADDED,
    ALREADY_PRESENT,
    REMOVED,
    NOT_PRESENT
};

const char* list_change_to_string(ListChange change);

// Outcome of one administrative operation
struct OperationResult {
    std::string address;
    ListChange change = ListChange::NOT_PRESENT;
    bool moved_from_other_list = false;
    bool rules_synced = true;   // false: list committed but the live table lags behind
    std::string rule_error;     // set when rules_synced is false
};

enum class FailureOutcome : std::uint8_t {
    IGNORED_ALLOWED,   // address is trusted, nothing counted
    ALREADY_DENIED,    // address already on the deny-list
    ATTEMPT_RECORDED,  // below threshold, written to the audit trail
    DENIED             // threshold reached, promoted to the deny-list
};

const char* failure_outcome_to_string(FailureOutcome outcome);

struct InspectSnapshot {
    std::vector<std::string> allowed;
    std::vector<std::string> denied;
    std::vector<FilterRule> live_rules;
};

/**
 * @brief Orchestrates the lists, the live rules and the failure counters
 *
 * One instance manages one (protected port, list pair). Every mutating
 * operation runs under the engine mutex and the store's exclusive section, so
 * "update list, then update rules" is never observed half-done by a concurrent
 * caller in this process or in another one sharing the same list files.
 *
 * ValidationError and PersistenceError propagate to the caller and leave the
 * lists unchanged. FilterCommandError is absorbed: the list change stays
 * committed, the result reports rules_synced = false and reconcile() repairs
 * the table later.
 */
class AccessControlEngine {
public:
    struct Metrics {
        uint64_t failures_observed;  // excludes allow-listed addresses
        uint64_t attempts_recorded;
        uint64_t addresses_denied;
        uint64_t rule_errors;
    };

    AccessControlEngine(ListStore& store, RuleEngine& rules, AttemptTracker& tracker,
                        unsigned int max_attempts = 1);

    OperationResult allow(const std::string& ip);
    OperationResult unallow(const std::string& ip);
    OperationResult deny(const std::string& ip);
    OperationResult undeny(const std::string& ip);

    // Feed of the log monitor; ip must already be a valid address
    FailureOutcome on_failure_observed(const std::string& ip);

    RuleEngine::ReconcileReport reconcile();

    // Read-only snapshot. Throws FilterCommandError when live rules can not be read.
    InspectSnapshot inspect() const;

    bool is_allowed(const std::string& ip) const;
    unsigned int max_attempts() const { return max_attempts_; }
    Metrics get_metrics() const;

private:
    ListStore& store_;
    RuleEngine& rules_;
    AttemptTracker& tracker_;
    unsigned int max_attempts_;

    mutable std::mutex mutex_;

    std::atomic<uint64_t> failures_observed_{0};
    std::atomic<uint64_t> attempts_recorded_{0};
    std::atomic<uint64_t> addresses_denied_{0};
    std::atomic<uint64_t> rule_errors_{0};

    OperationResult add_locked(ListStore::ListKind kind, const std::string& ip);
    OperationResult remove_locked(ListStore::ListKind kind, const std::string& ip);

    static FilterAction action_for(ListStore::ListKind kind);
    void record_rule_error(OperationResult& result, const std::string& what);
    void audit(const std::string& record);
};

#endif // ACCESS_CONTROL_ENGINE_HPP
