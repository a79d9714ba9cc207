#include "access_control_engine.hpp"
#include "guard_errors.hpp"
#include "file_logger.hpp"
#include "ip_address.hpp"

const char* list_change_to_string(ListChange change) {
    switch (change) {
        case ListChange::ADDED: return "added";
        case ListChange::ALREADY_PRESENT: return "already present";
        case ListChange::REMOVED: return "removed";
        case ListChange::NOT_PRESENT: return "not present";
        default: return "unknown";
    }
}

const char* failure_outcome_to_string(FailureOutcome outcome) {
    switch (outcome) {
        case FailureOutcome::IGNORED_ALLOWED: return "ignored (allowed)";
        case FailureOutcome::ALREADY_DENIED: return "already denied";
        case FailureOutcome::ATTEMPT_RECORDED: return "attempt recorded";
        case FailureOutcome::DENIED: return "denied";
        default: return "unknown";
    }
}

AccessControlEngine::AccessControlEngine(ListStore& store, RuleEngine& rules,
                                         AttemptTracker& tracker, unsigned int max_attempts)
    : store_(store), rules_(rules), tracker_(tracker),
      max_attempts_(max_attempts == 0 ? 1 : max_attempts) {}

OperationResult AccessControlEngine::allow(const std::string& ip) {
    ip_address::require_ipv4(ip);
    std::lock_guard<std::mutex> lock(mutex_);
    auto section = store_.exclusive_section();
    return add_locked(ListStore::ListKind::ALLOWED, ip);
}

OperationResult AccessControlEngine::unallow(const std::string& ip) {
    ip_address::require_ipv4(ip);
    std::lock_guard<std::mutex> lock(mutex_);
    auto section = store_.exclusive_section();
    return remove_locked(ListStore::ListKind::ALLOWED, ip);
}

OperationResult AccessControlEngine::deny(const std::string& ip) {
    ip_address::require_ipv4(ip);
    std::lock_guard<std::mutex> lock(mutex_);
    auto section = store_.exclusive_section();
    return add_locked(ListStore::ListKind::DENIED, ip);
}

OperationResult AccessControlEngine::undeny(const std::string& ip) {
    ip_address::require_ipv4(ip);
    std::lock_guard<std::mutex> lock(mutex_);
    auto section = store_.exclusive_section();
    return remove_locked(ListStore::ListKind::DENIED, ip);
}

FailureOutcome AccessControlEngine::on_failure_observed(const std::string& ip) {
    ip_address::require_ipv4(ip);

    std::lock_guard<std::mutex> lock(mutex_);
    auto section = store_.exclusive_section();

    if (store_.contains(ListStore::ListKind::ALLOWED, ip)) {
        return FailureOutcome::IGNORED_ALLOWED;
    }
    failures_observed_.fetch_add(1, std::memory_order_relaxed);

    if (store_.contains(ListStore::ListKind::DENIED, ip)) {
        // Traffic should already be dropped; re-assert the rule in case it drifted
        try {
            if (rules_.apply(ip, FilterAction::DROP)) {
                GUARD_LOG_WARNING("Restored missing DROP rule for denied address " + ip);
            }
        } catch (const FilterCommandError& e) {
            rule_errors_.fetch_add(1, std::memory_order_relaxed);
            GUARD_LOG_ERROR("Could not restore DROP rule for " + ip + ": " + e.what());
        }
        return FailureOutcome::ALREADY_DENIED;
    }

    unsigned int attempts = tracker_.record_failure(ip);
    if (attempts >= max_attempts_) {
        OperationResult result = add_locked(ListStore::ListKind::DENIED, ip);
        GUARD_LOG_INFO("Address " + ip + " reached " + std::to_string(attempts) +
                       " failed attempt(s), denied" +
                       (result.rules_synced ? "" : " (rule pending reconcile)"));
        return FailureOutcome::DENIED;
    }

    attempts_recorded_.fetch_add(1, std::memory_order_relaxed);
    audit("Failed attempt from " + ip + " (Attempt " + std::to_string(attempts) + ")");
    return FailureOutcome::ATTEMPT_RECORDED;
}

RuleEngine::ReconcileReport AccessControlEngine::reconcile() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section = store_.exclusive_section();
    RuleEngine::ReconcileReport report = rules_.reconcile(store_);
    rule_errors_.fetch_add(report.failures, std::memory_order_relaxed);
    for (const auto& error : report.errors) {
        audit("Rule reconcile failure: " + error);
    }
    return report;
}

InspectSnapshot AccessControlEngine::inspect() const {
    std::lock_guard<std::mutex> lock(mutex_);
    InspectSnapshot snapshot;
    snapshot.allowed = store_.all(ListStore::ListKind::ALLOWED);
    snapshot.denied = store_.all(ListStore::ListKind::DENIED);
    snapshot.live_rules = rules_.list();
    return snapshot;
}

bool AccessControlEngine::is_allowed(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.contains(ListStore::ListKind::ALLOWED, ip);
}

AccessControlEngine::Metrics AccessControlEngine::get_metrics() const {
    Metrics metrics;
    metrics.failures_observed = failures_observed_.load(std::memory_order_relaxed);
    metrics.attempts_recorded = attempts_recorded_.load(std::memory_order_relaxed);
    metrics.addresses_denied = addresses_denied_.load(std::memory_order_relaxed);
    metrics.rule_errors = rule_errors_.load(std::memory_order_relaxed);
    return metrics;
}

OperationResult AccessControlEngine::add_locked(ListStore::ListKind kind, const std::string& ip) {
    OperationResult result;
    result.address = ip;

    ListStore::AddResult added = store_.add(kind, ip);
    result.change = added.outcome == ListStore::AddOutcome::ADDED ? ListChange::ADDED
                                                                  : ListChange::ALREADY_PRESENT;
    result.moved_from_other_list = added.removed_from_other;

    // A listed address is never tracked
    tracker_.clear(ip);

    FilterAction action = action_for(kind);
    try {
        rules_.apply(ip, action);
        rules_.revoke(ip, opposite_action(action));
    } catch (const FilterCommandError& e) {
        record_rule_error(result, e.what());
    }

    if (result.change == ListChange::ADDED) {
        if (kind == ListStore::ListKind::DENIED) {
            addresses_denied_.fetch_add(1, std::memory_order_relaxed);
            audit("Blocked " + ip + " for VNC access");
        } else {
            audit("Whitelisted " + ip + " for VNC access");
        }
    }
    return result;
}

OperationResult AccessControlEngine::remove_locked(ListStore::ListKind kind, const std::string& ip) {
    OperationResult result;
    result.address = ip;

    ListStore::RemoveOutcome removed = store_.remove(kind, ip);
    result.change = removed == ListStore::RemoveOutcome::REMOVED ? ListChange::REMOVED
                                                                 : ListChange::NOT_PRESENT;

    // Revoked even when the list did not hold the address: clears a stale rule
    try {
        rules_.revoke(ip, action_for(kind));
    } catch (const FilterCommandError& e) {
        record_rule_error(result, e.what());
    }

    if (result.change == ListChange::REMOVED) {
        if (kind == ListStore::ListKind::DENIED) {
            audit("Unbanned " + ip + " for VNC access");
        } else {
            audit("Removed " + ip + " from whitelist for VNC access");
        }
    }
    return result;
}

FilterAction AccessControlEngine::action_for(ListStore::ListKind kind) {
    return kind == ListStore::ListKind::ALLOWED ? FilterAction::ACCEPT : FilterAction::DROP;
}

void AccessControlEngine::record_rule_error(OperationResult& result, const std::string& what) {
    result.rules_synced = false;
    result.rule_error = what;
    rule_errors_.fetch_add(1, std::memory_order_relaxed);
    GUARD_LOG_ERROR("Rule update failed for " + result.address + ": " + what);
    audit("Rule update failed for " + result.address + ": " + what);
}

void AccessControlEngine::audit(const std::string& record) {
    g_file_logger.write_audit_record(record);
}
