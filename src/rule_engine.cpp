#include "rule_engine.hpp"
#include "list_store.hpp"
#include "guard_errors.hpp"
#include "file_logger.hpp"
#include "ip_address.hpp"
#include <algorithm>

RuleEngine::RuleEngine(PacketFilter& filter, std::uint16_t protected_port)
    : filter_(filter), port_(protected_port) {}

bool RuleEngine::apply(const std::string& ip, FilterAction action) {
    FilterRule rule = make_rule(ip, action);

    auto live = list();
    if (count_matching(live, rule) > 0) {
        GUARD_LOG_DEBUG("Rule already present: " + describe_rule(rule));
        return false;
    }

    filter_.insert_rule(rule);
    GUARD_LOG_INFO("Inserted rule: " + describe_rule(rule));
    return true;
}

bool RuleEngine::revoke(const std::string& ip, FilterAction action) {
    FilterRule rule = make_rule(ip, action);

    auto live = list();
    size_t copies = count_matching(live, rule);
    if (copies == 0) {
        return false;
    }

    for (size_t i = 0; i < copies; ++i) {
        filter_.delete_rule(rule);
    }
    GUARD_LOG_INFO("Deleted rule: " + describe_rule(rule) +
                   (copies > 1 ? " (" + std::to_string(copies) + " copies)" : ""));
    return true;
}

std::vector<FilterRule> RuleEngine::list() const {
    auto rules = filter_.list_rules(port_);
    // Backends already filter by port; a misbehaving one must not widen our scope
    rules.erase(std::remove_if(rules.begin(), rules.end(),
                               [this](const FilterRule& r) { return r.port != port_; }),
                rules.end());
    return rules;
}

bool RuleEngine::has_rule(const std::string& ip, FilterAction action) const {
    return count_matching(list(), make_rule(ip, action)) > 0;
}

RuleEngine::ReconcileReport RuleEngine::reconcile(const ListStore& store) {
    ReconcileReport report;

    std::vector<FilterRule> live;
    try {
        live = list();
    } catch (const FilterCommandError& e) {
        report.failures++;
        report.errors.emplace_back(e.what());
        GUARD_LOG_ERROR(std::string("Reconcile aborted, live rules unavailable: ") + e.what());
        return report;
    }

    for (const auto& ip : store.all(ListStore::ListKind::ALLOWED)) {
        reconcile_address(live, ip, FilterAction::ACCEPT, report);
    }
    for (const auto& ip : store.all(ListStore::ListKind::DENIED)) {
        reconcile_address(live, ip, FilterAction::DROP, report);
    }

    GUARD_LOG_INFO("Reconcile finished on port " + std::to_string(port_) + ": " +
                   std::to_string(report.rules_applied) + " applied, " +
                   std::to_string(report.duplicates_removed) + " duplicates removed, " +
                   std::to_string(report.conflicts_revoked) + " conflicts revoked, " +
                   std::to_string(report.failures) + " failures");
    return report;
}

void RuleEngine::reconcile_address(const std::vector<FilterRule>& live, const std::string& ip,
                                   FilterAction wanted, ReconcileReport& report) {
    FilterRule rule = make_rule(ip, wanted);
    FilterRule conflicting = make_rule(ip, opposite_action(wanted));

    try {
        size_t conflicts = count_matching(live, conflicting);
        for (size_t i = 0; i < conflicts; ++i) {
            filter_.delete_rule(conflicting);
            report.conflicts_revoked++;
        }

        size_t copies = count_matching(live, rule);
        if (copies == 0) {
            filter_.insert_rule(rule);
            report.rules_applied++;
        }
        for (size_t i = 1; i < copies; ++i) {
            filter_.delete_rule(rule);
            report.duplicates_removed++;
        }
    } catch (const FilterCommandError& e) {
        report.failures++;
        report.errors.emplace_back(e.what());
        GUARD_LOG_ERROR("Reconcile failed for " + ip + ": " + e.what());
    }
}

FilterRule RuleEngine::make_rule(const std::string& ip, FilterAction action) const {
    FilterRule rule;
    rule.address = ip_address::require_ipv4(ip);
    rule.port = port_;
    rule.action = action;
    return rule;
}

size_t RuleEngine::count_matching(const std::vector<FilterRule>& rules, const FilterRule& rule) {
    return static_cast<size_t>(std::count(rules.begin(), rules.end(), rule));
}
