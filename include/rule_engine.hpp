#ifndef RULE_ENGINE_HPP
#define RULE_ENGINE_HPP

#include "packet_filter.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class ListStore;

/**
 * @brief Keeps live packet-filter rules for the protected port in step with the lists
 *
 * The kernel table is treated as a replica that can drift: every mutating call
 * reads the live rules first and only issues a kernel call when the desired
 * state is not already present. Rules for other ports are never touched.
 */
class RuleEngine {
public:
    struct ReconcileReport {
        size_t rules_applied = 0;
        size_t duplicates_removed = 0;
        size_t conflicts_revoked = 0;
        size_t failures = 0;
        std::vector<std::string> errors;

        bool clean() const { return failures == 0; }
    };

    RuleEngine(PacketFilter& filter, std::uint16_t protected_port);

    // Returns true when a kernel call was issued, false when already present.
    // Throws FilterCommandError.
    bool apply(const std::string& ip, FilterAction action);

    // Removes every copy of the rule. Returns true when anything was removed.
    // Throws FilterCommandError.
    bool revoke(const std::string& ip, FilterAction action);

    // Live rules for the protected port. Throws FilterCommandError.
    std::vector<FilterRule> list() const;

    bool has_rule(const std::string& ip, FilterAction action) const;

    // Applies missing ACCEPT/DROP rules for every listed address, removes
    // duplicate copies and revokes opposite-verdict rules for listed addresses.
    // Continues past individual failures.
    ReconcileReport reconcile(const ListStore& store);

    std::uint16_t protected_port() const { return port_; }

private:
    PacketFilter& filter_;
    std::uint16_t port_;

    FilterRule make_rule(const std::string& ip, FilterAction action) const;
    static size_t count_matching(const std::vector<FilterRule>& rules, const FilterRule& rule);

    void reconcile_address(const std::vector<FilterRule>& live, const std::string& ip,
                           FilterAction wanted, ReconcileReport& report);
};

#endif // RULE_ENGINE_HPP
