#ifndef PACKET_FILTER_HPP
#define PACKET_FILTER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class FilterAction : std::uint8_t {
    ACCEPT,
    DROP
};

const char* filter_action_to_string(FilterAction action);
std::optional<FilterAction> filter_action_from_string(const std::string& text);

// The opposite verdict (ACCEPT <-> DROP)
FilterAction opposite_action(FilterAction action);

// One (address, port, action) rule on the input chain
struct FilterRule {
    std::string address;
    std::uint16_t port = 0;
    FilterAction action = FilterAction::DROP;

    bool operator==(const FilterRule& other) const {
        return address == other.address && port == other.port && action == other.action;
    }
    bool operator!=(const FilterRule& other) const { return !(*this == other); }
};

std::string describe_rule(const FilterRule& rule);

/**
 * @brief Control interface of the kernel packet filter
 *
 * The live table is process-wide state shared with administrators and other
 * tools; implementations issue exactly one kernel call per method and keep no
 * cache of their own.
 */
class PacketFilter {
public:
    virtual ~PacketFilter() = default;

    // Inserts the rule at the head of the input chain. Throws FilterCommandError.
    virtual void insert_rule(const FilterRule& rule) = 0;

    // Deletes one copy of the rule. Throws FilterCommandError.
    virtual void delete_rule(const FilterRule& rule) = 0;

    // Live single-address TCP rules for the port, in chain order. Throws FilterCommandError.
    virtual std::vector<FilterRule> list_rules(std::uint16_t port) const = 0;
};

#endif // PACKET_FILTER_HPP
