#include "packet_filter.hpp"

const char* filter_action_to_string(FilterAction action) {
    switch (action) {
        case FilterAction::ACCEPT: return "ACCEPT";
        case FilterAction::DROP: return "DROP";
        default: return "UNKNOWN";
    }
}

std::optional<FilterAction> filter_action_from_string(const std::string& text) {
    if (text == "ACCEPT") {
        return FilterAction::ACCEPT;
    }
    if (text == "DROP") {
        return FilterAction::DROP;
    }
    return std::nullopt;
}

FilterAction opposite_action(FilterAction action) {
    return action == FilterAction::ACCEPT ? FilterAction::DROP : FilterAction::ACCEPT;
}

std::string describe_rule(const FilterRule& rule) {
    return std::string(filter_action_to_string(rule.action)) + " tcp from " + rule.address +
           " to port " + std::to_string(rule.port);
}
