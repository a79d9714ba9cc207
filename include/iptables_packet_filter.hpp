#ifndef IPTABLES_PACKET_FILTER_HPP
#define IPTABLES_PACKET_FILTER_HPP

#include "packet_filter.hpp"
#include "command_runner.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief PacketFilter backed by the iptables binary
 *
 *   insert:  iptables -w -I <chain> 1 -s <ip> -p tcp --dport <port> -j <ACTION>
 *   delete:  iptables -w -D <chain> -s <ip> -p tcp --dport <port> -j <ACTION>
 *   list:    iptables -w -S <chain>
 *
 * "-w" waits for the xtables lock instead of failing when another tool is
 * editing the table at the same moment.
 */
class IptablesPacketFilter : public PacketFilter {
public:
    explicit IptablesPacketFilter(std::string chain = "INPUT",
                                  std::string binary = "iptables",
                                  std::shared_ptr<const CommandRunner> runner = nullptr);

    void insert_rule(const FilterRule& rule) override;
    void delete_rule(const FilterRule& rule) override;
    std::vector<FilterRule> list_rules(std::uint16_t port) const override;

    // Parses one "iptables -S" line. Returns nothing for rules this engine does
    // not manage (ranges, other protocols, other targets, negations).
    static std::optional<FilterRule> parse_rule_spec(const std::string& line,
                                                     const std::string& chain);

    const std::string& chain() const { return chain_; }

private:
    std::string chain_;
    std::string binary_;
    std::shared_ptr<const CommandRunner> runner_;

    std::vector<std::string> rule_arguments(const std::string& verb, const FilterRule& rule) const;
    CommandResult execute(const std::vector<std::string>& argv) const;
};

#endif // IPTABLES_PACKET_FILTER_HPP
