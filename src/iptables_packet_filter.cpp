#include "iptables_packet_filter.hpp"
#include "guard_errors.hpp"
#include "ip_address.hpp"
#include <sstream>
#include <system_error>

namespace {

bool parse_port(const std::string& text, std::uint16_t& port) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    unsigned long value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false; // ranges ("5900:5910") and names are not ours
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) {
        return false;
    }
    port = static_cast<std::uint16_t>(value);
    return true;
}

} // namespace

IptablesPacketFilter::IptablesPacketFilter(std::string chain, std::string binary,
                                           std::shared_ptr<const CommandRunner> runner)
    : chain_(std::move(chain)),
      binary_(std::move(binary)),
      runner_(runner ? std::move(runner) : std::make_shared<CommandRunner>()) {}

void IptablesPacketFilter::insert_rule(const FilterRule& rule) {
    auto argv = rule_arguments("-I", rule);
    CommandResult result = execute(argv);
    if (!result.succeeded()) {
        throw FilterCommandError("Failed to insert rule (" + describe_rule(rule) + "): " +
                                 CommandRunner::describe(argv) + " exited with status " +
                                 std::to_string(result.exit_code) +
                                 (result.output.empty() ? "" : ": " + result.output),
                                 result.exit_code);
    }
}

void IptablesPacketFilter::delete_rule(const FilterRule& rule) {
    auto argv = rule_arguments("-D", rule);
    CommandResult result = execute(argv);
    if (!result.succeeded()) {
        throw FilterCommandError("Failed to delete rule (" + describe_rule(rule) + "): " +
                                 CommandRunner::describe(argv) + " exited with status " +
                                 std::to_string(result.exit_code) +
                                 (result.output.empty() ? "" : ": " + result.output),
                                 result.exit_code);
    }
}

std::vector<FilterRule> IptablesPacketFilter::list_rules(std::uint16_t port) const {
    std::vector<std::string> argv = {binary_, "-w", "-S", chain_};
    CommandResult result = execute(argv);
    if (!result.succeeded()) {
        throw FilterCommandError("Failed to list rules: " + CommandRunner::describe(argv) +
                                 " exited with status " + std::to_string(result.exit_code) +
                                 (result.output.empty() ? "" : ": " + result.output),
                                 result.exit_code);
    }

    std::vector<FilterRule> rules;
    std::istringstream iss(result.output);
    std::string line;
    while (std::getline(iss, line)) {
        auto rule = parse_rule_spec(line, chain_);
        if (rule && rule->port == port) {
            rules.push_back(*rule);
        }
    }
    return rules;
}

std::optional<FilterRule> IptablesPacketFilter::parse_rule_spec(const std::string& line,
                                                                const std::string& chain) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }

    if (tokens.size() < 2 || tokens[0] != "-A" || tokens[1] != chain) {
        return std::nullopt;
    }

    FilterRule rule;
    bool have_source = false;
    bool have_port = false;
    bool have_target = false;
    bool is_tcp = false;

    for (size_t i = 2; i < tokens.size(); ++i) {
        const std::string& flag = tokens[i];
        bool has_value = i + 1 < tokens.size();

        if ((flag == "-s" || flag == "--source") && has_value) {
            std::string source = tokens[++i];
            size_t slash = source.find('/');
            if (slash != std::string::npos) {
                if (source.substr(slash + 1) != "32") {
                    return std::nullopt; // network ranges are not managed here
                }
                source.erase(slash);
            }
            if (!ip_address::is_valid_ipv4(source)) {
                return std::nullopt;
            }
            rule.address = source;
            have_source = true;
        } else if ((flag == "-p" || flag == "--protocol") && has_value) {
            is_tcp = tokens[++i] == "tcp";
        } else if (flag == "-m" && has_value) {
            if (tokens[++i] != "tcp") {
                return std::nullopt;
            }
        } else if ((flag == "--dport" || flag == "--destination-port") && has_value) {
            if (!parse_port(tokens[++i], rule.port)) {
                return std::nullopt;
            }
            have_port = true;
        } else if ((flag == "-j" || flag == "--jump") && has_value) {
            auto action = filter_action_from_string(tokens[++i]);
            if (!action) {
                return std::nullopt;
            }
            rule.action = *action;
            have_target = true;
        } else {
            // Negations, interfaces, comments and other matches mark foreign rules
            return std::nullopt;
        }
    }

    if (!have_source || !have_port || !have_target || !is_tcp) {
        return std::nullopt;
    }
    return rule;
}

std::vector<std::string> IptablesPacketFilter::rule_arguments(const std::string& verb,
                                                              const FilterRule& rule) const {
    // Re-validated here: this is the last stop before the kernel
    ip_address::require_ipv4(rule.address);

    std::vector<std::string> argv = {binary_, "-w", verb, chain_};
    if (verb == "-I") {
        argv.emplace_back("1");
    }
    argv.insert(argv.end(), {
        "-s", rule.address,
        "-p", "tcp",
        "--dport", std::to_string(rule.port),
        "-j", filter_action_to_string(rule.action)
    });
    return argv;
}

CommandResult IptablesPacketFilter::execute(const std::vector<std::string>& argv) const {
    try {
        return runner_->run(argv);
    } catch (const std::system_error& e) {
        throw FilterCommandError(std::string("Could not run packet filter command: ") + e.what(),
                                 -1);
    }
}
