#include <gtest/gtest.h>
#include "iptables_packet_filter.hpp"
#include "guard_errors.hpp"
#include <cerrno>
#include <system_error>

// Records every argv and answers from a canned result
class RecordingRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv) const override {
        calls.push_back(argv);
        if (throw_on_run) {
            throw std::system_error(ENOENT, std::generic_category(), "execvp iptables");
        }
        return result;
    }

    mutable std::vector<std::vector<std::string>> calls;
    CommandResult result{true, 0, ""};
    bool throw_on_run = false;
};

class IptablesPacketFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner = std::make_shared<RecordingRunner>();
        filter = std::make_unique<IptablesPacketFilter>("INPUT", "iptables", runner);
    }

    std::shared_ptr<RecordingRunner> runner;
    std::unique_ptr<IptablesPacketFilter> filter;

    const FilterRule drop_rule{"203.0.113.7", 9901, FilterAction::DROP};
};

TEST_F(IptablesPacketFilterTest, InsertsAtHeadOfChain) {
    filter->insert_rule(drop_rule);

    ASSERT_EQ(runner->calls.size(), 1u);
    std::vector<std::string> expected = {
        "iptables", "-w", "-I", "INPUT", "1", "-s", "203.0.113.7",
        "-p", "tcp", "--dport", "9901", "-j", "DROP"};
    EXPECT_EQ(runner->calls[0], expected);
}

TEST_F(IptablesPacketFilterTest, DeletesMatchingRule) {
    FilterRule accept{"10.0.0.5", 9901, FilterAction::ACCEPT};
    filter->delete_rule(accept);

    ASSERT_EQ(runner->calls.size(), 1u);
    std::vector<std::string> expected = {
        "iptables", "-w", "-D", "INPUT", "-s", "10.0.0.5",
        "-p", "tcp", "--dport", "9901", "-j", "ACCEPT"};
    EXPECT_EQ(runner->calls[0], expected);
}

TEST_F(IptablesPacketFilterTest, NonZeroExitThrows) {
    runner->result = CommandResult{true, 1, "iptables: Bad rule"};

    try {
        filter->delete_rule(drop_rule);
        FAIL() << "expected FilterCommandError";
    } catch (const FilterCommandError& e) {
        EXPECT_EQ(e.exit_status(), 1);
        EXPECT_NE(std::string(e.what()).find("Bad rule"), std::string::npos);
    }
}

TEST_F(IptablesPacketFilterTest, SpawnFailureBecomesFilterCommandError) {
    runner->throw_on_run = true;
    EXPECT_THROW(filter->insert_rule(drop_rule), FilterCommandError);
}

TEST_F(IptablesPacketFilterTest, RefusesInvalidAddressBeforeSpawning) {
    FilterRule bad{"1.2.3.4 -j ACCEPT", 9901, FilterAction::DROP};
    EXPECT_THROW(filter->insert_rule(bad), ValidationError);
    EXPECT_TRUE(runner->calls.empty());
}

TEST_F(IptablesPacketFilterTest, ListsRulesForPort) {
    runner->result = CommandResult{true, 0,
        "-P INPUT ACCEPT\n"
        "-A INPUT -s 203.0.113.7/32 -p tcp -m tcp --dport 9901 -j DROP\n"
        "-A INPUT -s 10.0.0.5/32 -p tcp -m tcp --dport 9901 -j ACCEPT\n"
        "-A INPUT -s 192.0.2.1/32 -p tcp -m tcp --dport 22 -j DROP\n"
        "-A INPUT -i lo -j ACCEPT\n"};

    auto rules = filter->list_rules(9901);

    std::vector<std::string> expected_argv = {"iptables", "-w", "-S", "INPUT"};
    ASSERT_EQ(runner->calls.size(), 1u);
    EXPECT_EQ(runner->calls[0], expected_argv);

    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0], drop_rule);
    EXPECT_EQ(rules[1], (FilterRule{"10.0.0.5", 9901, FilterAction::ACCEPT}));
}

TEST(IptablesRuleSpecTest, ParsesManagedRules) {
    auto rule = IptablesPacketFilter::parse_rule_spec(
        "-A INPUT -s 198.51.100.9/32 -p tcp -m tcp --dport 9901 -j DROP", "INPUT");
    ASSERT_TRUE(rule.has_value());
    EXPECT_EQ(rule->address, "198.51.100.9");
    EXPECT_EQ(rule->port, 9901);
    EXPECT_EQ(rule->action, FilterAction::DROP);

    auto bare = IptablesPacketFilter::parse_rule_spec(
        "-A INPUT -s 198.51.100.9 -p tcp --dport 9901 -j ACCEPT", "INPUT");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->action, FilterAction::ACCEPT);
}

TEST(IptablesRuleSpecTest, IgnoresForeignRules) {
    const char* foreign[] = {
        "-P INPUT ACCEPT",
        "-N VNC",
        "-A OUTPUT -s 198.51.100.9/32 -p tcp -m tcp --dport 9901 -j DROP",
        "-A INPUT -s 198.51.100.0/24 -p tcp -m tcp --dport 9901 -j DROP",
        "-A INPUT -s 198.51.100.9/32 -p udp -m udp --dport 9901 -j DROP",
        "-A INPUT -s 198.51.100.9/32 -p tcp -m tcp --dport 5900:5910 -j DROP",
        "-A INPUT -s 198.51.100.9/32 -p tcp -m tcp --dport 9901 -j REJECT",
        "-A INPUT ! -s 198.51.100.9/32 -p tcp -m tcp --dport 9901 -j DROP",
        "-A INPUT -i eth0 -s 198.51.100.9/32 -p tcp -m tcp --dport 9901 -j DROP",
        "-A INPUT -p tcp -m tcp --dport 9901 -j DROP",
        "",
    };
    for (const char* line : foreign) {
        EXPECT_FALSE(IptablesPacketFilter::parse_rule_spec(line, "INPUT").has_value()) << line;
    }
}

TEST(CommandRunnerTest, CapturesOutputAndExitCode) {
    CommandRunner runner;

    auto ok = runner.run({"sh", "-c", "echo hello; echo oops >&2"});
    EXPECT_TRUE(ok.succeeded());
    EXPECT_NE(ok.output.find("hello"), std::string::npos);
    EXPECT_NE(ok.output.find("oops"), std::string::npos);

    auto failed = runner.run({"sh", "-c", "exit 3"});
    EXPECT_FALSE(failed.succeeded());
    EXPECT_EQ(failed.exit_code, 3);

    auto missing = runner.run({"/nonexistent/vnc-guard-binary"});
    EXPECT_EQ(missing.exit_code, 127);
}

TEST(CommandRunnerTest, DescribeJoinsArguments) {
    EXPECT_EQ(CommandRunner::describe({"iptables", "-w", "-S", "INPUT"}), "iptables -w -S INPUT");
}
