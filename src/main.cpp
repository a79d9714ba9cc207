#include "access_control_engine.hpp"
#include "attempt_tracker.hpp"
#include "capabilities.hpp"
#include "file_logger.hpp"
#include "guard_config.hpp"
#include "guard_errors.hpp"
#include "iptables_packet_filter.hpp"
#include "list_store.hpp"
#include "log_monitor.hpp"
#include "log_tailer.hpp"
#include "rule_engine.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// ============================================================================
// Global state
// ============================================================================

std::atomic<bool> g_running(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;  // Only set flag, shutdown happens in handle_monitor()
    }
}

namespace {

constexpr const char* kProgramName = "vnc-guard";
constexpr const char* kVersion = "1.0.0";

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;

// Everything one invocation works with, built from the loaded configuration
struct GuardContext {
    GuardConfig config;
    std::unique_ptr<ListStore> store;
    std::unique_ptr<IptablesPacketFilter> filter;
    std::unique_ptr<RuleEngine> rules;
    std::unique_ptr<AttemptTracker> tracker;
    std::unique_ptr<AccessControlEngine> engine;
};

std::unique_ptr<GuardContext> g_context;

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    using Handler = std::function<int(const std::vector<std::string>&)>;

    struct Command {
        std::string name;
        std::string description;
        Handler handler;
        std::vector<std::string> args_help;
        std::vector<std::string> aliases;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(const std::string& name, const std::string& description, Handler handler,
                     const std::vector<std::string>& args_help = {},
                     const std::vector<std::string>& aliases = {}) {
        commands_[name] = {name, description, std::move(handler), args_help, aliases};
        for (const auto& alias : aliases) {
            aliases_[alias] = name;
        }
    }

    // args excludes the program name and any global options
    int parse_and_execute(const std::vector<std::string>& args) const {
        if (args.empty()) {
            print_usage(std::cerr);
            return kExitFailure;
        }

        std::string cmd = args[0];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage(std::cout);
            return kExitOk;
        }
        if (cmd == "version" || cmd == "--version") {
            std::cout << prog_name_ << " " << version_ << std::endl;
            return kExitOk;
        }

        auto alias = aliases_.find(cmd);
        if (alias != aliases_.end()) {
            cmd = alias->second;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << args[0] << "\n";
            print_usage(std::cerr);
            return kExitFailure;
        }

        const Command& command = it->second;
        std::vector<std::string> command_args(args.begin() + 1, args.end());
        if (command_args.size() != command.args_help.size()) {
            std::cerr << "Usage: " << prog_name_ << " " << command.name;
            for (const auto& arg : command.args_help) {
                std::cerr << " " << arg;
            }
            std::cerr << "\n";
            return kExitFailure;
        }
        return command.handler(command_args);
    }

    void print_usage(std::ostream& out) const {
        out << prog_name_ << " " << version_ << " - VNC access guard\n";
        out << "\nUsage: " << prog_name_ << " [--config <path>] <command> [args]\n\n";
        out << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            out << "  " << cmd.name;
            for (const auto& arg : cmd.args_help) {
                out << " " << arg;
            }
            if (!cmd.aliases.empty()) {
                out << "  (alias:";
                for (const auto& alias : cmd.aliases) {
                    out << " " << alias;
                }
                out << ")";
            }
            out << "\n    " << cmd.description << "\n";
        }
        out << "  help\n    Show this help message\n";
        out << "\nOptions:\n  --config <path>\n    Configuration file (default "
            << GuardConfig::kDefaultConfigPath << ")\n";
    }

private:
    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
    std::map<std::string, std::string> aliases_;
};

// ============================================================================
// Setup
// ============================================================================

GuardConfig load_config(const std::string& config_path, bool explicit_path) {
    GuardConfig config;
    if (!config.load_from_file(config_path) && explicit_path) {
        throw ConfigError("Configuration file " + config_path + " does not exist");
    }
    config.apply_environment();
    config.validate();
    return config;
}

void start_logging(const GuardConfig& config, bool foreground) {
    FileLogger::FileConfig service;
    service.file_path = config.service_log_path;
    service.echo_to_console = foreground;
    service.min_level = config.log_level;

    FileLogger::FileConfig audit;
    audit.file_path = config.audit_log_path;
    audit.min_level = FileLogger::LogLevel::LOG_DEBUG;
    audit.flush_interval = std::chrono::milliseconds(500);

    if (!g_file_logger.initialize({{FileLogger::FileType::SERVICE_LOG, service},
                                   {FileLogger::FileType::AUDIT_LOG, audit}})) {
        std::cerr << "Warning: log directories could not be created; "
                  << "entries will be dropped\n";
    }
    g_file_logger.start();
}

void stop_logging() {
    g_file_logger.drain();
    g_file_logger.stop();
}

std::unique_ptr<GuardContext> build_context(GuardConfig config) {
    auto ctx = std::make_unique<GuardContext>();
    ctx->config = std::move(config);

    ctx->store = std::make_unique<ListStore>(ctx->config.allow_list_path,
                                             ctx->config.deny_list_path);
    ctx->store->load();

    ctx->filter = std::make_unique<IptablesPacketFilter>(ctx->config.chain,
                                                         ctx->config.iptables_binary);
    ctx->rules = std::make_unique<RuleEngine>(*ctx->filter, ctx->config.port);
    ctx->tracker = std::make_unique<AttemptTracker>(ctx->config.max_tracked);
    ctx->engine = std::make_unique<AccessControlEngine>(*ctx->store, *ctx->rules,
                                                        *ctx->tracker,
                                                        ctx->config.max_attempts);
    return ctx;
}

void warn_if_unprivileged() {
    if (!capabilities::is_effective_root() && !capabilities::has_net_admin()) {
        std::cerr << "Warning: running without CAP_NET_ADMIN ("
                  << capabilities::describe_current()
                  << "); packet-filter commands will likely fail\n";
    }
}

// ============================================================================
// Output helpers
// ============================================================================

void print_rules(const std::vector<FilterRule>& rules, uint16_t port) {
    std::cout << "Live rules for port " << port << ":\n";
    if (rules.empty()) {
        std::cout << "  (none)\n";
        return;
    }
    for (const auto& rule : rules) {
        std::cout << "  " << filter_action_to_string(rule.action) << "  " << rule.address << "\n";
    }
}

void print_list(const std::string& title, const std::vector<std::string>& entries) {
    std::cout << title << " (" << entries.size() << "):\n";
    if (entries.empty()) {
        std::cout << "  (empty)\n";
        return;
    }
    for (const auto& entry : entries) {
        std::cout << "  " << entry << "\n";
    }
}

void print_live_rules() {
    try {
        print_rules(g_context->rules->list(), g_context->config.port);
    } catch (const FilterCommandError& e) {
        std::cerr << "Warning: could not read live rules: " << e.what() << "\n";
    }
}

std::string describe_change(const OperationResult& result, ListStore::ListKind kind) {
    std::string list_name = ListStore::list_kind_to_string(kind);
    switch (result.change) {
        case ListChange::ADDED:
            return result.moved_from_other_list
                ? result.address + " added to the " + list_name + " (moved from the " +
                      ListStore::list_kind_to_string(ListStore::other(kind)) + ")"
                : result.address + " added to the " + list_name;
        case ListChange::ALREADY_PRESENT:
            return result.address + " is already on the " + list_name;
        case ListChange::REMOVED:
            return result.address + " removed from the " + list_name;
        case ListChange::NOT_PRESENT:
            return result.address + " is not on the " + list_name;
    }
    return result.address;
}

int report(const OperationResult& result, ListStore::ListKind kind) {
    std::cout << describe_change(result, kind) << "\n";
    if (!result.rules_synced) {
        std::cerr << "Warning: live rules are out of step (" << result.rule_error
                  << "); run '" << kProgramName << " reconcile'\n";
    }
    print_live_rules();
    return kExitOk;
}

// ============================================================================
// Command handlers
// ============================================================================

int handle_allow(const std::vector<std::string>& args) {
    warn_if_unprivileged();
    return report(g_context->engine->allow(args[0]), ListStore::ListKind::ALLOWED);
}

int handle_unallow(const std::vector<std::string>& args) {
    warn_if_unprivileged();
    return report(g_context->engine->unallow(args[0]), ListStore::ListKind::ALLOWED);
}

int handle_deny(const std::vector<std::string>& args) {
    warn_if_unprivileged();
    return report(g_context->engine->deny(args[0]), ListStore::ListKind::DENIED);
}

int handle_undeny(const std::vector<std::string>& args) {
    warn_if_unprivileged();
    return report(g_context->engine->undeny(args[0]), ListStore::ListKind::DENIED);
}

int handle_show(const std::vector<std::string>&) {
    const auto& store = *g_context->store;
    const std::string allow_title = "Allow-list " + store.path(ListStore::ListKind::ALLOWED);
    const std::string deny_title = "Deny-list " + store.path(ListStore::ListKind::DENIED);

    try {
        InspectSnapshot snapshot = g_context->engine->inspect();
        print_list(allow_title, snapshot.allowed);
        print_list(deny_title, snapshot.denied);
        print_rules(snapshot.live_rules, g_context->config.port);
    } catch (const FilterCommandError& e) {
        // Lists are still worth showing when the rule table is unreadable
        print_list(allow_title, store.all(ListStore::ListKind::ALLOWED));
        print_list(deny_title, store.all(ListStore::ListKind::DENIED));
        std::cerr << "Warning: could not read live rules: " << e.what() << "\n";
    }
    return kExitOk;
}

int handle_reconcile(const std::vector<std::string>&) {
    warn_if_unprivileged();
    auto result = g_context->engine->reconcile();

    std::cout << "Reconciled port " << g_context->config.port << ": "
              << result.rules_applied << " applied, "
              << result.duplicates_removed << " duplicates removed, "
              << result.conflicts_revoked << " conflicts revoked, "
              << result.failures << " failures\n";
    for (const auto& error : result.errors) {
        std::cerr << "  " << error << "\n";
    }
    print_live_rules();
    return result.clean() ? kExitOk : kExitFailure;
}

int handle_check_rules(const std::vector<std::string>&) {
    print_rules(g_context->rules->list(), g_context->config.port);
    return kExitOk;
}

int handle_monitor(const std::vector<std::string>&) {
    const GuardConfig& config = g_context->config;
    warn_if_unprivileged();

    GUARD_LOG_INFO("Starting monitor: " + config.summary());

    auto startup = g_context->engine->reconcile();
    if (!startup.clean()) {
        GUARD_LOG_WARNING("Startup reconciliation left " + std::to_string(startup.failures) +
                          " addresses out of step");
    }

    LogTailer::Options tail_options;
    tail_options.poll_interval = config.poll_interval;
    tail_options.max_backoff = config.max_backoff;
    LogTailer tailer(config.auth_log_path, tail_options);
    LogMonitor monitor(tailer, *g_context->engine, config.failure_signature);

    std::thread worker([&monitor]() { monitor.run(); });

    while (g_running && monitor.state() != LogMonitor::State::STOPPED) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    GUARD_LOG_INFO("Shutdown requested, stopping monitor");
    monitor.stop();
    worker.join();

    auto metrics = g_context->engine->get_metrics();
    GUARD_LOG_INFO("Engine totals: " + std::to_string(metrics.failures_observed) +
                   " failures observed, " + std::to_string(metrics.addresses_denied) +
                   " addresses denied, " + std::to_string(metrics.rule_errors) +
                   " rule errors");

    auto logger = g_file_logger.get_metrics();
    if (logger.dropped_entries > 0) {
        GUARD_LOG_WARNING("Logger dropped " + std::to_string(logger.dropped_entries) + " of " +
                          std::to_string(logger.total_entries) + " entries");
    }
    return kExitOk;
}

// Splits "--config <path>" off the front of argv
bool extract_global_options(std::vector<std::string>& args, std::string& config_path) {
    bool explicit_path = false;
    auto it = std::find(args.begin(), args.end(), "--config");
    if (it != args.end()) {
        if (it + 1 == args.end()) {
            throw ValidationError("--config requires a path");
        }
        config_path = *(it + 1);
        args.erase(it, it + 2);
        explicit_path = true;
    }
    return explicit_path;
}

bool needs_context(const std::vector<std::string>& args) {
    if (args.empty()) {
        return false;
    }
    const std::string& cmd = args[0];
    return cmd != "help" && cmd != "--help" && cmd != "-h" &&
           cmd != "version" && cmd != "--version";
}

} // namespace

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    g_running = true;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ArgumentParser parser(kProgramName, kVersion);

    parser.add_command("allow", "Trust an address; always accepted on the VNC port",
                       handle_allow, {"<ipv4>"}, {"--whitelist"});
    parser.add_command("unallow", "Remove an address from the allow-list",
                       handle_unallow, {"<ipv4>"}, {"--unwhitelist"});
    parser.add_command("deny", "Block an address on the VNC port",
                       handle_deny, {"<ipv4>"}, {"--blacklist"});
    parser.add_command("undeny", "Lift the block on an address",
                       handle_undeny, {"<ipv4>"}, {"--unblacklist"});
    parser.add_command("show", "Print both lists and the live rules",
                       handle_show, {}, {"--show"});
    parser.add_command("monitor", "Follow the VNC log and block failing addresses",
                       handle_monitor, {}, {"--monitor"});
    parser.add_command("reconcile", "Re-apply the lists to the packet filter",
                       handle_reconcile, {}, {"--apply-rules"});
    parser.add_command("check-rules", "Print the live rules for the VNC port",
                       handle_check_rules, {}, {"--check-rules"});

    std::vector<std::string> args(argv + 1, argv + argc);
    int exit_code = kExitFailure;
    bool logging = false;

    try {
        std::string config_path = GuardConfig::kDefaultConfigPath;
        bool explicit_path = extract_global_options(args, config_path);

        if (needs_context(args)) {
            GuardConfig config = load_config(config_path, explicit_path);
            bool foreground = args[0] == "monitor" || args[0] == "--monitor";
            start_logging(config, foreground);
            logging = true;
            g_context = build_context(std::move(config));
        }

        exit_code = parser.parse_and_execute(args);
    } catch (const ValidationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = kExitFailure;
    } catch (const PersistenceError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        GUARD_LOG_ERROR(std::string("Persistence failure: ") + e.what());
        exit_code = kExitFailure;
    } catch (const GuardError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        GUARD_LOG_ERROR(e.what());
        exit_code = kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        GUARD_LOG_ERROR(std::string("Fatal: ") + e.what());
        exit_code = kExitFailure;
    }

    g_context.reset();
    if (logging) {
        stop_logging();
    }
    return exit_code;
}
