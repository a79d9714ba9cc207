#ifndef GUARD_CONFIG_HPP
#define GUARD_CONFIG_HPP

#include "file_logger.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @brief Runtime settings for vnc-guard
 *
 * Defaults describe the stock deployment. load_from_file() overlays an
 * optional "key = value" file, apply_environment() overlays VNC_GUARD_*
 * variables on top, and validate() rejects anything unusable before the
 * engine is built.
 */
struct GuardConfig {
    static constexpr const char* kDefaultConfigPath = "/etc/vnc-guard.conf";

    uint16_t port = 9901;
    std::string auth_log_path = "/home/desktop/.vnc/ubuntu:1.log";
    std::string audit_log_path = "/var/log/vnc-protection.log";
    std::string service_log_path = "/var/log/vnc-guard/vnc-guard.log";
    std::string allow_list_path = "/etc/vnc-protection-whitelist";
    std::string deny_list_path = "/etc/vnc-protection-blacklist";
    unsigned int max_attempts = 1;
    std::string failure_signature = "authentication failed";
    std::string chain = "INPUT";
    std::string iptables_binary = "iptables";
    size_t max_tracked = 100000;
    std::chrono::milliseconds poll_interval{250};
    std::chrono::milliseconds max_backoff{30000};
    FileLogger::LogLevel log_level = FileLogger::LogLevel::LOG_INFO;

    // Returns false when the file does not exist. Throws ConfigError on a
    // malformed line or an unknown key.
    bool load_from_file(const std::string& path);

    // Overrides from VNC_GUARD_* environment variables. Throws ConfigError.
    void apply_environment();

    // Throws ConfigError on an unknown key or unparsable value
    void set(const std::string& key, const std::string& value);

    void validate() const;

    std::string summary() const;

    static FileLogger::LogLevel parse_log_level(const std::string& value);
};

#endif // GUARD_CONFIG_HPP
