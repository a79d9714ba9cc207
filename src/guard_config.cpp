#include "guard_config.hpp"
#include "guard_errors.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <sys/stat.h>

namespace {

struct EnvBinding {
    const char* variable;
    const char* key;
};

const EnvBinding kEnvBindings[] = {
    {"VNC_GUARD_PORT", "port"},
    {"VNC_GUARD_AUTH_LOG", "auth_log"},
    {"VNC_GUARD_AUDIT_LOG", "audit_log"},
    {"VNC_GUARD_SERVICE_LOG", "service_log"},
    {"VNC_GUARD_ALLOW_LIST", "allow_list"},
    {"VNC_GUARD_DENY_LIST", "deny_list"},
    {"VNC_GUARD_MAX_ATTEMPTS", "max_attempts"},
    {"VNC_GUARD_FAILURE_SIGNATURE", "failure_signature"},
    {"VNC_GUARD_CHAIN", "chain"},
    {"VNC_GUARD_IPTABLES", "iptables"},
    {"VNC_GUARD_POLL_MS", "poll_interval_ms"},
    {"VNC_GUARD_LOG_LEVEL", "log_level"},
};

unsigned long long parse_unsigned(const std::string& key, const std::string& value,
                                  unsigned long long max_value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigError("Invalid value for " + key + ": '" + value + "' is not a number");
    }
    errno = 0;
    unsigned long long parsed = std::strtoull(value.c_str(), nullptr, 10);
    if (errno == ERANGE || parsed > max_value) {
        throw ConfigError("Invalid value for " + key + ": " + value + " is out of range");
    }
    return parsed;
}

} // namespace

bool GuardConfig::load_from_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            return false;
        }
        throw ConfigError("Cannot read configuration " + path + ": " + std::strerror(errno));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration " + path);
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = string_utils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t equals = line.find('=');
        if (equals == std::string::npos) {
            throw ConfigError(path + ":" + std::to_string(line_number) +
                              ": expected 'key = value'");
        }

        std::string key = string_utils::trim(line.substr(0, equals));
        std::string value = string_utils::trim(line.substr(equals + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        try {
            set(key, value);
        } catch (const ConfigError& e) {
            throw ConfigError(path + ":" + std::to_string(line_number) + ": " + e.what());
        }
    }
    return true;
}

void GuardConfig::apply_environment() {
    for (const auto& binding : kEnvBindings) {
        const char* value = std::getenv(binding.variable);
        if (value != nullptr) {
            try {
                set(binding.key, value);
            } catch (const ConfigError& e) {
                throw ConfigError(std::string(binding.variable) + ": " + e.what());
            }
        }
    }
}

void GuardConfig::set(const std::string& key, const std::string& value) {
    if (key == "port") {
        port = static_cast<uint16_t>(parse_unsigned(key, value, 65535));
    } else if (key == "auth_log") {
        auth_log_path = value;
    } else if (key == "audit_log") {
        audit_log_path = value;
    } else if (key == "service_log") {
        service_log_path = value;
    } else if (key == "allow_list") {
        allow_list_path = value;
    } else if (key == "deny_list") {
        deny_list_path = value;
    } else if (key == "max_attempts") {
        max_attempts = static_cast<unsigned int>(
            parse_unsigned(key, value, std::numeric_limits<unsigned int>::max()));
    } else if (key == "failure_signature") {
        failure_signature = value;
    } else if (key == "chain") {
        chain = value;
    } else if (key == "iptables") {
        iptables_binary = value;
    } else if (key == "max_tracked") {
        max_tracked = static_cast<size_t>(
            parse_unsigned(key, value, std::numeric_limits<size_t>::max()));
    } else if (key == "poll_interval_ms") {
        poll_interval = std::chrono::milliseconds(parse_unsigned(key, value, 3600000));
    } else if (key == "max_backoff_ms") {
        max_backoff = std::chrono::milliseconds(parse_unsigned(key, value, 3600000));
    } else if (key == "log_level") {
        log_level = parse_log_level(value);
    } else {
        throw ConfigError("Unknown configuration key '" + key + "'");
    }
}

void GuardConfig::validate() const {
    if (port == 0) {
        throw ConfigError("port must be between 1 and 65535");
    }
    if (max_attempts < 1) {
        throw ConfigError("max_attempts must be at least 1");
    }
    if (auth_log_path.empty() || audit_log_path.empty() || service_log_path.empty()) {
        throw ConfigError("log paths must not be empty");
    }
    if (allow_list_path.empty() || deny_list_path.empty()) {
        throw ConfigError("list paths must not be empty");
    }
    if (allow_list_path == deny_list_path) {
        throw ConfigError("allow_list and deny_list must be different files");
    }
    if (failure_signature.empty()) {
        throw ConfigError("failure_signature must not be empty");
    }
    if (iptables_binary.empty()) {
        throw ConfigError("iptables must name a binary");
    }
    if (chain.empty() || chain.size() > 28 ||
        !std::all_of(chain.begin(), chain.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '_' || c == '-';
        })) {
        throw ConfigError("chain '" + chain + "' is not a valid chain name");
    }
    if (max_tracked == 0) {
        throw ConfigError("max_tracked must be at least 1");
    }
    if (poll_interval.count() <= 0) {
        throw ConfigError("poll_interval_ms must be positive");
    }
    if (max_backoff < poll_interval) {
        throw ConfigError("max_backoff_ms must not be below poll_interval_ms");
    }
}

std::string GuardConfig::summary() const {
    std::ostringstream out;
    out << "port=" << port
        << " auth_log=" << auth_log_path
        << " allow_list=" << allow_list_path
        << " deny_list=" << deny_list_path
        << " max_attempts=" << max_attempts
        << " chain=" << chain
        << " poll_interval_ms=" << poll_interval.count();
    return out.str();
}

FileLogger::LogLevel GuardConfig::parse_log_level(const std::string& value) {
    std::string lower = string_utils::to_lower(value);
    if (lower == "debug") return FileLogger::LogLevel::LOG_DEBUG;
    if (lower == "info") return FileLogger::LogLevel::LOG_INFO;
    if (lower == "warning" || lower == "warn") return FileLogger::LogLevel::LOG_WARNING;
    if (lower == "error") return FileLogger::LogLevel::LOG_ERROR;
    if (lower == "critical") return FileLogger::LogLevel::LOG_CRITICAL;
    throw ConfigError("Unknown log level '" + value + "'");
}
