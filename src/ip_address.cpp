#include "ip_address.hpp"
#include "guard_errors.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <cctype>

namespace {

constexpr size_t kMaxIpv4Length = 15; // "255.255.255.255"

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Characters that make a dotted run part of a larger token (version strings, hostnames)
bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '_';
}

// Matches ([0-9]{1,3}\.){3}[0-9]{1,3} at pos; returns the match length or 0
size_t match_dotted_quad(std::string_view text, size_t pos) {
    size_t i = pos;
    for (int group = 0; group < 4; ++group) {
        size_t digits = 0;
        while (i < text.size() && is_digit(text[i]) && digits < 3) {
            ++i;
            ++digits;
        }
        if (digits == 0) {
            return 0;
        }
        if (group < 3) {
            if (i >= text.size() || text[i] != '.') {
                return 0;
            }
            ++i;
        }
    }
    return i - pos;
}

} // namespace

namespace ip_address {

bool is_valid_ipv4(std::string_view text) {
    if (text.empty() || text.size() > kMaxIpv4Length) {
        return false;
    }

    for (char c : text) {
        if (!is_digit(c) && c != '.') {
            return false;
        }
    }

    // inet_pton(AF_INET) accepts only the full dotted-decimal form
    std::string candidate(text);
    struct in_addr addr;
    if (inet_pton(AF_INET, candidate.c_str(), &addr) != 1) {
        return false;
    }

    // Reject leading zeros ("010.0.0.1"), which some libcs accept and iptables reads as octal
    size_t start = 0;
    while (start < candidate.size()) {
        size_t end = candidate.find('.', start);
        if (end == std::string::npos) {
            end = candidate.size();
        }
        if (end - start > 1 && candidate[start] == '0') {
            return false;
        }
        start = end + 1;
    }
    return true;
}

const std::string& require_ipv4(const std::string& text) {
    if (!is_valid_ipv4(text)) {
        throw ValidationError("Invalid IPv4 address: '" + text + "'");
    }
    return text;
}

std::optional<std::string> extract_first_ipv4(std::string_view line) {
    size_t pos = 0;
    while (pos < line.size()) {
        if (!is_digit(line[pos]) || (pos > 0 && is_token_char(line[pos - 1]))) {
            ++pos;
            continue;
        }

        size_t length = match_dotted_quad(line, pos);
        if (length == 0) {
            ++pos;
            continue;
        }

        size_t end = pos + length;
        // A trailing dot ends a sentence; a trailing digit or dot-digit means a longer token
        bool glued = end < line.size() && is_token_char(line[end]) &&
                     !(line[end] == '.' && (end + 1 >= line.size() || !is_digit(line[end + 1])));
        if (!glued) {
            std::string_view candidate = line.substr(pos, length);
            if (is_valid_ipv4(candidate)) {
                return std::string(candidate);
            }
        }

        // Skip past this run so its inner digits are not rescanned as a new token
        pos = end;
        while (pos < line.size() && (is_digit(line[pos]) || line[pos] == '.')) {
            ++pos;
        }
    }
    return std::nullopt;
}

std::uint32_t to_host_order(const std::string& ip) {
    struct in_addr addr;
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
        throw ValidationError("Invalid IPv4 address: '" + ip + "'");
    }
    return ntohl(addr.s_addr);
}

bool numeric_less(const std::string& lhs, const std::string& rhs) {
    return to_host_order(lhs) < to_host_order(rhs);
}

} // namespace ip_address
