#ifndef IP_ADDRESS_HPP
#define IP_ADDRESS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ip_address {

// True for a dotted-quad IPv4 host address with every octet in 0-255.
// Leading zeros, whitespace and CIDR suffixes are rejected.
bool is_valid_ipv4(std::string_view text);

// Returns the address unchanged, or throws ValidationError
const std::string& require_ipv4(const std::string& text);

/**
 * @brief Finds the first IPv4-shaped token in a log line
 *
 * A token is four groups of 1-3 digits separated by dots and not glued to
 * surrounding digits, dots or letters. Tokens whose octets fall outside 0-255
 * are skipped and the scan continues.
 */
std::optional<std::string> extract_first_ipv4(std::string_view line);

// Host-order numeric value for ordering; the address must be valid
std::uint32_t to_host_order(const std::string& ip);

// Numeric ordering used for every address listing
bool numeric_less(const std::string& lhs, const std::string& rhs);

} // namespace ip_address

#endif // IP_ADDRESS_HPP
