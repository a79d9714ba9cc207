#ifndef CAPABILITIES_HPP
#define CAPABILITIES_HPP

#include <string>

// Process privilege checks for commands that touch the packet filter
namespace capabilities {

// True when CAP_NET_ADMIN is in the effective set. A query failure reads as false.
bool has_net_admin();

bool is_effective_root();

// Human-readable capability text of this process, e.g. "cap_net_admin=ep"
std::string describe_current();

} // namespace capabilities

#endif // CAPABILITIES_HPP
