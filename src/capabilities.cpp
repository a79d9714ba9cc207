#include "capabilities.hpp"
#include "file_logger.hpp"
#include <sys/capability.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace capabilities {

bool has_net_admin() {
    cap_t caps = cap_get_proc();
    if (caps == nullptr) {
        GUARD_LOG_WARNING(std::string("Failed to get process capabilities: ") + std::strerror(errno));
        return false;
    }

    cap_flag_value_t value = CAP_CLEAR;
    if (cap_get_flag(caps, CAP_NET_ADMIN, CAP_EFFECTIVE, &value) != 0) {
        int flag_errno = errno;
        cap_free(caps);
        GUARD_LOG_WARNING(std::string("Failed to read CAP_NET_ADMIN flag: ") +
                          std::strerror(flag_errno));
        return false;
    }

    cap_free(caps);
    return value == CAP_SET;
}

bool is_effective_root() {
    return geteuid() == 0;
}

std::string describe_current() {
    cap_t caps = cap_get_proc();
    if (caps == nullptr) {
        return "unknown";
    }

    std::string text = "unknown";
    char* raw = cap_to_text(caps, nullptr);
    if (raw != nullptr) {
        text = raw;
        cap_free(raw);
    }
    cap_free(caps);
    return text;
}

} // namespace capabilities
