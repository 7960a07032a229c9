/**
 * @file container_client.cpp
 * @brief Container client error helpers
 *
 * @date 2025
 */

#include "codebox/utils/container_client.hpp"

namespace codebox {
namespace utils {

const char* ToString(ClientErrorKind kind) {
    switch (kind) {
        case ClientErrorKind::kNotFound:          return "not found";
        case ClientErrorKind::kContainerError:    return "container error";
        case ClientErrorKind::kTimeout:           return "timeout";
        case ClientErrorKind::kApi:               return "api error";
        case ClientErrorKind::kDaemonUnavailable: return "daemon unavailable";
    }
    return "unknown";
}

} // namespace utils
} // namespace codebox
