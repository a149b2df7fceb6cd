/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <string>

namespace microshop::registry {

/**
 * ServiceInstance - one running replica of a named service
 *
 * Created at process start and immutable afterwards.
 */
struct ServiceInstance {
    std::string name;
    std::string host;
    int port = 0;

    /// Dial address, "host:port".
    std::string address() const { return host + ":" + std::to_string(port); }

    bool operator==(const ServiceInstance& o) const {
        return name == o.name && host == o.host && port == o.port;
    }
    bool operator!=(const ServiceInstance& o) const { return !(*this == o); }
};

} // namespace microshop::registry
