/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/remote/StoreFactory.hpp"
#include "microshop/registry/MemoryKvStore.hpp"
#include "microshop/remote/ZmqKvStore.hpp"
#include <iostream>

namespace microshop::remote {

std::shared_ptr<registry::KvStore> open_store(const config::RegistryConfig& cfg) {
    if (!cfg.endpoints.empty() && cfg.endpoints.front() == MEMORY_ENDPOINT) {
        std::cout << "StoreFactory: using in-process store" << std::endl;
        return std::make_shared<registry::MemoryKvStore>();
    }
    return ZmqKvStore::connect(cfg.endpoints,
                               std::chrono::duration_cast<std::chrono::milliseconds>(cfg.dial_timeout),
                               cfg.request_timeout);
}

} // namespace microshop::remote
