/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <memory>
#include <string>

#include "microshop/config/Config.hpp"
#include "microshop/registry/KvStore.hpp"

namespace microshop::remote {

/// Endpoint that selects an in-process store.
inline const std::string MEMORY_ENDPOINT = "memory://";

/**
 * Open the coordination store named by the registry configuration:
 * "memory://" gives an in-process MemoryKvStore, anything else a ZmqKvStore
 * dialed within the dial timeout.
 *
 * @throws registry::StoreUnavailableError if no endpoint answered
 */
std::shared_ptr<registry::KvStore> open_store(const config::RegistryConfig& cfg);

} // namespace microshop::remote
