/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "microshop/registry/Lease.hpp"
#include "microshop/registry/RegistryError.hpp"

namespace microshop::registry {

struct KeyValue {
    std::string key;
    std::string value;
    LeaseId lease = NO_LEASE;
};

/**
 * KvStore - coordination store contract used by the RegistryClient
 *
 * Implementations must be safe for concurrent use: register, discover and
 * deregister share one store, and lease renewal runs on its own thread.
 *
 * Every operation throws StoreUnavailableError when the store cannot be
 * reached or does not answer in time.
 */
class KvStore {
public:
    virtual ~KvStore() = default;

    /// Grant a new lease with the given TTL.
    virtual Lease grant_lease(std::chrono::seconds ttl) = 0;

    /**
     * Renew a lease for another full TTL.
     * @return false if the store no longer knows the lease
     */
    virtual bool keep_alive(LeaseId lease) = 0;

    /// Revoke a lease and delete every key bound to it. Unknown leases are ignored.
    virtual void revoke_lease(LeaseId lease) = 0;

    /**
     * Write key = value, bound to lease (NO_LEASE for a permanent key).
     * Overwrites an existing value. Last write wins.
     * @throws LeaseNotFoundError if the lease is unknown
     */
    virtual void put(const std::string& key, const std::string& value, LeaseId lease) = 0;

    /// All live keys starting with prefix, in key order.
    virtual std::vector<KeyValue> get_prefix(const std::string& prefix) = 0;

    /**
     * Delete one key.
     * @return true if the key existed
     */
    virtual bool erase(const std::string& key) = 0;

    /// Release the connection. Later calls throw StoreUnavailableError.
    virtual void close() = 0;
};

} // namespace microshop::registry
