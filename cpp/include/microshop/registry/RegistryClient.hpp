/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "microshop/registry/KvStore.hpp"
#include "microshop/registry/Lease.hpp"
#include "microshop/registry/LeaseKeeper.hpp"
#include "microshop/registry/RegistryError.hpp"
#include "microshop/registry/ServiceInstance.hpp"

namespace microshop::registry {

/// Namespace prefix used when none is configured.
inline const std::string DEFAULT_PREFIX = "/microshop/services/";

/**
 * RegistryClient - lease-based service registration and discovery
 *
 * The RegistryClient:
 * - Binds one record per instance, <prefix><name>/<host>:<port> -> <host>:<port>,
 *   to a lease and keeps the lease alive in the background
 * - Answers discovery queries by prefix
 * - Deregisters explicitly on shutdown; the lease TTL cleans up after crashes
 *
 * The store connection is shared by all calls and by the renewal threads.
 *
 * Usage:
 *   RegistryClient registry(store, "/microshop/services/");
 *   registry.register_instance({"order-service", "10.0.0.5", 50052});
 *
 *   auto addresses = registry.discover("user-service");  // may be empty
 *
 *   registry.deregister({"order-service", "10.0.0.5", 50052});
 *   registry.close();
 */
class RegistryClient {
public:
    /**
     * @param store Store connection, shared with the renewal threads
     * @param prefix Namespace prefix, e.g. "/microshop/services/"
     */
    explicit RegistryClient(std::shared_ptr<KvStore> store, std::string prefix = DEFAULT_PREFIX);

    ~RegistryClient();

    RegistryClient(const RegistryClient&) = delete;
    RegistryClient& operator=(const RegistryClient&) = delete;

    /**
     * Register an instance under a fresh lease and start renewing it.
     * Calling again for the same instance rewrites the record under the
     * existing lease.
     *
     * @throws RegistrationFailedError if the store rejected the lease or the record
     * @throws StoreUnavailableError if the store cannot be reached
     */
    void register_instance(const ServiceInstance& instance,
                           std::chrono::seconds ttl = DEFAULT_LEASE_TTL);

    /**
     * Dial addresses of every live instance of a service.
     *
     * @return Sorted addresses; empty when nothing is registered
     * @throws StoreUnavailableError if the store cannot be reached
     */
    std::vector<std::string> discover(const std::string& service_name);

    /**
     * Stop renewing and delete the instance's record. Best-effort: failures
     * are logged, and the lease TTL removes the record eventually.
     *
     * @return true if the record was deleted
     */
    bool deregister(const ServiceInstance& instance);

    /**
     * Stop renewing without deleting the record. The record disappears when
     * its lease TTL elapses.
     */
    void stop_renewal(const ServiceInstance& instance);

    /**
     * Stop every renewal thread and close the store connection. Leases are
     * not revoked. Safe to call more than once.
     *
     * @throws RegistryError if closing the store failed
     */
    void close();

    /// Record key for an instance.
    std::string key_for(const ServiceInstance& instance) const;

    /// Discovery prefix for a service, "<prefix><name>/".
    std::string prefix_for(const std::string& service_name) const;

    /// Lease currently bound to an instance registered by this client.
    std::optional<Lease> lease_for(const ServiceInstance& instance) const;

    /// Whether the instance's lease is being renewed.
    bool is_renewing(const ServiceInstance& instance) const;

    /// Instances registered by this client.
    std::vector<ServiceInstance> registered() const;

    const std::string& prefix() const { return prefix_; }

private:
    struct Registration {
        ServiceInstance instance;
        std::unique_ptr<LeaseKeeper> keeper;
    };

    Lease grant_and_put(const ServiceInstance& instance, std::chrono::seconds ttl);

    std::shared_ptr<KvStore> store_;
    std::string prefix_;
    mutable std::mutex mutex_;
    std::map<std::string, Registration> registrations_;
    bool closed_ = false;
};

} // namespace microshop::registry
