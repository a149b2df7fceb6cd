/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "microshop/registry/KvStore.hpp"

namespace microshop::registry {

/**
 * MemoryKvStore - in-process KvStore with lease expiry
 *
 * Expiry is evaluated against the injected clock on every operation: a lease
 * whose deadline has been reached is dropped together with its keys before
 * the operation runs. Tests drive time with a manual clock; the store daemon
 * uses the steady clock.
 */
class MemoryKvStore : public KvStore {
public:
    using Clock = std::chrono::steady_clock;
    using Now = std::function<Clock::time_point()>;

    MemoryKvStore();
    explicit MemoryKvStore(Now now);

    Lease grant_lease(std::chrono::seconds ttl) override;
    bool keep_alive(LeaseId lease) override;
    void revoke_lease(LeaseId lease) override;
    void put(const std::string& key, const std::string& value, LeaseId lease) override;
    std::vector<KeyValue> get_prefix(const std::string& prefix) override;
    bool erase(const std::string& key) override;
    void close() override;

    /// Number of live leases.
    std::size_t lease_count();

    /// Remaining time of a lease, zero if unknown.
    std::chrono::milliseconds time_to_live(LeaseId lease);

private:
    struct Entry {
        std::string value;
        LeaseId lease = NO_LEASE;
    };

    struct LeaseState {
        std::chrono::seconds ttl;
        Clock::time_point deadline;
        std::set<std::string> keys;
    };

    void check_open() const;
    void expire_locked(Clock::time_point now);
    void unbind_locked(const std::string& key, LeaseId lease);

    Now now_;
    std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<LeaseId, LeaseState> leases_;
    LeaseId next_lease_ = 1;
    bool closed_ = false;
};

} // namespace microshop::registry
