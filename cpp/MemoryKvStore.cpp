/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/registry/MemoryKvStore.hpp"

namespace microshop::registry {

MemoryKvStore::MemoryKvStore()
    : now_([]() { return Clock::now(); })
{
}

MemoryKvStore::MemoryKvStore(Now now)
    : now_(std::move(now))
{
}

void MemoryKvStore::check_open() const {
    if (closed_) {
        throw StoreUnavailableError("store closed");
    }
}

void MemoryKvStore::expire_locked(Clock::time_point now) {
    for (auto it = leases_.begin(); it != leases_.end();) {
        if (it->second.deadline <= now) {
            for (const auto& key : it->second.keys) {
                entries_.erase(key);
            }
            it = leases_.erase(it);
        } else {
            ++it;
        }
    }
}

void MemoryKvStore::unbind_locked(const std::string& key, LeaseId lease) {
    if (lease == NO_LEASE) {
        return;
    }
    auto it = leases_.find(lease);
    if (it != leases_.end()) {
        it->second.keys.erase(key);
    }
}

Lease MemoryKvStore::grant_lease(std::chrono::seconds ttl) {
    if (ttl.count() <= 0) {
        throw RegistryError("lease TTL must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    check_open();
    auto now = now_();
    expire_locked(now);

    LeaseId id = next_lease_++;
    leases_[id] = LeaseState{ttl, now + ttl, {}};
    return Lease{id, ttl};
}

bool MemoryKvStore::keep_alive(LeaseId lease) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_open();
    auto now = now_();
    expire_locked(now);

    auto it = leases_.find(lease);
    if (it == leases_.end()) {
        return false;
    }
    it->second.deadline = now + it->second.ttl;
    return true;
}

void MemoryKvStore::revoke_lease(LeaseId lease) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_open();
    expire_locked(now_());

    auto it = leases_.find(lease);
    if (it == leases_.end()) {
        return;
    }
    for (const auto& key : it->second.keys) {
        entries_.erase(key);
    }
    leases_.erase(it);
}

void MemoryKvStore::put(const std::string& key, const std::string& value, LeaseId lease) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_open();
    expire_locked(now_());

    if (lease != NO_LEASE && leases_.find(lease) == leases_.end()) {
        throw LeaseNotFoundError(lease);
    }

    auto& entry = entries_[key];
    if (entry.lease != lease) {
        unbind_locked(key, entry.lease);
    }
    entry.value = value;
    entry.lease = lease;
    if (lease != NO_LEASE) {
        leases_[lease].keys.insert(key);
    }
}

std::vector<KeyValue> MemoryKvStore::get_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_open();
    expire_locked(now_());

    std::vector<KeyValue> result;
    for (auto it = entries_.lower_bound(prefix);
         it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        result.push_back(KeyValue{it->first, it->second.value, it->second.lease});
    }
    return result;
}

bool MemoryKvStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_open();
    expire_locked(now_());

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    unbind_locked(key, it->second.lease);
    entries_.erase(it);
    return true;
}

void MemoryKvStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

std::size_t MemoryKvStore::lease_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    expire_locked(now_());
    return leases_.size();
}

std::chrono::milliseconds MemoryKvStore::time_to_live(LeaseId lease) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();
    expire_locked(now);

    auto it = leases_.find(lease);
    if (it == leases_.end()) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(it->second.deadline - now);
}

} // namespace microshop::registry
