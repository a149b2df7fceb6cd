/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "microshop/registry/KvStore.hpp"
#include "microshop/registry/Lease.hpp"

namespace microshop::registry {

/**
 * LeaseKeeper - background renewal of one lease
 *
 * The LeaseKeeper:
 * - Sends a keep-alive every interval (TTL/3 by default) on its own thread
 * - Logs and skips a tick when the store is unreachable or answers with an error
 * - Calls the regrant hook when the store reports the lease gone, and keeps
 *   renewing whatever lease the hook returns
 *
 * stop() wakes the thread and joins it, so no renewal happens after stop()
 * returns.
 *
 * Usage:
 *   LeaseKeeper keeper("order-service", store, lease);
 *   keeper.start();
 *   ...
 *   keeper.stop();
 */
class LeaseKeeper {
public:
    using Regrant = std::function<Lease()>;

    LeaseKeeper(std::string label, std::shared_ptr<KvStore> store, Lease lease,
                Regrant regrant = nullptr);
    LeaseKeeper(std::string label, std::shared_ptr<KvStore> store, Lease lease,
                std::chrono::milliseconds interval, Regrant regrant = nullptr);
    ~LeaseKeeper();

    LeaseKeeper(const LeaseKeeper&) = delete;
    LeaseKeeper& operator=(const LeaseKeeper&) = delete;

    /// Start the renewal thread. No-op if already running.
    void start();

    /// Stop and join the renewal thread.
    void stop();

    bool is_running() const { return running_.load(); }

    /// The lease currently being renewed.
    Lease lease() const;

    /// Renew a different lease from the next tick on.
    void rebind(Lease lease);

    /// Successful keep-alives so far.
    std::uint64_t renewals() const { return renewals_.load(); }

    /// Renewal interval for a TTL: a third of it, at least 100ms.
    static std::chrono::milliseconds interval_for(std::chrono::seconds ttl);

private:
    void keepalive_loop();
    void renew_once();

    std::string label_;
    std::shared_ptr<KvStore> store_;
    Lease lease_;
    std::chrono::milliseconds interval_;
    Regrant regrant_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> renewals_{0};
    bool stopping_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unique_ptr<std::thread> keepalive_thread_;
};

} // namespace microshop::registry
