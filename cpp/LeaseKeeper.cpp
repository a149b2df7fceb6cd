/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/registry/LeaseKeeper.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace microshop::registry {

LeaseKeeper::LeaseKeeper(std::string label, std::shared_ptr<KvStore> store, Lease lease,
                         Regrant regrant)
    : LeaseKeeper(std::move(label), std::move(store), lease, interval_for(lease.ttl),
                  std::move(regrant))
{
}

LeaseKeeper::LeaseKeeper(std::string label, std::shared_ptr<KvStore> store, Lease lease,
                         std::chrono::milliseconds interval, Regrant regrant)
    : label_(std::move(label))
    , store_(std::move(store))
    , lease_(lease)
    , interval_(interval)
    , regrant_(std::move(regrant))
{
}

LeaseKeeper::~LeaseKeeper() {
    stop();
}

std::chrono::milliseconds LeaseKeeper::interval_for(std::chrono::seconds ttl) {
    auto third = std::chrono::duration_cast<std::chrono::milliseconds>(ttl) / 3;
    return std::max(third, std::chrono::milliseconds(100));
}

void LeaseKeeper::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (running_.load()) {
        return;  // Already running
    }

    stopping_ = false;
    running_.store(true);

    keepalive_thread_ = std::make_unique<std::thread>([this]() {
        keepalive_loop();
    });
}

void LeaseKeeper::stop() {
    std::unique_ptr<std::thread> thread;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        thread = std::move(keepalive_thread_);
    }
    cv_.notify_all();

    if (thread && thread->joinable()) {
        thread->join();
    }
    running_.store(false);
}

Lease LeaseKeeper::lease() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lease_;
}

void LeaseKeeper::rebind(Lease lease) {
    std::lock_guard<std::mutex> lock(mutex_);
    lease_ = lease;
}

void LeaseKeeper::keepalive_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
            break;
        }
        lock.unlock();
        renew_once();
        lock.lock();
    }
}

void LeaseKeeper::renew_once() {
    Lease current = lease();
    try {
        if (store_->keep_alive(current.id)) {
            renewals_.fetch_add(1);
            return;
        }
    } catch (const std::exception& e) {
        // Unreachable store, error reply or unreadable reply: skip this tick.
        std::cerr << "LeaseKeeper: keep-alive for '" << label_ << "' failed: " << e.what() << std::endl;
        return;
    }

    std::cerr << "LeaseKeeper: lease " << current.id << " for '" << label_ << "' expired" << std::endl;
    if (!regrant_) {
        return;
    }

    try {
        Lease fresh = regrant_();
        rebind(fresh);
        std::cout << "LeaseKeeper: '" << label_ << "' re-registered under lease " << fresh.id << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "LeaseKeeper: re-registration of '" << label_ << "' failed: " << e.what() << std::endl;
    }
}

} // namespace microshop::registry
