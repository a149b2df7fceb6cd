/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/client/ConnectionManager.hpp"
#include <iostream>

namespace microshop::client {

ConnectionManager::ConnectionManager(std::vector<Upstream> upstreams,
                                     registry::RegistryClient* registry,
                                     std::shared_ptr<ChannelFactory> factory,
                                     std::chrono::milliseconds dial_timeout)
    : upstreams_(std::move(upstreams))
    , registry_(registry)
    , factory_(std::move(factory))
    , dial_timeout_(dial_timeout)
{
}

ConnectionManager::~ConnectionManager() {
    try {
        close();
    } catch (const ConnectionCloseError& e) {
        std::cerr << "ConnectionManager: " << e.what() << std::endl;
    }
}

std::string ConnectionManager::resolve(const Upstream& upstream) {
    if (!registry_) {
        return upstream.default_address;
    }
    try {
        auto addresses = registry_->discover(upstream.name);
        if (!addresses.empty()) {
            std::cout << "ConnectionManager: discovered " << upstream.name << " at "
                      << addresses.front() << std::endl;
            return addresses.front();
        }
        std::cout << "ConnectionManager: no registered " << upstream.name
                  << ", using " << upstream.default_address << std::endl;
    } catch (const registry::RegistryError& e) {
        std::cerr << "ConnectionManager: discovery of " << upstream.name << " failed, using "
                  << upstream.default_address << ": " << e.what() << std::endl;
    }
    return upstream.default_address;
}

void ConnectionManager::connect() {
    for (const auto& upstream : upstreams_) {
        const std::string address = resolve(upstream);
        std::shared_ptr<Channel> ch;
        try {
            ch = factory_->dial(address, dial_timeout_);
        } catch (const std::exception& e) {
            throw ConnectionError(upstream.name, address, e.what());
        }
        if (!ch) {
            throw ConnectionError(upstream.name, address, "dial returned no channel");
        }

        std::shared_ptr<Channel> previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous = channels_[upstream.name];
            channels_[upstream.name] = ch;
            addresses_[upstream.name] = address;
        }
        if (previous) {
            previous->close();
        }
        std::cout << "ConnectionManager: connected to " << upstream.name << " at " << address << std::endl;
    }
}

void ConnectionManager::close() {
    std::map<std::string, std::shared_ptr<Channel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels.swap(channels_);
        addresses_.clear();
    }

    std::vector<std::string> failures;
    for (auto& [name, ch] : channels) {
        try {
            ch->close();
        } catch (const std::exception& e) {
            failures.push_back(name + ": " + e.what());
        }
    }
    if (!failures.empty()) {
        throw ConnectionCloseError(std::move(failures));
    }
}

std::shared_ptr<Channel> ConnectionManager::channel(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(name);
    return it == channels_.end() ? nullptr : it->second;
}

std::string ConnectionManager::resolved_address(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = addresses_.find(name);
    return it == addresses_.end() ? std::string() : it->second;
}

bool ConnectionManager::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !channels_.empty() && channels_.size() == upstreams_.size();
}

} // namespace microshop::client
