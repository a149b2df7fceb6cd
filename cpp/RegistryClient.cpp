/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/registry/RegistryClient.hpp"
#include <algorithm>
#include <iostream>

namespace microshop::registry {

RegistryClient::RegistryClient(std::shared_ptr<KvStore> store, std::string prefix)
    : store_(std::move(store))
    , prefix_(std::move(prefix))
{
    if (!store_) {
        throw RegistryError("RegistryClient needs a store");
    }
}

RegistryClient::~RegistryClient() {
    try {
        close();
    } catch (const RegistryError& e) {
        std::cerr << "RegistryClient: close failed: " << e.what() << std::endl;
    }
}

std::string RegistryClient::key_for(const ServiceInstance& instance) const {
    return prefix_for(instance.name) + instance.address();
}

std::string RegistryClient::prefix_for(const std::string& service_name) const {
    return prefix_ + service_name + "/";
}

Lease RegistryClient::grant_and_put(const ServiceInstance& instance, std::chrono::seconds ttl) {
    Lease lease = store_->grant_lease(ttl);
    store_->put(key_for(instance), instance.address(), lease.id);
    return lease;
}

void RegistryClient::register_instance(const ServiceInstance& instance, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw RegistrationFailedError(instance.name, "registry client is closed");
    }

    const std::string key = key_for(instance);
    auto it = registrations_.find(key);

    try {
        if (it != registrations_.end()) {
            // Re-registration: same lease, overwrite the value.
            Lease lease = it->second.keeper->lease();
            try {
                store_->put(key, instance.address(), lease.id);
            } catch (const LeaseNotFoundError&) {
                lease = grant_and_put(instance, ttl);
                it->second.keeper->rebind(lease);
            }
            it->second.keeper->start();
            std::cout << "RegistryClient: re-registered '" << key << "' under lease " << lease.id << std::endl;
            return;
        }

        Lease lease = grant_and_put(instance, ttl);
        auto keeper = std::make_unique<LeaseKeeper>(key, store_, lease, [this, instance, ttl]() {
            return grant_and_put(instance, ttl);
        });
        keeper->start();
        registrations_[key] = Registration{instance, std::move(keeper)};
        std::cout << "RegistryClient: registered '" << key << "' under lease " << lease.id
                  << " (ttl " << ttl.count() << "s)" << std::endl;
    } catch (const StoreUnavailableError&) {
        throw;
    } catch (const RegistrationFailedError&) {
        throw;
    } catch (const RegistryError& e) {
        throw RegistrationFailedError(instance.name, e.what());
    }
}

std::vector<std::string> RegistryClient::discover(const std::string& service_name) {
    std::vector<KeyValue> records;
    try {
        records = store_->get_prefix(prefix_for(service_name));
    } catch (const StoreUnavailableError& e) {
        throw StoreUnavailableError("discover '" + service_name + "': " + e.what());
    }

    std::vector<std::string> addresses;
    addresses.reserve(records.size());
    for (const auto& kv : records) {
        addresses.push_back(kv.value);
    }
    std::sort(addresses.begin(), addresses.end());
    addresses.erase(std::unique(addresses.begin(), addresses.end()), addresses.end());
    return addresses;
}

bool RegistryClient::deregister(const ServiceInstance& instance) {
    const std::string key = key_for(instance);
    std::unique_ptr<LeaseKeeper> keeper;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = registrations_.find(key);
        if (it != registrations_.end()) {
            keeper = std::move(it->second.keeper);
            registrations_.erase(it);
        }
    }
    if (keeper) {
        keeper->stop();
    }

    try {
        bool erased = store_->erase(key);
        std::cout << "RegistryClient: deregistered '" << key << "'" << (erased ? "" : " (already gone)") << std::endl;
        return erased;
    } catch (const RegistryError& e) {
        std::cerr << "RegistryClient: deregister '" << key << "' failed, lease TTL will clean up: "
                  << e.what() << std::endl;
        return false;
    }
}

void RegistryClient::stop_renewal(const ServiceInstance& instance) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(key_for(instance));
    if (it != registrations_.end()) {
        it->second.keeper->stop();
    }
}

void RegistryClient::close() {
    std::map<std::string, Registration> registrations;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        registrations.swap(registrations_);
    }

    for (auto& [key, registration] : registrations) {
        registration.keeper->stop();
    }

    try {
        store_->close();
    } catch (const std::exception& e) {
        throw RegistryError(std::string("closing store: ") + e.what());
    }
}

std::optional<Lease> RegistryClient::lease_for(const ServiceInstance& instance) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(key_for(instance));
    if (it == registrations_.end()) {
        return std::nullopt;
    }
    return it->second.keeper->lease();
}

bool RegistryClient::is_renewing(const ServiceInstance& instance) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(key_for(instance));
    return it != registrations_.end() && it->second.keeper->is_running();
}

std::vector<ServiceInstance> RegistryClient::registered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServiceInstance> ret;
    for (const auto& [key, registration] : registrations_) {
        ret.push_back(registration.instance);
    }
    return ret;
}

} // namespace microshop::registry
