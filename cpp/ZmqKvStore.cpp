/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/remote/ZmqKvStore.hpp"
#include "microshop/remote/StoreProtocol.hpp"
#include "microshop/remote/ZmqChannel.hpp"
#include "microshop/remote/Zmq.hpp"
#include <iostream>

namespace microshop::remote {

using registry::LeaseId;

std::shared_ptr<ZmqKvStore> ZmqKvStore::connect(const std::vector<std::string>& endpoints,
                                                std::chrono::milliseconds dial_timeout,
                                                std::chrono::milliseconds request_timeout) {
    std::string failures;
    for (const auto& endpoint : endpoints) {
        try {
            auto channel = ZmqChannel::dial(endpoint, dial_timeout);
            std::cout << "ZmqKvStore: connected to " << endpoint << std::endl;
            return std::make_shared<ZmqKvStore>(channel, request_timeout);
        } catch (const client::ChannelError& e) {
            failures += (failures.empty() ? "" : "; ") + endpoint + ": " + e.what();
        } catch (const ZmqError& e) {
            failures += (failures.empty() ? "" : "; ") + endpoint + ": " + e.what();
        }
    }
    if (endpoints.empty()) {
        failures = "no endpoints configured";
    }
    throw registry::StoreUnavailableError(failures);
}

ZmqKvStore::ZmqKvStore(std::shared_ptr<client::Channel> channel, std::chrono::milliseconds request_timeout)
    : channel_(std::move(channel))
    , request_timeout_(request_timeout)
{
}

client::Frames ZmqKvStore::call(const std::string& method, const client::Frames& args) {
    client::Frames reply;
    try {
        reply = channel_->call(method, args, request_timeout_);
    } catch (const client::ChannelError& e) {
        throw registry::StoreUnavailableError(method + ": " + e.what());
    }

    if (reply.empty()) {
        throw registry::RegistryError(method + ": empty reply from store");
    }
    if (reply[0] == store::LEASE_NOT_FOUND) {
        throw registry::LeaseNotFoundError(reply.size() > 1 ? std::stoll(reply[1]) : registry::NO_LEASE);
    }
    if (reply[0] == store::UNAVAILABLE) {
        throw registry::StoreUnavailableError(method + ": " + (reply.size() > 1 ? reply[1] : reply[0]));
    }
    if (reply[0] != store::OK) {
        throw registry::RegistryError(method + ": " + (reply.size() > 1 ? reply[1] : reply[0]));
    }
    return reply;
}

registry::Lease ZmqKvStore::grant_lease(std::chrono::seconds ttl) {
    auto reply = call(store::LEASE_GRANT, {std::to_string(ttl.count())});
    if (reply.size() != 3) {
        throw registry::RegistryError("lease.grant: malformed reply");
    }
    return registry::Lease{std::stoll(reply[1]), std::chrono::seconds(std::stoll(reply[2]))};
}

bool ZmqKvStore::keep_alive(LeaseId lease) {
    auto reply = call(store::LEASE_KEEPALIVE, {std::to_string(lease)});
    return reply.size() > 1 && reply[1] == "1";
}

void ZmqKvStore::revoke_lease(LeaseId lease) {
    call(store::LEASE_REVOKE, {std::to_string(lease)});
}

void ZmqKvStore::put(const std::string& key, const std::string& value, LeaseId lease) {
    call(store::KV_PUT, {key, value, std::to_string(lease)});
}

std::vector<registry::KeyValue> ZmqKvStore::get_prefix(const std::string& prefix) {
    auto reply = call(store::KV_RANGE, {prefix});
    if ((reply.size() - 1) % 3 != 0) {
        throw registry::RegistryError("kv.range: malformed reply");
    }
    std::vector<registry::KeyValue> result;
    for (std::size_t i = 1; i < reply.size(); i += 3) {
        result.push_back(registry::KeyValue{reply[i], reply[i + 1], std::stoll(reply[i + 2])});
    }
    return result;
}

bool ZmqKvStore::erase(const std::string& key) {
    auto reply = call(store::KV_DELETE, {key});
    return reply.size() > 1 && reply[1] == "1";
}

void ZmqKvStore::close() {
    channel_->close();
}

} // namespace microshop::remote
