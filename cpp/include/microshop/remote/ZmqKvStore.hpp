/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "microshop/client/Channel.hpp"
#include "microshop/registry/KvStore.hpp"

namespace microshop::remote {

/**
 * ZmqKvStore - KvStore backed by a microshop-store daemon
 *
 * Every operation is one channel call bounded by the request timeout. A
 * timeout or transport failure is reported as StoreUnavailableError.
 */
class ZmqKvStore : public registry::KvStore {
public:
    /**
     * Dial the first endpoint that answers.
     * @param endpoints Store endpoints, tried in order
     * @param dial_timeout Per-endpoint dial deadline
     * @param request_timeout Deadline for each store operation
     * @throws registry::StoreUnavailableError if no endpoint answered
     */
    static std::shared_ptr<ZmqKvStore> connect(const std::vector<std::string>& endpoints,
                                               std::chrono::milliseconds dial_timeout,
                                               std::chrono::milliseconds request_timeout);

    ZmqKvStore(std::shared_ptr<client::Channel> channel, std::chrono::milliseconds request_timeout);

    registry::Lease grant_lease(std::chrono::seconds ttl) override;
    bool keep_alive(registry::LeaseId lease) override;
    void revoke_lease(registry::LeaseId lease) override;
    void put(const std::string& key, const std::string& value, registry::LeaseId lease) override;
    std::vector<registry::KeyValue> get_prefix(const std::string& prefix) override;
    bool erase(const std::string& key) override;
    void close() override;

    const std::string& address() const { return channel_->address(); }

private:
    client::Frames call(const std::string& method, const client::Frames& args);

    std::shared_ptr<client::Channel> channel_;
    std::chrono::milliseconds request_timeout_;
};

} // namespace microshop::remote
