/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <memory>
#include <string>

#include "microshop/client/Channel.hpp"
#include "microshop/registry/KvStore.hpp"
#include "microshop/remote/FrameServer.hpp"

namespace microshop::remote {

/**
 * StoreServer - exposes a KvStore to ZmqKvStore clients
 *
 * The microshop-store daemon runs one of these over a MemoryKvStore.
 */
class StoreServer {
public:
    /// @throws ZmqError if the endpoint cannot be bound
    StoreServer(const std::string& endpoint, std::shared_ptr<registry::KvStore> store);

    void start() { server_.start(); }
    void stop() { server_.stop(); }

    const std::string& endpoint() const { return server_.endpoint(); }

    /// Execute one store request. Public so it can be driven without a socket.
    client::Frames handle(const std::string& method, const client::Frames& args);

private:
    std::shared_ptr<registry::KvStore> store_;
    FrameServer server_;
};

} // namespace microshop::remote
