/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <zmq.hpp>

#include "microshop/client/Channel.hpp"

namespace microshop::remote {

/**
 * ZmqChannel - request/reply channel over a DEALER socket
 *
 * Every request carries a correlation number:
 *
 *   [empty, correlation, method, args...]  ->  ROUTER
 *   [empty, correlation, reply...]         <-  ROUTER
 *
 * A reply whose correlation is not the outstanding one is a late reply to an
 * earlier call that timed out; it is dropped. Calls are serialized by a
 * mutex, so a channel can be shared across threads.
 */
class ZmqChannel : public client::Channel {
public:
    /**
     * Connect and wait for the peer to answer a ping.
     * @throws client::ChannelTimeoutError if no pong arrived within timeout
     * @throws ZmqError if the endpoint is malformed
     */
    static std::shared_ptr<ZmqChannel> dial(const std::string& address, std::chrono::milliseconds timeout);

    ~ZmqChannel() override;

    client::Frames call(const std::string& method, const client::Frames& args,
                        std::chrono::milliseconds timeout) override;

    void close() override;

    const std::string& address() const override { return address_; }

    /// Replies dropped because their correlation did not match.
    std::uint64_t late_replies() const;

private:
    explicit ZmqChannel(std::string address);

    std::string address_;
    mutable std::mutex mutex_;
    std::unique_ptr<zmq::socket_t> socket_;
    std::uint64_t next_correlation_ = 1;
    std::uint64_t late_replies_ = 0;
};

/// Dials ZmqChannels for the ConnectionManager.
class ZmqChannelFactory : public client::ChannelFactory {
public:
    std::shared_ptr<client::Channel> dial(const std::string& address,
                                          std::chrono::milliseconds timeout) override;
};

} // namespace microshop::remote
