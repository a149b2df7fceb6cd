/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace microshop::client {

/// A request or reply: an ordered list of string frames.
using Frames = std::vector<std::string>;

/// Transport failure on an established channel.
class ChannelError : public std::runtime_error {
public:
    explicit ChannelError(const std::string& msg) : std::runtime_error(msg) {}
};

/// No reply arrived within the call timeout.
class ChannelTimeoutError : public ChannelError {
public:
    explicit ChannelTimeoutError(const std::string& msg)
        : ChannelError("Channel timeout: " + msg) {}
};

/**
 * Channel - long-lived request/reply connection to one upstream address
 *
 * A call sends a method name plus arguments and blocks for the matching
 * reply. Implementations serialize calls, so one channel may be shared by
 * several threads.
 */
class Channel {
public:
    virtual ~Channel() = default;

    /**
     * Send a request and wait for its reply.
     * @throws ChannelTimeoutError if nothing arrived within timeout
     * @throws ChannelError on transport failure or after close()
     */
    virtual Frames call(const std::string& method, const Frames& args,
                        std::chrono::milliseconds timeout) = 0;

    /// Release the connection. Safe to call more than once.
    virtual void close() = 0;

    virtual const std::string& address() const = 0;
};

/**
 * ChannelFactory - dials channels
 *
 * dial() must fail fast: if the address does not answer within timeout it
 * throws instead of returning a channel that connects lazily.
 */
class ChannelFactory {
public:
    virtual ~ChannelFactory() = default;

    virtual std::shared_ptr<Channel> dial(const std::string& address,
                                          std::chrono::milliseconds timeout) = 0;
};

} // namespace microshop::client
