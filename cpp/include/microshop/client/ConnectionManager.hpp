/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "microshop/client/Channel.hpp"
#include "microshop/registry/RegistryClient.hpp"

namespace microshop::client {

/// Dial timeout used when none is configured.
constexpr std::chrono::milliseconds DEFAULT_DIAL_TIMEOUT{5000};

/// An upstream could not be reached during connect().
class ConnectionError : public std::runtime_error {
public:
    ConnectionError(const std::string& service, const std::string& address, const std::string& reason)
        : std::runtime_error("Cannot connect to " + service + " at " + address + ": " + reason)
        , service_(service), address_(address) {}

    const std::string& service() const { return service_; }
    const std::string& address() const { return address_; }

private:
    std::string service_;
    std::string address_;
};

/// One or more channels failed to close. Every failure is listed.
class ConnectionCloseError : public std::runtime_error {
public:
    explicit ConnectionCloseError(std::vector<std::string> failures)
        : std::runtime_error(join(failures)), failures_(std::move(failures)) {}

    const std::vector<std::string>& failures() const { return failures_; }

private:
    static std::string join(const std::vector<std::string>& failures) {
        std::string msg = "Failed to close " + std::to_string(failures.size()) + " connection(s)";
        for (const auto& f : failures) {
            msg += "; " + f;
        }
        return msg;
    }

    std::vector<std::string> failures_;
};

/// A logical upstream and the address used when discovery has nothing.
struct Upstream {
    std::string name;
    std::string default_address;
};

/**
 * ConnectionManager - resolves upstream services and holds their channels
 *
 * For every configured upstream, connect() asks the registry first and falls
 * back to the static default address, then dials one long-lived channel.
 * There is no reconnect: a channel that breaks stays broken until the process
 * connects again.
 *
 * Usage:
 *   ConnectionManager conns({{"order-service", "localhost:50052"}}, &registry, factory);
 *   conns.connect();
 *   auto ch = conns.channel("order-service");
 *   ...
 *   conns.close();
 */
class ConnectionManager {
public:
    /**
     * @param upstreams Services to connect to, in connect order
     * @param registry Discovery source; nullptr to use static addresses only
     * @param factory Dials the channels
     * @param dial_timeout Per-upstream dial deadline
     */
    ConnectionManager(std::vector<Upstream> upstreams,
                      registry::RegistryClient* registry,
                      std::shared_ptr<ChannelFactory> factory,
                      std::chrono::milliseconds dial_timeout = DEFAULT_DIAL_TIMEOUT);

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * Resolve and dial every upstream. Stops at the first failure.
     * @throws ConnectionError naming the service and address that failed
     */
    void connect();

    /**
     * Close every channel. All channels are attempted even if some fail.
     * @throws ConnectionCloseError listing every failure
     */
    void close();

    /// Channel of a connected upstream, nullptr if unknown.
    std::shared_ptr<Channel> channel(const std::string& name) const;

    /// Address an upstream was dialed at, empty if not connected.
    std::string resolved_address(const std::string& name) const;

    bool is_connected() const;

private:
    std::string resolve(const Upstream& upstream);

    std::vector<Upstream> upstreams_;
    registry::RegistryClient* registry_;
    std::shared_ptr<ChannelFactory> factory_;
    std::chrono::milliseconds dial_timeout_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Channel>> channels_;
    std::map<std::string, std::string> addresses_;
};

} // namespace microshop::client
