/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <cstdint>

namespace microshop::registry {

using LeaseId = std::int64_t;

/// Records put with this lease never expire.
constexpr LeaseId NO_LEASE = 0;

/// TTL used by services registering themselves.
constexpr std::chrono::seconds DEFAULT_LEASE_TTL{30};

/**
 * Lease - time-bounded liveness grant issued by the store
 *
 * The store tracks expiry. The owner must renew strictly before ttl elapses or
 * every record bound to the lease is removed.
 */
struct Lease {
    LeaseId id = NO_LEASE;
    std::chrono::seconds ttl{0};

    bool valid() const { return id != NO_LEASE; }
};

} // namespace microshop::registry
