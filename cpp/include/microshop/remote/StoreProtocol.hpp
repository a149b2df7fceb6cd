/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <string>

namespace microshop::remote::store {

// Methods understood by the store daemon. Arguments follow the method frame.

/**
 * lease.grant ttl_seconds -> ok lease_id ttl_seconds
 */
constexpr const char* LEASE_GRANT = "lease.grant";

/**
 * lease.keepalive lease_id -> ok 1 | ok 0
 *
 * "0" means the store no longer knows the lease.
 */
constexpr const char* LEASE_KEEPALIVE = "lease.keepalive";

/**
 * lease.revoke lease_id -> ok
 *
 * Deletes every key bound to the lease. Unknown leases are ignored.
 */
constexpr const char* LEASE_REVOKE = "lease.revoke";

/**
 * kv.put key value lease_id -> ok | lease-not-found lease_id
 *
 * lease_id 0 writes a key without a lease.
 */
constexpr const char* KV_PUT = "kv.put";

/**
 * kv.range prefix -> ok [key value lease_id]...
 */
constexpr const char* KV_RANGE = "kv.range";

/**
 * kv.delete key -> ok 1 | ok 0
 */
constexpr const char* KV_DELETE = "kv.delete";

// First frame of a reply
constexpr const char* OK = "ok";
constexpr const char* ERROR = "error";
constexpr const char* LEASE_NOT_FOUND = "lease-not-found";

/**
 * unavailable reason
 *
 * The daemon's own store could not serve the request. Clients report it as
 * StoreUnavailableError, the same as a daemon they cannot reach.
 */
constexpr const char* UNAVAILABLE = "unavailable";

} // namespace microshop::remote::store
