/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace microshop::registry {

/**
 * Error types for registry and store operations.
 */
class RegistryError : public std::runtime_error {
public:
    explicit RegistryError(const std::string& msg) : std::runtime_error(msg) {}
};

/// The coordination store could not be reached or did not answer in time.
class StoreUnavailableError : public RegistryError {
public:
    explicit StoreUnavailableError(const std::string& msg)
        : RegistryError("Store unavailable: " + msg) {}
};

/// The store does not know the lease (never granted, revoked, or expired).
class LeaseNotFoundError : public RegistryError {
public:
    explicit LeaseNotFoundError(std::int64_t lease_id)
        : RegistryError("Lease not found: " + std::to_string(lease_id)), lease_id_(lease_id) {}
    std::int64_t lease_id() const { return lease_id_; }
private:
    std::int64_t lease_id_;
};

class RegistrationFailedError : public RegistryError {
public:
    RegistrationFailedError(const std::string& name, const std::string& reason)
        : RegistryError("Registration failed for '" + name + "': " + reason)
        , service_name_(name), reason_(reason) {}
    const std::string& service_name() const { return service_name_; }
    const std::string& reason() const { return reason_; }
private:
    std::string service_name_;
    std::string reason_;
};

} // namespace microshop::registry
