/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace microshop {

/**
 * ActorId - identity assigned by the ActorSystem at spawn time
 *
 * The name is unique among live actors. The serial is never reused within one
 * ActorSystem, so an id held after its actor stopped cannot reach a newer actor
 * spawned under the same name.
 */
class ActorId {
public:
    ActorId() = default;
    ActorId(std::string name, std::uint64_t serial)
        : name_(std::move(name)), serial_(serial) {}

    const std::string& name() const { return name_; }
    std::uint64_t serial() const { return serial_; }
    bool valid() const { return serial_ != 0; }

    /// "name#serial", used in logs and errors.
    std::string to_string() const { return name_ + "#" + std::to_string(serial_); }

    bool operator==(const ActorId& o) const { return serial_ == o.serial_ && name_ == o.name_; }
    bool operator!=(const ActorId& o) const { return !(*this == o); }
    bool operator<(const ActorId& o) const { return serial_ < o.serial_; }

private:
    std::string name_;
    std::uint64_t serial_ = 0;
};

/**
 * ActorRef - typed address of an actor running behavior B
 *
 * Only the id is stored; B lets ActorSystem::send and request_future check at
 * compile time that a message belongs to B's message set.
 */
template <typename B>
class ActorRef {
public:
    using Behavior = B;

    ActorRef() = default;
    explicit ActorRef(ActorId id) : id_(std::move(id)) {}

    const ActorId& id() const { return id_; }
    const std::string& name() const { return id_.name(); }

    bool operator==(const ActorRef& o) const { return id_ == o.id_; }
    bool operator!=(const ActorRef& o) const { return id_ != o.id_; }

private:
    ActorId id_;
};

} // namespace microshop
