/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <stdexcept>
#include <string>

namespace microshop {

/**
 * Error types for actor system operations.
 */
class ActorError : public std::runtime_error {
public:
    explicit ActorError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Spawn was asked for a name that a live actor already holds.
class DuplicateActorError : public ActorError {
public:
    explicit DuplicateActorError(const std::string& name)
        : ActorError("Actor name already in use: " + name), actor_name_(name) {}
    const std::string& actor_name() const { return actor_name_; }
private:
    std::string actor_name_;
};

/// The target actor is stopping or stopped; the message was not enqueued.
class DeadLetterError : public ActorError {
public:
    explicit DeadLetterError(const std::string& target)
        : ActorError("Dead letter: " + target + " is not running"), target_(target) {}
    const std::string& target() const { return target_; }
private:
    std::string target_;
};

/// No reply arrived before the caller's deadline. The request itself is not retracted.
class TimeoutError : public ActorError {
public:
    explicit TimeoutError(const std::string& msg) : ActorError("Timeout: " + msg) {}
};

} // namespace microshop
