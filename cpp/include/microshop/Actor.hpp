/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <ostream>
#include <variant>

#include "microshop/ActorRef.hpp"
#include "microshop/Message.hpp"

namespace microshop {

class ActorSystem;

/// Mailbox lifecycle. Transitions only move forward.
enum class MailboxState { Starting, Running, Stopping, Stopped };

const char* to_string(MailboxState state);

inline std::ostream& operator<<(std::ostream& os, MailboxState state) {
    return os << to_string(state);
}

/**
 * ActorContext - what a handler sees of the world while processing a message
 *
 * Valid only on the actor's own thread.
 */
class ActorContext {
public:
    ActorContext(ActorSystem& system, ActorId self)
        : system_(system), self_(std::move(self)) {}

    const ActorId& self() const { return self_; }
    ActorSystem& system() const { return system_; }

private:
    ActorSystem& system_;
    ActorId self_;
};

/**
 * Actor - base of every behavior
 *
 * A behavior lists the closed set of messages it accepts and provides one
 * handle() overload per message:
 *
 *   class OrderActor : public Actor<CreateOrder, GetOrderStatus> {
 *   public:
 *     OrderResponse handle(ActorContext& ctx, const CreateOrder& m);
 *     OrderStatus handle(ActorContext& ctx, const GetOrderStatus& m);
 *   };
 *
 * Dispatch is an exhaustive std::visit over Message, so a missing overload is
 * a compile error. For a request message (one that declares Response) the
 * handler's return value is the reply: one request, one reply.
 *
 * Handlers run strictly one at a time on the actor's thread. State held by
 * the behavior needs no lock as long as nothing outside the actor touches it.
 */
template <typename... Msgs>
class Actor {
public:
    using Message = std::variant<Msgs...>;

    virtual ~Actor() = default;

    /// Delivered once, before any user message.
    virtual void on_started(ActorContext&) {}

    /// Delivered once after a stop request, after the last user message.
    virtual void on_stopping(ActorContext&) {}

    /// Delivered once, last. The actor's thread exits afterwards.
    virtual void on_stopped(ActorContext&) {}
};

} // namespace microshop
