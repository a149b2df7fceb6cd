/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <memory>
#include <type_traits>
#include <variant>

#include "microshop/Future.hpp"
#include "microshop/msg/Lifecycle.hpp"

namespace microshop {

/**
 * A message type is a request when it names its reply type:
 *
 *   struct GetOrderStatus {
 *     using Response = OrderStatus;
 *     std::string order_id;
 *   };
 *
 * Anything else is fire-and-forget.
 */
template <typename M, typename = void>
struct is_request : std::false_type {};

template <typename M>
struct is_request<M, std::void_t<typename M::Response>> : std::true_type {};

template <typename M>
inline constexpr bool is_request_v = is_request<M>::value;

/// True when M is one of the alternatives of the variant V.
template <typename M, typename V>
struct is_alternative : std::false_type {};

template <typename M, typename... Ts>
struct is_alternative<M, std::variant<Ts...>> : std::disjunction<std::is_same<M, Ts>...> {};

template <typename M, typename V>
inline constexpr bool is_alternative_v = is_alternative<M, V>::value;

/**
 * Envelope - one mailbox item
 *
 * Carries either a lifecycle signal or one of the behavior's user messages,
 * plus the reply slot when the message was sent as a request.
 */
template <typename Message>
struct Envelope {
    using Payload = std::variant<msg::Started, msg::Stopping, msg::Stopped, Message>;

    Payload payload;
    std::shared_ptr<detail::PendingReply> reply;

    bool is_signal() const { return payload.index() != 3; }
};

} // namespace microshop
