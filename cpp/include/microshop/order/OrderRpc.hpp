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

#include "microshop/ActorRef.hpp"
#include "microshop/act/ActorSystem.hpp"
#include "microshop/client/Channel.hpp"
#include "microshop/order/OrderActors.hpp"
#include "microshop/order/OrderMessages.hpp"

namespace microshop::order {

// Methods served by the order service
constexpr const char* METHOD_CREATE = "order.create";
constexpr const char* METHOD_STATUS = "order.status";
constexpr const char* METHOD_TRACK = "order.track";
constexpr const char* METHOD_LOOKUP = "order.lookup";
constexpr const char* METHOD_NOTIFY = "notify.send";

// First frame of every reply
constexpr const char* REPLY_OK = "ok";
constexpr const char* REPLY_TIMEOUT = "timeout";
constexpr const char* REPLY_ERROR = "error";

/// The order service answered "error", or answered something unreadable.
class UpstreamError : public std::runtime_error {
public:
  explicit UpstreamError(const std::string& msg) : std::runtime_error("Upstream error: " + msg) {}
};

/// The order service, or the actor behind it, did not answer in time.
class UpstreamTimeoutError : public UpstreamError {
public:
  explicit UpstreamTimeoutError(const std::string& msg) : UpstreamError("timeout: " + msg) {}
};

/// Items travel as four frames each: product_id, product_name, quantity, price.
void append_items(client::Frames& frames, const std::vector<OrderItem>& items);

/**
 * Decode items from frames[first..].
 * @throws std::invalid_argument on a short or non-numeric item
 */
std::vector<OrderItem> parse_items(const client::Frames& frames, std::size_t first);

/**
 * OrderRpcHandler - turns channel requests into actor requests
 *
 *   order.create  [user_id, items...]       -> ok order_id status message
 *   order.status  [order_id]                -> ok order_id status
 *   order.track   [user_id, items...]       -> ok order_id status message
 *   order.lookup  [order_id]                -> ok order_id status
 *   notify.send   [recipient, type, text]   -> ok success message
 *
 * order.create/status go to the OrderActor, order.track/lookup to the
 * OrderBookActor. An actor that does not answer within the request timeout
 * yields "timeout <what>"; any other failure "error <what>".
 */
class OrderRpcHandler {
public:
  OrderRpcHandler(ActorSystem& system,
                  ActorRef<OrderActor> orders,
                  ActorRef<OrderBookActor> book,
                  ActorRef<NotificationActor> notifications,
                  std::chrono::milliseconds request_timeout);

  client::Frames operator()(const std::string& method, const client::Frames& args);

private:
  client::Frames dispatch(const std::string& method, const client::Frames& args);

  ActorSystem& system_;
  ActorRef<OrderActor> orders_;
  ActorRef<OrderBookActor> book_;
  ActorRef<NotificationActor> notifications_;
  std::chrono::milliseconds request_timeout_;
};

/**
 * OrderClient - typed calls to the order service over a channel
 */
class OrderClient {
public:
  OrderClient(std::shared_ptr<client::Channel> channel, std::chrono::milliseconds timeout);

  /// @throws UpstreamError, UpstreamTimeoutError
  OrderResponse create_order(const std::string& user_id, const std::vector<OrderItem>& items);
  OrderStatus order_status(const std::string& order_id);
  OrderResponse track_order(const std::string& user_id, const std::vector<OrderItem>& items);
  OrderStatus lookup_order(const std::string& order_id);
  NotificationResponse send_notification(const std::string& recipient, const std::string& type,
                                         const std::string& message);

private:
  client::Frames call(const std::string& method, const client::Frames& args, std::size_t expected);

  std::shared_ptr<client::Channel> channel_;
  std::chrono::milliseconds timeout_;
};

} // namespace microshop::order
