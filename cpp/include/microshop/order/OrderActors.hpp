/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "microshop/Actor.hpp"
#include "microshop/collab/AuditSink.hpp"
#include "microshop/order/OrderMessages.hpp"

namespace microshop::order {

/**
 * OrderIds - generates "ORD-<nanoseconds since epoch>" tokens
 *
 * Tokens from one generator are strictly increasing, even when the clock
 * does not advance between two calls.
 */
class OrderIds {
public:
  std::string next();

private:
  std::int64_t last_ = 0;
};

/**
 * OrderActor - stateless order processing
 *
 * CreateOrder takes the simulated processing latency and answers with a new
 * order id. GetOrderStatus always reports "processing".
 */
class OrderActor : public Actor<CreateOrder, GetOrderStatus> {
public:
  explicit OrderActor(std::chrono::milliseconds latency = std::chrono::milliseconds(100));

  OrderResponse handle(ActorContext& ctx, const CreateOrder& m);
  OrderStatus handle(ActorContext& ctx, const GetOrderStatus& m);

  void on_started(ActorContext& ctx) override;
  void on_stopping(ActorContext& ctx) override;
  void on_stopped(ActorContext& ctx) override;

private:
  std::chrono::milliseconds latency_;
  OrderIds ids_;
};

/**
 * NotificationActor - accepts notifications and reports them sent
 */
class NotificationActor : public Actor<SendNotification> {
public:
  NotificationResponse handle(ActorContext& ctx, const SendNotification& m);

  void on_started(ActorContext& ctx) override;
};

/**
 * OrderBookActor - keeps the orders it created
 *
 * The order map is created when the actor starts and dies with it. Creating
 * an order emits an "order.created" audit event; a sink failure is logged
 * and does not fail the order.
 */
class OrderBookActor : public Actor<CreateOrderCluster, GetOrderStatusCluster> {
public:
  /// @param audit Sink for audit events, may be nullptr; must outlive the actor
  explicit OrderBookActor(collab::AuditSink* audit = nullptr);

  OrderResponse handle(ActorContext& ctx, const CreateOrderCluster& m);
  OrderStatus handle(ActorContext& ctx, const GetOrderStatusCluster& m);

  void on_started(ActorContext& ctx) override;
  void on_stopped(ActorContext& ctx) override;

private:
  void audit(const OrderRecord& record);

  collab::AuditSink* audit_;
  std::unique_ptr<std::map<std::string, OrderRecord>> orders_;
  OrderIds ids_;
};

} // namespace microshop::order
