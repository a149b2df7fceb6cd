/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/order/OrderActors.hpp"
#include <iostream>
#include <thread>

using namespace std;

namespace microshop::order
{

  string OrderIds::next()
  {
    int64_t now = chrono::duration_cast<chrono::nanoseconds>(
                      chrono::system_clock::now().time_since_epoch())
                      .count();
    last_ = now > last_ ? now : last_ + 1;
    return "ORD-" + std::to_string(last_);
  }

  OrderActor::OrderActor(chrono::milliseconds latency) : latency_(latency) {}

  OrderResponse OrderActor::handle(ActorContext&, const CreateOrder& m)
  {
    cout << "OrderActor: creating order for user " << m.user_id << " (" << m.items.size()
         << " items)" << endl;

    // simulated processing time
    this_thread::sleep_for(latency_);

    return OrderResponse{ids_.next(), "created", "Order created successfully"};
  }

  OrderStatus OrderActor::handle(ActorContext&, const GetOrderStatus& m)
  {
    cout << "OrderActor: status of " << m.order_id << endl;
    return OrderStatus{m.order_id, "processing"};
  }

  void OrderActor::on_started(ActorContext& ctx)
  {
    cout << "OrderActor: " << ctx.self().to_string() << " started" << endl;
  }

  void OrderActor::on_stopping(ActorContext& ctx)
  {
    cout << "OrderActor: " << ctx.self().to_string() << " stopping" << endl;
  }

  void OrderActor::on_stopped(ActorContext& ctx)
  {
    cout << "OrderActor: " << ctx.self().to_string() << " stopped" << endl;
  }

  NotificationResponse NotificationActor::handle(ActorContext&, const SendNotification& m)
  {
    cout << "NotificationActor: " << m.type << " to " << m.recipient << ": " << m.message << endl;
    return NotificationResponse{true, "Notification sent successfully"};
  }

  void NotificationActor::on_started(ActorContext& ctx)
  {
    cout << "NotificationActor: " << ctx.self().to_string() << " started" << endl;
  }

  OrderBookActor::OrderBookActor(collab::AuditSink* audit) : audit_(audit) {}

  void OrderBookActor::on_started(ActorContext&)
  {
    orders_ = make_unique<map<string, OrderRecord>>();
  }

  void OrderBookActor::on_stopped(ActorContext& ctx)
  {
    cout << "OrderBookActor: " << ctx.self().to_string() << " stopped with "
         << (orders_ ? orders_->size() : 0) << " orders" << endl;
    orders_.reset();
  }

  OrderResponse OrderBookActor::handle(ActorContext&, const CreateOrderCluster& m)
  {
    OrderRecord record{ids_.next(), m.user_id, m.items, "pending", chrono::system_clock::now()};
    (*orders_)[record.order_id] = record;
    audit(record);
    return OrderResponse{record.order_id, record.status, ""};
  }

  OrderStatus OrderBookActor::handle(ActorContext&, const GetOrderStatusCluster& m)
  {
    auto it = orders_->find(m.order_id);
    if (it == orders_->end())
      return OrderStatus{m.order_id, "not found"};
    return OrderStatus{it->second.order_id, it->second.status};
  }

  void OrderBookActor::audit(const OrderRecord& record)
  {
    if (!audit_)
      return;
    try
    {
      audit_->record(collab::AuditEvent{
          "order.created",
          record.order_id,
          {{"user_id", record.user_id}, {"items", std::to_string(record.items.size())}, {"status", record.status}}});
    }
    catch (const exception& e)
    {
      cerr << "OrderBookActor: audit of " << record.order_id << " failed: " << e.what() << endl;
    }
  }
}
