/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/order/OrderRpc.hpp"
#include <iostream>
#include <sstream>

using namespace std;

namespace microshop::order
{

  void append_items(client::Frames& frames, const vector<OrderItem>& items)
  {
    for (const auto& item : items)
    {
      ostringstream price;
      price.precision(17);
      price << item.price;
      frames.push_back(item.product_id);
      frames.push_back(item.product_name);
      frames.push_back(std::to_string(item.quantity));
      frames.push_back(price.str());
    }
  }

  vector<OrderItem> parse_items(const client::Frames& frames, size_t first)
  {
    if (first > frames.size() || (frames.size() - first) % 4 != 0)
      throw invalid_argument("items must be groups of 4 frames");
    vector<OrderItem> items;
    for (size_t i = first; i < frames.size(); i += 4)
    {
      OrderItem item;
      item.product_id = frames[i];
      item.product_name = frames[i + 1];
      item.quantity = stoi(frames[i + 2]);
      item.price = stod(frames[i + 3]);
      items.push_back(std::move(item));
    }
    return items;
  }

  OrderRpcHandler::OrderRpcHandler(ActorSystem& system,
                                   ActorRef<OrderActor> orders,
                                   ActorRef<OrderBookActor> book,
                                   ActorRef<NotificationActor> notifications,
                                   chrono::milliseconds request_timeout)
      : system_(system),
        orders_(std::move(orders)),
        book_(std::move(book)),
        notifications_(std::move(notifications)),
        request_timeout_(request_timeout)
  {
  }

  client::Frames OrderRpcHandler::operator()(const string& method, const client::Frames& args)
  {
    try
    {
      return dispatch(method, args);
    }
    catch (const TimeoutError& e)
    {
      cerr << "OrderRpcHandler: " << method << " timed out: " << e.what() << endl;
      return {REPLY_TIMEOUT, e.what()};
    }
    catch (const exception& e)
    {
      cerr << "OrderRpcHandler: " << method << " failed: " << e.what() << endl;
      return {REPLY_ERROR, e.what()};
    }
  }

  client::Frames OrderRpcHandler::dispatch(const string& method, const client::Frames& args)
  {
    if (method == METHOD_CREATE || method == METHOD_TRACK)
    {
      if (args.empty())
        return {REPLY_ERROR, method + " needs a user id"};
      OrderResponse r;
      if (method == METHOD_CREATE)
        r = system_.request_future(orders_, CreateOrder{args[0], parse_items(args, 1)}, request_timeout_).get();
      else
        r = system_.request_future(book_, CreateOrderCluster{args[0], parse_items(args, 1)}, request_timeout_).get();
      return {REPLY_OK, r.order_id, r.status, r.message};
    }

    if (method == METHOD_STATUS || method == METHOD_LOOKUP)
    {
      if (args.size() != 1)
        return {REPLY_ERROR, method + " needs exactly one order id"};
      OrderStatus s;
      if (method == METHOD_STATUS)
        s = system_.request_future(orders_, GetOrderStatus{args[0]}, request_timeout_).get();
      else
        s = system_.request_future(book_, GetOrderStatusCluster{args[0]}, request_timeout_).get();
      return {REPLY_OK, s.order_id, s.status};
    }

    if (method == METHOD_NOTIFY)
    {
      if (args.size() != 3)
        return {REPLY_ERROR, method + " needs recipient, type and message"};
      auto r = system_.request_future(notifications_, SendNotification{args[0], args[1], args[2]},
                                      request_timeout_)
                   .get();
      return {REPLY_OK, r.success ? "1" : "0", r.message};
    }

    return {REPLY_ERROR, "unknown method " + method};
  }

  OrderClient::OrderClient(shared_ptr<client::Channel> channel, chrono::milliseconds timeout)
      : channel_(std::move(channel)), timeout_(timeout)
  {
  }

  client::Frames OrderClient::call(const string& method, const client::Frames& args, size_t expected)
  {
    client::Frames reply;
    try
    {
      reply = channel_->call(method, args, timeout_);
    }
    catch (const client::ChannelTimeoutError& e)
    {
      throw UpstreamTimeoutError(method + ": " + e.what());
    }
    catch (const client::ChannelError& e)
    {
      throw UpstreamError(method + ": " + e.what());
    }

    if (reply.empty())
      throw UpstreamError(method + ": empty reply");
    if (reply[0] == REPLY_TIMEOUT)
      throw UpstreamTimeoutError(method + ": " + (reply.size() > 1 ? reply[1] : ""));
    if (reply[0] != REPLY_OK)
      throw UpstreamError(method + ": " + (reply.size() > 1 ? reply[1] : reply[0]));
    if (reply.size() != expected)
      throw UpstreamError(method + ": expected " + std::to_string(expected) + " frames, got " +
                          std::to_string(reply.size()));
    return reply;
  }

  OrderResponse OrderClient::create_order(const string& user_id, const vector<OrderItem>& items)
  {
    client::Frames args{user_id};
    append_items(args, items);
    auto r = call(METHOD_CREATE, args, 4);
    return OrderResponse{r[1], r[2], r[3]};
  }

  OrderStatus OrderClient::order_status(const string& order_id)
  {
    auto r = call(METHOD_STATUS, {order_id}, 3);
    return OrderStatus{r[1], r[2]};
  }

  OrderResponse OrderClient::track_order(const string& user_id, const vector<OrderItem>& items)
  {
    client::Frames args{user_id};
    append_items(args, items);
    auto r = call(METHOD_TRACK, args, 4);
    return OrderResponse{r[1], r[2], r[3]};
  }

  OrderStatus OrderClient::lookup_order(const string& order_id)
  {
    auto r = call(METHOD_LOOKUP, {order_id}, 3);
    return OrderStatus{r[1], r[2]};
  }

  NotificationResponse OrderClient::send_notification(const string& recipient, const string& type,
                                                      const string& message)
  {
    auto r = call(METHOD_NOTIFY, {recipient, type, message}, 3);
    return NotificationResponse{r[1] == "1", r[2]};
  }
}
