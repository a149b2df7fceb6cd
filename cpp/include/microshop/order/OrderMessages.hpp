/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace microshop::order {

struct OrderItem {
  std::string product_id;
  std::string product_name;
  int quantity = 0;
  double price = 0.0;
};

/**
 * OrderResponse - reply to CreateOrder and CreateOrderCluster
 */
struct OrderResponse {
  std::string order_id;
  std::string status;
  std::string message;
};

/**
 * OrderStatus - reply to GetOrderStatus and GetOrderStatusCluster
 *
 * status is "not found" when the order is unknown.
 */
struct OrderStatus {
  std::string order_id;
  std::string status;
};

struct NotificationResponse {
  bool success = false;
  std::string message;
};

/**
 * CreateOrder - place an order with the stateless order actor
 */
struct CreateOrder {
  using Response = OrderResponse;

  std::string user_id;
  std::vector<OrderItem> items;
};

struct GetOrderStatus {
  using Response = OrderStatus;

  std::string order_id;
};

/**
 * CreateOrderCluster - place an order with the order book, which keeps it
 */
struct CreateOrderCluster {
  using Response = OrderResponse;

  std::string user_id;
  std::vector<OrderItem> items;
};

struct GetOrderStatusCluster {
  using Response = OrderStatus;

  std::string order_id;
};

/**
 * SendNotification - deliver a message to a recipient
 *
 * type is one of "email", "sms", "push".
 */
struct SendNotification {
  using Response = NotificationResponse;

  std::string recipient;
  std::string type;
  std::string message;
};

/**
 * OrderRecord - an order held by the order book
 */
struct OrderRecord {
  std::string order_id;
  std::string user_id;
  std::vector<OrderItem> items;
  std::string status;
  std::chrono::system_clock::time_point created_at;
};

} // namespace microshop::order
