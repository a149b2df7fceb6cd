/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "microshop/Actor.hpp"
#include "microshop/ActorRef.hpp"
#include "microshop/Errors.hpp"
#include "microshop/Future.hpp"
#include "microshop/Message.hpp"
#include "microshop/act/ActorCell.hpp"

namespace microshop
{

  /**
   * ActorSystem - owns and routes between actors
   *
   * The ActorSystem:
   * - Spawns actors under unique names, one thread each
   * - Delivers fire-and-forget messages and request/future exchanges
   * - Stops actors gracefully and joins their threads
   * - Reports queue lengths and message counts
   *
   * It is an ordinary object: create it at startup, pass it by reference,
   * let the destructor (or shutdown()) stop everything.
   *
   * Usage:
   *   ActorSystem system;
   *   auto orders = system.spawn<OrderBookActor>("order-book");
   *
   *   system.send(orders, SomeNotice{});
   *   auto fut = system.request_future(orders, GetOrderStatusCluster{"ORD-1"}, 5s);
   *   OrderStatus status = fut.get();
   *
   *   system.stop(orders.id());
   *   system.shutdown();
   */
  class ActorSystem
  {
  public:
    explicit ActorSystem(std::string name = "microshop");
    ~ActorSystem();

    ActorSystem(const ActorSystem&) = delete;
    ActorSystem& operator=(const ActorSystem&) = delete;

    /**
     * Spawn an actor running a new B(args...).
     * @param name Name unique among live actors
     * @throws DuplicateActorError if a live actor already has this name
     */
    template <typename B, typename... Args>
    ActorRef<B> spawn(const std::string& name, Args&&... args)
    {
      return spawn_behavior(name, std::make_unique<B>(std::forward<Args>(args)...));
    }

    /**
     * Spawn an actor running an already constructed behavior.
     * @throws DuplicateActorError if a live actor already has this name
     */
    template <typename B>
    ActorRef<B> spawn_behavior(const std::string& name, std::unique_ptr<B> behavior);

    /**
     * Enqueue a fire-and-forget message. Never blocks on the receiver.
     * @throws DeadLetterError if the target is stopping or stopped
     */
    template <typename B, typename M>
    void send(const ActorRef<B>& to, M message);

    /**
     * Enqueue a request and return a future for its single reply.
     * The deadline is fixed now; the future throws TimeoutError past it.
     * @throws DeadLetterError if the target is stopping or stopped
     */
    template <typename B, typename M>
    ResponseFuture<typename M::Response> request_future(const ActorRef<B>& to, M message,
                                                        std::chrono::milliseconds timeout);

    /**
     * Ask an actor to stop. Messages already queued are processed first, then
     * the actor receives Stopping and Stopped. Later sends are dead letters.
     * @return false if the actor is unknown or already stopping
     */
    bool stop(const ActorId& id);

    /**
     * Block until the actor reached Stopped.
     * @return false on timeout
     */
    bool await_stopped(const ActorId& id, std::chrono::milliseconds timeout);

    /**
     * Stop every actor and join every thread. Idempotent.
     *
     * May be called from a handler; the calling actor finishes its current
     * message, gets Stopping and Stopped, and is joined by the next
     * shutdown() or the destructor.
     */
    void shutdown();

    /// Current lifecycle state. Unknown ids report Stopped.
    MailboxState state(const ActorId& id) const;

    /// Id of the live actor with this name, if any.
    std::optional<ActorId> find(const std::string& name) const;

    /// Names of all live actors.
    std::list<std::string> names() const;

    /// Pending messages per live actor.
    std::map<std::string, std::size_t> get_queue_lengths() const;

    /// Processed user messages per live actor.
    std::map<std::string, std::uint64_t> get_message_counts() const;

    /// Messages rejected because their target was not running.
    std::uint64_t dead_letters() const { return dead_letters_.load(); }

    const std::string& name() const { return name_; }

  private:
    using CellPtr = std::shared_ptr<detail::ActorCellBase>;

    CellPtr live_cell(const ActorId& id) const;
    CellPtr any_cell(const ActorId& id) const;
    void register_cell(const std::string& name, CellPtr cell);
    void on_exit(const ActorId& id);
    void reap();
    [[noreturn]] void dead_letter(const ActorId& id);

    template <typename B>
    std::shared_ptr<detail::ActorCell<B>> typed_cell(const ActorRef<B>& ref)
    {
      auto cell = live_cell(ref.id());
      if (!cell)
        dead_letter(ref.id());
      return std::static_pointer_cast<detail::ActorCell<B>>(cell);
    }

    std::string name_;
    mutable std::mutex mutex_;
    std::map<std::string, CellPtr> live_;
    std::list<CellPtr> retired_;
    std::atomic<std::uint64_t> next_serial_{1};
    std::atomic<std::uint64_t> dead_letters_{0};
    bool shut_down_ = false;
  };

  template <typename B>
  ActorRef<B> ActorSystem::spawn_behavior(const std::string& name, std::unique_ptr<B> behavior)
  {
    reap();
    ActorId id(name, next_serial_.fetch_add(1));
    auto cell = std::make_shared<detail::ActorCell<B>>(
        *this, id, std::move(behavior), [this](const ActorId& exited) { on_exit(exited); });
    // Checks the name and starts the cell under the system lock, so Started is
    // queued before the id becomes reachable.
    register_cell(name, cell);
    return ActorRef<B>(id);
  }

  template <typename B, typename M>
  void ActorSystem::send(const ActorRef<B>& to, M message)
  {
    static_assert(is_alternative_v<M, typename B::Message>,
                  "message type is not handled by this actor");
    auto cell = typed_cell(to);
    if (!cell->post(typename B::Message(std::in_place_type<M>, std::move(message)), nullptr))
      dead_letter(to.id());
  }

  template <typename B, typename M>
  ResponseFuture<typename M::Response> ActorSystem::request_future(const ActorRef<B>& to, M message,
                                                                   std::chrono::milliseconds timeout)
  {
    static_assert(is_alternative_v<M, typename B::Message>,
                  "message type is not handled by this actor");
    static_assert(is_request_v<M>, "request_future needs a message that declares a Response type");
    using R = typename M::Response;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto pending = std::make_shared<detail::PendingReplyOf<R>>();
    auto future = pending->future();

    auto cell = typed_cell(to);
    if (!cell->post(typename B::Message(std::in_place_type<M>, std::move(message)), pending))
      dead_letter(to.id());
    return ResponseFuture<R>(std::move(future), to.id().to_string(), deadline);
  }
}
