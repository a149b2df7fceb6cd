/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "microshop/Actor.hpp"
#include "microshop/Mailbox.hpp"
#include "microshop/Message.hpp"

namespace microshop::detail {

/**
 * ActorCellBase - the untyped half of a running actor
 *
 * Owns the actor's thread and lifecycle state. The ActorSystem keeps cells
 * through this base; the typed half below owns the behavior and mailbox.
 */
class ActorCellBase {
public:
    using ExitHook = std::function<void(const ActorId&)>;

    explicit ActorCellBase(ActorId id) : id_(std::move(id)) {}
    virtual ~ActorCellBase() = default;

    ActorCellBase(const ActorCellBase&) = delete;
    ActorCellBase& operator=(const ActorCellBase&) = delete;

    const ActorId& id() const { return id_; }

    MailboxState state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

    /// Wait until the state reached at least `target`.
    bool wait_for_state(MailboxState target, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(state_mutex_);
        return state_cv_.wait_for(lock, timeout, [&] { return state_ >= target; });
    }

    /// Enqueue Started and launch the thread. Called once by the ActorSystem.
    virtual void start() = 0;

    /// Seal the mailbox behind Stopping/Stopped. False if already stopping.
    virtual bool request_stop() = 0;

    virtual std::size_t queue_length() const = 0;

    std::uint64_t message_count() const { return msg_cnt_.load(); }

    /// True when called from the actor's own thread, i.e. from one of its handlers.
    bool on_own_thread() const { return thread_.get_id() == std::this_thread::get_id(); }

    /// Join the actor thread. No-op when called from the actor's own thread.
    void join() {
        if (thread_.joinable() && !on_own_thread())
            thread_.join();
    }

protected:
    /// Move the state forward; never backwards.
    void advance(MailboxState next) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (next <= state_)
                return;
            state_ = next;
        }
        state_cv_.notify_all();
    }

    ActorId id_;
    std::thread thread_;
    std::atomic<std::uint64_t> msg_cnt_{0};

private:
    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    MailboxState state_ = MailboxState::Starting;
};

/**
 * ActorCell - runs behavior B on its own thread
 *
 * The thread pops one envelope at a time and runs it to completion before
 * taking the next, until the Stopped signal has been handled.
 */
template <typename B>
class ActorCell : public ActorCellBase {
public:
    using Message = typename B::Message;
    using Item = Envelope<Message>;

    ActorCell(ActorSystem& system, ActorId id, std::unique_ptr<B> behavior, ExitHook on_exit)
        : ActorCellBase(std::move(id))
        , system_(system)
        , behavior_(std::move(behavior))
        , on_exit_(std::move(on_exit)) {}

    ~ActorCell() override { join(); }

    void start() override {
        mailbox_.push(Item{msg::Started{}, nullptr});
        thread_ = std::thread([this]() { run(); });
    }

    /**
     * Enqueue a user message.
     * @return false if the actor is stopping or stopped
     */
    bool post(Message message, std::shared_ptr<PendingReply> reply) {
        return mailbox_.push(Item{typename Item::Payload(std::in_place_index<3>, std::move(message)),
                                  std::move(reply)});
    }

    bool request_stop() override {
        std::vector<Item> trailing;
        trailing.push_back(Item{msg::Stopping{}, nullptr});
        trailing.push_back(Item{msg::Stopped{}, nullptr});
        if (!mailbox_.seal(std::move(trailing)))
            return false;
        advance(MailboxState::Stopping);
        return true;
    }

    std::size_t queue_length() const override { return mailbox_.length(); }

private:
    void run() {
        ActorContext ctx(system_, id_);
        for (;;) {
            auto [item, last] = mailbox_.pop();
            (void)last;
            const bool stopped = std::holds_alternative<msg::Stopped>(item.payload);
            dispatch(ctx, item);
            if (stopped)
                break;
        }
        // The name is free again before anyone sees Stopped.
        if (on_exit_)
            on_exit_(id_);
        advance(MailboxState::Stopped);
    }

    void dispatch(ActorContext& ctx, Item& item) {
        std::visit(
            [&](auto& payload) {
                using P = std::decay_t<decltype(payload)>;
                if constexpr (std::is_same_v<P, msg::Started>) {
                    signal(ctx, &B::on_started, "on_started");
                    advance(MailboxState::Running);
                } else if constexpr (std::is_same_v<P, msg::Stopping>) {
                    signal(ctx, &B::on_stopping, "on_stopping");
                } else if constexpr (std::is_same_v<P, msg::Stopped>) {
                    signal(ctx, &B::on_stopped, "on_stopped");
                } else {
                    std::visit([&](const auto& m) { deliver(ctx, m, item.reply); }, payload);
                }
            },
            item.payload);
    }

    template <typename Hook>
    void signal(ActorContext& ctx, Hook hook, const char* what) {
        try {
            ((*behavior_).*hook)(ctx);
        } catch (const std::exception& e) {
            std::cerr << "ActorSystem: '" << id_.to_string() << "' " << what
                      << " failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "ActorSystem: '" << id_.to_string() << "' " << what
                      << " failed with a non-standard exception" << std::endl;
        }
    }

    template <typename M>
    void deliver(ActorContext& ctx, const M& m, const std::shared_ptr<PendingReply>& reply) {
        ++msg_cnt_;
        try {
            if constexpr (is_request_v<M>) {
                using R = typename M::Response;
                static_assert(std::is_same_v<decltype(behavior_->handle(ctx, m)), R>,
                              "a request handler must return the request's Response type");
                R response = behavior_->handle(ctx, m);
                if (reply)
                    static_cast<PendingReplyOf<R>&>(*reply).fulfill(std::move(response));
            } else {
                behavior_->handle(ctx, m);
            }
        } catch (const std::exception& e) {
            std::cerr << "ActorSystem: '" << id_.to_string() << "' failed handling message: "
                      << e.what() << std::endl;
            if (reply)
                reply->fail(std::current_exception());
        } catch (...) {
            std::cerr << "ActorSystem: '" << id_.to_string()
                      << "' failed handling message with a non-standard exception" << std::endl;
            if (reply)
                reply->fail(std::current_exception());
        }
    }

    ActorSystem& system_;
    std::unique_ptr<B> behavior_;
    Mailbox<Item> mailbox_;
    ExitHook on_exit_;
};

} // namespace microshop::detail
