/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <string>
#include <utility>

#include "microshop/Errors.hpp"

namespace microshop {

namespace detail {

/**
 * Reply slot of one request, shared between the caller's future and the
 * envelope in the target mailbox. The first completion wins; anything after
 * that is ignored, which is how a reply that arrives after the caller gave up
 * is discarded.
 */
class PendingReply {
public:
    virtual ~PendingReply() = default;
    virtual void fail(std::exception_ptr error) = 0;
    bool completed() const { return completed_.load(); }

protected:
    bool claim() { return !completed_.exchange(true); }

private:
    std::atomic<bool> completed_{false};
};

template <typename R>
class PendingReplyOf : public PendingReply {
public:
    std::future<R> future() { return promise_.get_future(); }

    void fulfill(R value) {
        if (claim())
            promise_.set_value(std::move(value));
    }

    void fail(std::exception_ptr error) override {
        if (claim())
            promise_.set_exception(std::move(error));
    }

private:
    std::promise<R> promise_;
};

} // namespace detail

/**
 * ResponseFuture - caller side of RequestFuture
 *
 * Resolves to the actor's single reply, rethrows the exception the actor's
 * handler raised, or throws TimeoutError once the deadline fixed at request
 * time has passed. get() may be called once.
 *
 * Usage:
 *   auto fut = system.request_future(ref, GetOrderStatus{"ORD-1"}, 5s);
 *   OrderStatus status = fut.get();
 */
template <typename R>
class ResponseFuture {
public:
    using Clock = std::chrono::steady_clock;

    ResponseFuture(std::future<R> future, std::string target, Clock::time_point deadline)
        : future_(std::move(future))
        , target_(std::move(target))
        , deadline_(deadline) {}

    ResponseFuture(ResponseFuture&&) = default;
    ResponseFuture& operator=(ResponseFuture&&) = default;

    /// Non-blocking poll.
    bool ready() const {
        return future_.valid() &&
               future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    /// Block until the reply is available or the deadline passes.
    /// @return true if a reply (or failure) is available; false once consumed
    bool wait() const {
        return future_.valid() &&
               future_.wait_until(deadline_) == std::future_status::ready;
    }

    /**
     * Block for the reply.
     * @throws TimeoutError if no reply arrived before the deadline
     * @throws DeadLetterError if the request was dropped without a reply
     * @throws whatever the actor's handler threw
     */
    R get() {
        if (!future_.valid())
            throw ActorError("ResponseFuture for " + target_ + " already consumed");
        if (!wait())
            throw TimeoutError("no reply from " + target_);
        try {
            return future_.get();
        } catch (const std::future_error& e) {
            if (e.code() == std::future_errc::broken_promise)
                throw DeadLetterError(target_);
            throw;
        }
    }

    const std::string& target() const { return target_; }
    Clock::time_point deadline() const { return deadline_; }

private:
    std::future<R> future_;
    std::string target_;
    Clock::time_point deadline_;
};

} // namespace microshop
