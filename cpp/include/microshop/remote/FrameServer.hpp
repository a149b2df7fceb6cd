/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <zmq.hpp>

#include "microshop/client/Channel.hpp"

namespace microshop::remote {

/**
 * FrameServer - serves ZmqChannel requests on a ROUTER socket
 *
 * The socket is bound in the constructor, so a port conflict is reported to
 * the caller instead of to a background thread. One thread serves requests
 * one after another; "ping" is answered with "pong" without reaching the
 * handler.
 *
 * Usage:
 *   FrameServer server("tcp://0.0.0.0:50052", handler);
 *   server.start();
 *   ...
 *   server.stop();
 */
class FrameServer {
public:
    using Handler = std::function<client::Frames(const std::string& method, const client::Frames& args)>;

    /**
     * @param endpoint Bind endpoint; "tcp://127.0.0.1:*" picks a free port
     * @throws ZmqError if the endpoint cannot be bound
     */
    FrameServer(const std::string& endpoint, Handler handler);

    ~FrameServer();

    FrameServer(const FrameServer&) = delete;
    FrameServer& operator=(const FrameServer&) = delete;

    void start();

    /// Stop serving and join the thread. Safe to call more than once.
    void stop();

    bool is_running() const { return running_.load(); }

    /// The endpoint actually bound, with the port resolved.
    const std::string& endpoint() const { return endpoint_; }

    std::uint64_t served() const { return served_.load(); }

private:
    void serve_loop();
    void serve_one(const client::Frames& request);

    std::unique_ptr<zmq::socket_t> socket_;
    std::string endpoint_;
    Handler handler_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> served_{0};
    std::unique_ptr<std::thread> thread_;
};

} // namespace microshop::remote
