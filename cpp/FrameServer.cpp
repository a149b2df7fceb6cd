/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/remote/FrameServer.hpp"
#include "microshop/remote/Zmq.hpp"
#include <iostream>

namespace microshop::remote {

namespace {
constexpr std::chrono::milliseconds POLL_INTERVAL{100};
}

FrameServer::FrameServer(const std::string& endpoint, Handler handler)
    : handler_(std::move(handler))
{
    try {
        socket_ = std::make_unique<zmq::socket_t>(context(), zmq::socket_type::router);
        socket_->set(zmq::sockopt::linger, 0);
        socket_->bind(endpoint);
        endpoint_ = socket_->get(zmq::sockopt::last_endpoint);
    } catch (const zmq::error_t& e) {
        throw ZmqError("bind " + endpoint, e);
    }
}

FrameServer::~FrameServer() {
    stop();
}

void FrameServer::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::make_unique<std::thread>([this]() {
        serve_loop();
    });
    std::cout << "FrameServer: serving on " << endpoint_ << std::endl;
}

void FrameServer::stop() {
    running_.store(false);
    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
    thread_.reset();
    if (socket_) {
        socket_->close();
        socket_.reset();
    }
}

void FrameServer::serve_loop() {
    while (running_.load()) {
        try {
            auto request = recv_frames(*socket_, POLL_INTERVAL);
            if (request) {
                serve_one(*request);
            }
        } catch (const zmq::error_t& e) {
            std::cerr << "FrameServer: " << endpoint_ << ": " << e.what() << std::endl;
        } catch (const client::ChannelError& e) {
            std::cerr << "FrameServer: " << endpoint_ << ": " << e.what() << std::endl;
        }
    }
}

void FrameServer::serve_one(const client::Frames& request) {
    // [identity, empty, correlation, method, args...]
    if (request.size() < 4) {
        std::cerr << "FrameServer: dropping malformed request with " << request.size() << " frames" << std::endl;
        return;
    }
    const std::string& method = request[3];
    client::Frames args(request.begin() + 4, request.end());

    client::Frames reply;
    if (method == "ping") {
        reply = {"pong"};
    } else {
        try {
            reply = handler_(method, args);
        } catch (const std::exception& e) {
            std::cerr << "FrameServer: " << method << " failed: " << e.what() << std::endl;
            reply = {"error", e.what()};
        }
    }

    client::Frames out{request[0], request[1], request[2]};
    out.insert(out.end(), reply.begin(), reply.end());
    send_frames(*socket_, out);
    served_.fetch_add(1);
}

} // namespace microshop::remote
