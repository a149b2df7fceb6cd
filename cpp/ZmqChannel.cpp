/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/remote/ZmqChannel.hpp"
#include "microshop/remote/Zmq.hpp"

namespace microshop::remote {

ZmqChannel::ZmqChannel(std::string address)
    : address_(std::move(address))
{
    try {
        socket_ = std::make_unique<zmq::socket_t>(context(), zmq::socket_type::dealer);
        socket_->set(zmq::sockopt::linger, 0);
        socket_->connect(to_endpoint(address_));
    } catch (const zmq::error_t& e) {
        throw ZmqError("connect to " + address_, e);
    }
}

ZmqChannel::~ZmqChannel() {
    close();
}

std::shared_ptr<ZmqChannel> ZmqChannel::dial(const std::string& address, std::chrono::milliseconds timeout) {
    std::shared_ptr<ZmqChannel> ch(new ZmqChannel(address));
    auto reply = ch->call("ping", {}, timeout);
    if (reply.empty() || reply[0] != "pong") {
        throw client::ChannelError("unexpected answer to ping from " + address);
    }
    return ch;
}

client::Frames ZmqChannel::call(const std::string& method, const client::Frames& args,
                                std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!socket_) {
        throw client::ChannelError("channel to " + address_ + " is closed");
    }

    const std::string correlation = std::to_string(next_correlation_++);
    client::Frames request;
    request.reserve(args.size() + 3);
    request.push_back("");
    request.push_back(correlation);
    request.push_back(method);
    request.insert(request.end(), args.begin(), args.end());

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    try {
        send_frames(*socket_, request);

        for (;;) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                break;
            }
            auto frames = recv_frames(*socket_, remaining);
            if (!frames) {
                break;
            }
            if (frames->size() < 2 || (*frames)[1] != correlation) {
                ++late_replies_;
                continue;
            }
            return client::Frames(frames->begin() + 2, frames->end());
        }
    } catch (const zmq::error_t& e) {
        throw client::ChannelError(method + " to " + address_ + ": " + e.what());
    }

    throw client::ChannelTimeoutError(method + " to " + address_ + " after " +
                                      std::to_string(timeout.count()) + "ms");
}

void ZmqChannel::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (socket_) {
        socket_->close();
        socket_.reset();
    }
}

std::uint64_t ZmqChannel::late_replies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return late_replies_;
}

std::shared_ptr<client::Channel> ZmqChannelFactory::dial(const std::string& address,
                                                         std::chrono::milliseconds timeout) {
    return ZmqChannel::dial(address, timeout);
}

} // namespace microshop::remote
