/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/remote/Zmq.hpp"
#include <iterator>
#include <vector>

#include <zmq_addon.hpp>

namespace microshop::remote {

zmq::context_t& context() {
    static zmq::context_t ctx(1);
    return ctx;
}

std::string to_endpoint(const std::string& address) {
    if (address.find("://") != std::string::npos) {
        return address;
    }
    return "tcp://" + address;
}

std::string to_address(const std::string& endpoint) {
    auto pos = endpoint.find("://");
    return pos == std::string::npos ? endpoint : endpoint.substr(pos + 3);
}

void send_frames(zmq::socket_t& socket, const client::Frames& frames) {
    for (std::size_t i = 0; i < frames.size(); ++i) {
        auto flags = i + 1 < frames.size() ? zmq::send_flags::sndmore : zmq::send_flags::none;
        if (!socket.send(zmq::buffer(frames[i]), flags)) {
            throw client::ChannelError("send would block");
        }
    }
}

std::optional<client::Frames> recv_frames(zmq::socket_t& socket, std::chrono::milliseconds timeout) {
    std::vector<zmq::pollitem_t> items = {{socket.handle(), 0, ZMQ_POLLIN, 0}};
    zmq::poll(items, timeout);
    if ((items[0].revents & ZMQ_POLLIN) == 0) {
        return std::nullopt;
    }

    std::vector<zmq::message_t> msgs;
    if (!zmq::recv_multipart(socket, std::back_inserter(msgs), zmq::recv_flags::dontwait)) {
        return std::nullopt;
    }
    client::Frames frames;
    frames.reserve(msgs.size());
    for (const auto& m : msgs) {
        frames.push_back(m.to_string());
    }
    return frames;
}

} // namespace microshop::remote
