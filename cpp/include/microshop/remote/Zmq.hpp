/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include <zmq.hpp>

#include "microshop/client/Channel.hpp"

namespace microshop::remote {

/// A ZeroMQ call failed (bad endpoint, bind conflict, closed context).
class ZmqError : public std::runtime_error {
public:
    ZmqError(const std::string& what, const zmq::error_t& e)
        : std::runtime_error("ZMQ " + what + ": " + e.what()), num_(e.num()) {}

    int num() const { return num_; }

private:
    int num_;
};

/// Process-wide ZeroMQ context shared by every socket.
zmq::context_t& context();

/// "host:port" -> "tcp://host:port"; endpoints with a scheme pass through.
std::string to_endpoint(const std::string& address);

/// "tcp://host:port" -> "host:port".
std::string to_address(const std::string& endpoint);

/// Send all frames as one multipart message.
void send_frames(zmq::socket_t& socket, const client::Frames& frames);

/**
 * Receive one multipart message, waiting at most timeout.
 * @return std::nullopt if nothing arrived in time
 */
std::optional<client::Frames> recv_frames(zmq::socket_t& socket, std::chrono::milliseconds timeout);

} // namespace microshop::remote
