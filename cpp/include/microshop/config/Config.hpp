/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "microshop/client/ConnectionManager.hpp"

namespace microshop::config {

/// Unreadable file, malformed YAML, or a value of the wrong type.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error("Config error: " + msg) {}
};

struct ServerConfig {
    std::string name = "order-service";
    std::string host = "127.0.0.1";
    int port = 50052;
};

struct RegistryConfig {
    /// "memory://" for an in-process store, otherwise ZeroMQ endpoints.
    std::vector<std::string> endpoints{"tcp://127.0.0.1:2379"};
    std::string prefix = "/microshop/services/";
    std::chrono::seconds dial_timeout{5};
    std::chrono::seconds lease_ttl{30};
    std::chrono::milliseconds request_timeout{2000};
};

struct GatewayConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
};

struct ActorConfig {
    std::chrono::milliseconds request_timeout{5000};
    std::chrono::milliseconds simulated_latency{100};
};

/**
 * Config - process configuration
 *
 * Every key is optional; missing keys keep the defaults above.
 */
struct Config {
    ServerConfig server;
    RegistryConfig registry;
    GatewayConfig gateway;
    std::vector<client::Upstream> upstreams{
        {"user-service", "localhost:50051"},
        {"order-service", "localhost:50052"},
    };
    ActorConfig actors;
};

/**
 * Load configuration from a YAML file.
 * @throws ConfigError naming the file or the offending key
 */
Config load_file(const std::string& path);

/**
 * Load configuration from YAML text.
 * @throws ConfigError naming the offending key
 */
Config load_string(const std::string& yaml);

} // namespace microshop::config
