/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace microshop::config {

namespace {

template <typename T>
void read(const YAML::Node& parent, const char* section, const char* key, T& out) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return;
    }
    try {
        out = node.as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError(std::string("bad value for '") + section + "." + key + "'");
    }
}

template <typename Duration>
void read_duration(const YAML::Node& parent, const char* section, const char* key, Duration& out) {
    typename Duration::rep count = out.count();
    read(parent, section, key, count);
    if (count < 0) {
        throw ConfigError(std::string("'") + section + "." + key + "' must not be negative");
    }
    out = Duration(count);
}

YAML::Node section(const YAML::Node& root, const char* name) {
    const YAML::Node node = root[name];
    if (node && !node.IsNull() && !node.IsMap()) {
        throw ConfigError(std::string("'") + name + "' must be a mapping");
    }
    return node;
}

Config parse(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw ConfigError("top level must be a mapping");
    }

    if (auto node = section(root, "server")) {
        read(node, "server", "name", cfg.server.name);
        read(node, "server", "host", cfg.server.host);
        read(node, "server", "port", cfg.server.port);
    }

    if (auto node = section(root, "registry")) {
        const YAML::Node endpoints = node["endpoints"];
        if (endpoints && endpoints.IsScalar()) {
            cfg.registry.endpoints = {endpoints.as<std::string>()};
        } else {
            read(node, "registry", "endpoints", cfg.registry.endpoints);
        }
        read(node, "registry", "prefix", cfg.registry.prefix);
        read_duration(node, "registry", "dial_timeout", cfg.registry.dial_timeout);
        read_duration(node, "registry", "lease_ttl", cfg.registry.lease_ttl);
        read_duration(node, "registry", "request_timeout_ms", cfg.registry.request_timeout);
        if (cfg.registry.lease_ttl.count() == 0) {
            throw ConfigError("'registry.lease_ttl' must be positive");
        }
    }

    if (auto node = section(root, "gateway")) {
        read(node, "gateway", "host", cfg.gateway.host);
        read(node, "gateway", "port", cfg.gateway.port);
    }

    const YAML::Node upstreams = root["upstreams"];
    if (upstreams && !upstreams.IsNull()) {
        if (!upstreams.IsSequence()) {
            throw ConfigError("'upstreams' must be a sequence");
        }
        cfg.upstreams.clear();
        for (const auto& entry : upstreams) {
            if (!entry.IsMap()) {
                throw ConfigError("'upstreams' entries must be mappings");
            }
            client::Upstream upstream;
            read(entry, "upstreams", "name", upstream.name);
            read(entry, "upstreams", "default_address", upstream.default_address);
            if (upstream.name.empty()) {
                throw ConfigError("'upstreams' entry without a name");
            }
            cfg.upstreams.push_back(std::move(upstream));
        }
    }

    if (auto node = section(root, "actors")) {
        read_duration(node, "actors", "request_timeout_ms", cfg.actors.request_timeout);
        read_duration(node, "actors", "simulated_latency_ms", cfg.actors.simulated_latency);
    }

    return cfg;
}

} // namespace

Config load_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("cannot read '" + path + "'");
    } catch (const YAML::Exception& e) {
        throw ConfigError("'" + path + "': " + e.what());
    }
    return parse(root);
}

Config load_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(e.what());
    }
    return parse(root);
}

} // namespace microshop::config
