/*
 * Tests for configuration loading
 */

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include "microshop/config/Config.hpp"

using namespace microshop::config;
using namespace std::chrono_literals;

TEST(ConfigTest, EmptyDocumentGivesDefaults) {
    auto cfg = load_string("");
    EXPECT_EQ(cfg.server.name, "order-service");
    EXPECT_EQ(cfg.server.port, 50052);
    EXPECT_EQ(cfg.registry.prefix, "/microshop/services/");
    EXPECT_EQ(cfg.registry.lease_ttl, 30s);
    EXPECT_EQ(cfg.registry.dial_timeout, 5s);
    EXPECT_EQ(cfg.registry.request_timeout, 2000ms);
    EXPECT_EQ(cfg.actors.request_timeout, 5000ms);
    EXPECT_EQ(cfg.actors.simulated_latency, 100ms);
    ASSERT_EQ(cfg.upstreams.size(), 2u);
    EXPECT_EQ(cfg.upstreams[0].name, "user-service");
    EXPECT_EQ(cfg.upstreams[0].default_address, "localhost:50051");
    EXPECT_EQ(cfg.upstreams[1].default_address, "localhost:50052");
}

TEST(ConfigTest, FullDocument) {
    auto cfg = load_string(R"(
server:
  name: user-service
  host: 10.0.0.5
  port: 50051
registry:
  endpoints: [tcp://10.0.0.1:2379, tcp://10.0.0.2:2379]
  prefix: /shop/
  dial_timeout: 2
  lease_ttl: 10
  request_timeout_ms: 500
gateway:
  host: 127.0.0.1
  port: 9090
upstreams:
  - name: order-service
    default_address: orders:50052
actors:
  request_timeout_ms: 1000
  simulated_latency_ms: 0
)");
    EXPECT_EQ(cfg.server.name, "user-service");
    EXPECT_EQ(cfg.server.host, "10.0.0.5");
    EXPECT_EQ(cfg.server.port, 50051);
    ASSERT_EQ(cfg.registry.endpoints.size(), 2u);
    EXPECT_EQ(cfg.registry.endpoints[1], "tcp://10.0.0.2:2379");
    EXPECT_EQ(cfg.registry.prefix, "/shop/");
    EXPECT_EQ(cfg.registry.dial_timeout, 2s);
    EXPECT_EQ(cfg.registry.lease_ttl, 10s);
    EXPECT_EQ(cfg.registry.request_timeout, 500ms);
    EXPECT_EQ(cfg.gateway.port, 9090);
    ASSERT_EQ(cfg.upstreams.size(), 1u);
    EXPECT_EQ(cfg.upstreams[0].name, "order-service");
    EXPECT_EQ(cfg.upstreams[0].default_address, "orders:50052");
    EXPECT_EQ(cfg.actors.request_timeout, 1000ms);
    EXPECT_EQ(cfg.actors.simulated_latency, 0ms);
}

TEST(ConfigTest, SingleEndpointScalar) {
    auto cfg = load_string("registry:\n  endpoints: memory://\n");
    ASSERT_EQ(cfg.registry.endpoints.size(), 1u);
    EXPECT_EQ(cfg.registry.endpoints[0], "memory://");
}

TEST(ConfigTest, WrongTypeNamesKey) {
    try {
        load_string("server:\n  port: not-a-number\n");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("server.port"), std::string::npos);
    }
}

TEST(ConfigTest, MalformedYaml) {
    EXPECT_THROW(load_string("server: [unclosed\n"), ConfigError);
}

TEST(ConfigTest, SectionMustBeMapping) {
    EXPECT_THROW(load_string("registry: 5\n"), ConfigError);
    EXPECT_THROW(load_string("upstreams: {name: x}\n"), ConfigError);
}

TEST(ConfigTest, ZeroLeaseTtlRejected) {
    EXPECT_THROW(load_string("registry:\n  lease_ttl: 0\n"), ConfigError);
}

TEST(ConfigTest, NegativeTimeoutRejected) {
    EXPECT_THROW(load_string("actors:\n  request_timeout_ms: -1\n"), ConfigError);
}

TEST(ConfigTest, MissingFile) {
    EXPECT_THROW(load_file("/nonexistent/microshop.yaml"), ConfigError);
}

TEST(ConfigTest, LoadFile) {
    std::string path = ::testing::TempDir() + "microshop_config_test.yaml";
    {
        std::ofstream out(path);
        out << "server:\n  name: from-file\n";
    }
    auto cfg = load_file(path);
    EXPECT_EQ(cfg.server.name, "from-file");
    std::remove(path.c_str());
}
