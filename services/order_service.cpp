/*
microshop-order - order service

Registers itself in the coordination store, serves order requests through
its actors, and deregisters on shutdown. Without a reachable store it does
not start.

Usage:
    ./microshop-store config/store.yaml
    ./microshop-order [config/order-service.yaml]

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech
*/

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include "microshop/act/ActorSystem.hpp"
#include "microshop/collab/AuditSink.hpp"
#include "microshop/config/Config.hpp"
#include "microshop/order/OrderActors.hpp"
#include "microshop/order/OrderRpc.hpp"
#include "microshop/registry/RegistryClient.hpp"
#include "microshop/remote/FrameServer.hpp"
#include "microshop/remote/StoreFactory.hpp"
#include "microshop/remote/Zmq.hpp"

using namespace microshop;
using namespace microshop::order;
using namespace std;

static atomic<bool> g_stop{false};

void signal_handler(int) {
    g_stop.store(true);
}

int main(int argc, char* argv[]) {
    string config_path = "config/order-service.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    config::Config cfg;
    try {
        cfg = config::load_file(config_path);
    } catch (const config::ConfigError& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    const registry::ServiceInstance self{cfg.server.name, cfg.server.host, cfg.server.port};
    cout << "=== " << self.name << " (" << self.address() << ") ===" << endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    collab::ConsoleAuditSink audit;
    ActorSystem system(self.name);

    try {
        auto orders = system.spawn<OrderActor>("order-actor", cfg.actors.simulated_latency);
        auto notifications = system.spawn<NotificationActor>("notification-actor");
        auto book = system.spawn<OrderBookActor>("order-book", &audit);

        remote::FrameServer server("tcp://*:" + std::to_string(self.port),
                                   OrderRpcHandler(system, orders, book, notifications,
                                                   cfg.actors.request_timeout));

        // The store is required: an unregistered provider cannot be found.
        auto store = remote::open_store(cfg.registry);
        registry::RegistryClient discovery(store, cfg.registry.prefix);
        discovery.register_instance(self, cfg.registry.lease_ttl);

        server.start();
        cout << "Service registered as " << discovery.key_for(self) << ", press Ctrl+C to stop" << endl;

        while (!g_stop.load()) {
            this_thread::sleep_for(chrono::milliseconds(200));
        }

        cout << "Received shutdown signal" << endl;
        server.stop();
        discovery.deregister(self);
        discovery.close();
    } catch (const registry::RegistryError& e) {
        cerr << "Error: " << e.what() << endl;
        system.shutdown();
        return 1;
    } catch (const remote::ZmqError& e) {
        cerr << "Error: " << e.what() << endl;
        system.shutdown();
        return 1;
    }

    system.shutdown();
    cout << "=== " << self.name << " stopped ===" << endl;
    return 0;
}
