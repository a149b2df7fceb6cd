/*
microshop-store - coordination store daemon

Hosts an in-process lease store behind a ZeroMQ ROUTER socket. Services
register and discover through it with ZmqKvStore.

Usage:
    ./microshop-store [config/store.yaml]

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech
*/

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include "microshop/config/Config.hpp"
#include "microshop/registry/MemoryKvStore.hpp"
#include "microshop/remote/StoreServer.hpp"
#include "microshop/remote/Zmq.hpp"

using namespace microshop;
using namespace std;

static atomic<bool> g_stop{false};

void signal_handler(int) {
    g_stop.store(true);
}

int main(int argc, char* argv[]) {
    string config_path = "config/store.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    try {
        auto cfg = config::load_file(config_path);
        const string endpoint = "tcp://" + cfg.server.host + ":" + std::to_string(cfg.server.port);

        cout << "=== microshop-store ===" << endl;
        cout << "Endpoint: " << endpoint << endl;

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        auto store = make_shared<registry::MemoryKvStore>();
        remote::StoreServer server(endpoint, store);
        server.start();

        cout << "Store ready, press Ctrl+C to stop" << endl;
        while (!g_stop.load()) {
            this_thread::sleep_for(chrono::milliseconds(200));
        }

        server.stop();
        store->close();
    } catch (const config::ConfigError& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    } catch (const remote::ZmqError& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    cout << "=== microshop-store stopped ===" << endl;
    return 0;
}
