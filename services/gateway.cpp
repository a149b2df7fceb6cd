/*
microshop-gateway - issues order requests to a discovered order service

Looks up the order service in the coordination store and falls back to the
configured default address when the store is unreachable or has no record.

Usage:
    ./microshop-gateway config/gateway.yaml                      (demo order)
    ./microshop-gateway config/gateway.yaml create user-1 p1 "Product 1" 2 99.99
    ./microshop-gateway config/gateway.yaml status ORD-1
    ./microshop-gateway config/gateway.yaml track user-1 p1 "Product 1" 2 99.99
    ./microshop-gateway config/gateway.yaml lookup ORD-1
    ./microshop-gateway config/gateway.yaml notify alice@example.com email "hello"

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech
*/

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "microshop/client/ConnectionManager.hpp"
#include "microshop/config/Config.hpp"
#include "microshop/order/OrderRpc.hpp"
#include "microshop/registry/RegistryClient.hpp"
#include "microshop/remote/StoreFactory.hpp"
#include "microshop/remote/ZmqChannel.hpp"

using namespace microshop;
using namespace microshop::order;
using namespace std;

static const string ORDER_SERVICE = "order-service";

static void print(const OrderResponse& r) {
    cout << "order_id=" << r.order_id << " status=" << r.status;
    if (!r.message.empty()) {
        cout << " message=\"" << r.message << "\"";
    }
    cout << endl;
}

static void print(const OrderStatus& s) {
    cout << "order_id=" << s.order_id << " status=" << s.status << endl;
}

static int run(OrderClient& orders, const vector<string>& cmd) {
    if (cmd.empty()) {
        print(orders.create_order("user-123", {{"prod-1", "Product 1", 2, 99.99}}));
        return 0;
    }

    const string& verb = cmd[0];
    client::Frames rest(cmd.begin() + 1, cmd.end());
    if ((verb == "create" || verb == "track") && !rest.empty()) {
        auto items = parse_items(rest, 1);
        print(verb == "create" ? orders.create_order(rest[0], items) : orders.track_order(rest[0], items));
        return 0;
    }
    if (verb == "status" && rest.size() == 1) {
        print(orders.order_status(rest[0]));
        return 0;
    }
    if (verb == "lookup" && rest.size() == 1) {
        print(orders.lookup_order(rest[0]));
        return 0;
    }
    if (verb == "notify" && rest.size() == 3) {
        auto r = orders.send_notification(rest[0], rest[1], rest[2]);
        cout << "success=" << (r.success ? "true" : "false") << " message=\"" << r.message << "\"" << endl;
        return 0;
    }

    cerr << "Unknown or incomplete command: " << verb << endl;
    return 2;
}

int main(int argc, char* argv[]) {
    string config_path = "config/gateway.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }
    vector<string> cmd(argv + (argc > 2 ? 2 : argc), argv + argc);

    config::Config cfg;
    try {
        cfg = config::load_file(config_path);
    } catch (const config::ConfigError& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    // Discovery is optional: every upstream has a default address.
    unique_ptr<registry::RegistryClient> discovery;
    try {
        discovery = make_unique<registry::RegistryClient>(remote::open_store(cfg.registry), cfg.registry.prefix);
    } catch (const registry::RegistryError& e) {
        cerr << "Gateway: service discovery unavailable, using default addresses: " << e.what() << endl;
    }

    int rc = 0;
    try {
        client::ConnectionManager conns(cfg.upstreams, discovery.get(), make_shared<remote::ZmqChannelFactory>(),
                                        chrono::duration_cast<chrono::milliseconds>(cfg.registry.dial_timeout));
        conns.connect();

        auto channel = conns.channel(ORDER_SERVICE);
        if (!channel) {
            cerr << "Error: " << ORDER_SERVICE << " is not among the configured upstreams" << endl;
            return 1;
        }
        OrderClient orders(channel, cfg.actors.request_timeout);
        rc = run(orders, cmd);
        conns.close();
    } catch (const client::ConnectionError& e) {
        cerr << "Error: " << e.what() << endl;
        rc = 1;
    } catch (const client::ConnectionCloseError& e) {
        cerr << "Error: " << e.what() << endl;
        rc = 1;
    } catch (const UpstreamError& e) {
        cerr << "Error: " << e.what() << endl;
        rc = 1;
    } catch (const logic_error& e) {
        cerr << "Error: bad item: " << e.what() << endl;
        rc = 2;
    }

    if (discovery) {
        try {
            discovery->close();
        } catch (const registry::RegistryError& e) {
            cerr << "Gateway: " << e.what() << endl;
        }
    }
    return rc;
}
