/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/remote/StoreServer.hpp"
#include "microshop/remote/StoreProtocol.hpp"
#include <iostream>
#include <stdexcept>

namespace microshop::remote {

namespace {

void expect_args(const std::string& method, const client::Frames& args, std::size_t n) {
    if (args.size() != n) {
        throw std::invalid_argument(method + " takes " + std::to_string(n) + " argument(s), got " +
                                    std::to_string(args.size()));
    }
}

} // namespace

StoreServer::StoreServer(const std::string& endpoint, std::shared_ptr<registry::KvStore> store)
    : store_(std::move(store))
    , server_(endpoint, [this](const std::string& method, const client::Frames& args) {
        return handle(method, args);
    })
{
}

client::Frames StoreServer::handle(const std::string& method, const client::Frames& args) {
    try {
        if (method == store::LEASE_GRANT) {
            expect_args(method, args, 1);
            auto lease = store_->grant_lease(std::chrono::seconds(std::stoll(args[0])));
            return {store::OK, std::to_string(lease.id), std::to_string(lease.ttl.count())};
        }
        if (method == store::LEASE_KEEPALIVE) {
            expect_args(method, args, 1);
            return {store::OK, store_->keep_alive(std::stoll(args[0])) ? "1" : "0"};
        }
        if (method == store::LEASE_REVOKE) {
            expect_args(method, args, 1);
            store_->revoke_lease(std::stoll(args[0]));
            return {store::OK};
        }
        if (method == store::KV_PUT) {
            expect_args(method, args, 3);
            store_->put(args[0], args[1], std::stoll(args[2]));
            return {store::OK};
        }
        if (method == store::KV_RANGE) {
            expect_args(method, args, 1);
            client::Frames reply{store::OK};
            for (const auto& kv : store_->get_prefix(args[0])) {
                reply.push_back(kv.key);
                reply.push_back(kv.value);
                reply.push_back(std::to_string(kv.lease));
            }
            return reply;
        }
        if (method == store::KV_DELETE) {
            expect_args(method, args, 1);
            return {store::OK, store_->erase(args[0]) ? "1" : "0"};
        }
        return {store::ERROR, "unknown method " + method};
    } catch (const registry::LeaseNotFoundError& e) {
        return {store::LEASE_NOT_FOUND, std::to_string(e.lease_id())};
    } catch (const registry::StoreUnavailableError& e) {
        std::cerr << "StoreServer: " << method << " failed: " << e.what() << std::endl;
        return {store::UNAVAILABLE, e.what()};
    } catch (const registry::RegistryError& e) {
        std::cerr << "StoreServer: " << method << " failed: " << e.what() << std::endl;
        return {store::ERROR, e.what()};
    } catch (const std::logic_error& e) {
        return {store::ERROR, std::string("bad request: ") + e.what()};
    }
}

} // namespace microshop::remote
