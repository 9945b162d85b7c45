/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "messaging_service_fwd.hh"
#include "schema_rpc.hh"
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/lowres_clock.hh>
#include "gms/inet_address.hh"
#include <seastar/rpc/rpc_types.hh>
#include <unordered_map>
#include <memory>
#include <array>

namespace netw {

/* All verb handler identifiers */
enum class messaging_verb : int32_t {
    CLIENT_ID = 0,
    DEFINITIONS_UPDATE = 11,
    MIGRATION_REQUEST = 14,
    LAST = 15,
};

} // namespace netw

namespace std {
template <>
class hash<netw::messaging_verb> {
public:
    size_t operator()(const netw::messaging_verb& x) const {
        return hash<int32_t>()(int32_t(x));
    }
};
} // namespace std

namespace netw {

// Peers are addressed by IP. Every connection goes to shard 0.
struct msg_addr {
    gms::inet_address addr;
    uint32_t cpu_id;
    friend bool operator==(const msg_addr& x, const msg_addr& y) noexcept;
    friend bool operator<(const msg_addr& x, const msg_addr& y) noexcept;
    struct hash {
        size_t operator()(const msg_addr& id) const noexcept;
    };
    explicit msg_addr(gms::inet_address ip) noexcept : addr(ip), cpu_id(0) { }
    msg_addr(gms::inet_address ip, uint32_t cpu) noexcept : addr(ip), cpu_id(cpu) { }
};

struct serializer {};

class messaging_service final : public schema_rpc, public seastar::enable_shared_from_this<messaging_service> {
public:
    struct rpc_protocol_wrapper;
    struct rpc_protocol_client_wrapper;
    struct rpc_protocol_server_wrapper;
    struct shard_info;

    using msg_addr = netw::msg_addr;
    using inet_address = gms::inet_address;
    using clients_map = std::unordered_map<msg_addr, shard_info, msg_addr::hash>;

    // This should change only if serialization format changes
    static constexpr int32_t current_messaging_version = 1;

    struct shard_info {
        shard_info(shared_ptr<rpc_protocol_client_wrapper>&& client);
        shared_ptr<rpc_protocol_client_wrapper> rpc_client;
    };

    struct config {
        gms::inet_address ip;                   // a.k.a. listen_address - the address this node is listening on
        gms::inet_address broadcast_address;    // This node's address, as told to other nodes
        uint16_t port;
        bool listen_on_broadcast_address = false;
        size_t rpc_memory_limit = 1'000'000;
    };

private:
    config _cfg;
    std::unique_ptr<rpc_protocol_wrapper> _rpc;
    std::array<std::unique_ptr<rpc_protocol_server_wrapper>, 2> _server;
    clients_map _clients;
    bool _shutting_down = false;

    future<> shutdown_nontls_server();
    future<> stop_nontls_server();
    future<> stop_client();
public:
    using clock_type = lowres_clock;

    explicit messaging_service(config cfg);
    ~messaging_service();

    future<> start_listen();
    uint16_t port() const noexcept {
        return _cfg.port;
    }
    gms::inet_address listen_address() const noexcept {
        return _cfg.ip;
    }
    gms::inet_address broadcast_address() const noexcept {
        return _cfg.broadcast_address;
    }

    future<> shutdown();
    future<> stop();
    static rpc::no_wait_type no_wait();
    bool is_shutting_down() { return _shutting_down; }

    future<> unregister_handler(messaging_verb verb);

    // schema_rpc
    int32_t current_version() const noexcept override {
        return current_messaging_version;
    }

    // Wrapper for DEFINITIONS_UPDATE
    void register_definitions_update(definitions_update_handler func) override;
    future<> unregister_definitions_update() override;
    future<> send_definitions_update(gms::inet_address to, db::frozen_schema_batch fb) override;

    // Wrapper for MIGRATION_REQUEST
    void register_migration_request(migration_request_handler func) override;
    future<> unregister_migration_request() override;
    future<db::frozen_schema_batch> send_migration_request(gms::inet_address to, std::chrono::milliseconds timeout) override;

private:
    template <typename Fn>
    requires std::is_invocable_r_v<bool, Fn, const shard_info&>
    void find_and_remove_client(clients_map& clients, msg_addr id, Fn&& filter);

    void do_start_listen();

public:
    // Return rpc::protocol::client for a shard which is a ip + cpuid pair.
    shared_ptr<rpc_protocol_client_wrapper> get_rpc_client(messaging_verb verb, msg_addr id);
    void remove_error_rpc_client(messaging_verb verb, msg_addr id);
    std::unique_ptr<rpc_protocol_wrapper>& rpc();
    static msg_addr get_source(const rpc::client_info& client);
};

} // namespace netw

template <>
struct fmt::formatter<netw::msg_addr> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    template <typename FormatContext>
    auto format(const netw::msg_addr& addr, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}:{}", addr.addr, addr.cpu_id);
    }
};
