/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "gms/inet_address.hh"
#include <fmt/ranges.h>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/parallel_for_each.hh>
#include <seastar/core/on_internal_error.hh>
#include <seastar/core/when_all.hh>
#include <seastar/util/defer.hh>

#include "message/messaging_service.hh"
#include <seastar/rpc/rpc.hh>
#include "serializer.hh"
#include "serializer_impl.hh"
#include "gms/inet_address_serializer.hh"
#include "db/frozen_schema_batch.hh"
#include "log.hh"
#include "rpc_protocol_impl.hh"

namespace netw {

static_assert(!std::is_default_constructible_v<msg_addr>);
static_assert(std::is_nothrow_copy_constructible_v<msg_addr>);
static_assert(std::is_nothrow_move_constructible_v<msg_addr>);

static logging::logger mlogger("messaging_service");
static logging::logger rpc_logger("rpc");

using inet_address = gms::inet_address;
using namespace std::chrono_literals;

struct messaging_service::rpc_protocol_server_wrapper : public rpc_protocol::server { using rpc_protocol::server::server; };

constexpr int32_t messaging_service::current_messaging_version;

bool operator==(const msg_addr& x, const msg_addr& y) noexcept {
    // Ignore cpu id for now since we do not really support shard to shard connections
    return x.addr == y.addr;
}

bool operator<(const msg_addr& x, const msg_addr& y) noexcept {
    // Ignore cpu id for now since we do not really support shard to shard connections
    if (x.addr < y.addr) {
        return true;
    } else {
        return false;
    }
}

size_t msg_addr::hash::operator()(const msg_addr& id) const noexcept {
    // Ignore cpu id for now since we do not really support // shard to shard connections
    return std::hash<gms::inet_address>()(id.addr);
}

messaging_service::shard_info::shard_info(shared_ptr<rpc_protocol_client_wrapper>&& client)
    : rpc_client(std::move(client))
{
}

future<> messaging_service::unregister_handler(messaging_verb verb) {
    return _rpc->unregister_handler(verb);
}

static
rpc::resource_limits
rpc_resource_limits(size_t memory_limit) {
    rpc::resource_limits limits;
    limits.bloat_factor = 3;
    limits.basic_request_size = 1000;
    limits.max_memory = memory_limit;
    return limits;
}

future<> messaging_service::start_listen() {
    do_start_listen();
    return make_ready_future<>();
}

void messaging_service::do_start_listen() {
    auto broadcast_address = this->broadcast_address();
    bool listen_to_bc = _cfg.listen_on_broadcast_address && _cfg.ip != broadcast_address;
    rpc::server_options so;
    so.load_balancing_algorithm = server_socket::load_balancing_algorithm::port;

    auto limits = rpc_resource_limits(_cfg.rpc_memory_limit);
    if (!_server[0] && _cfg.port) {
        auto listen = [&] (const gms::inet_address& a, rpc::streaming_domain_type sdomain) {
            so.streaming_domain = sdomain;
            auto addr = socket_address{a, _cfg.port};
            return std::unique_ptr<rpc_protocol_server_wrapper>(new rpc_protocol_server_wrapper(_rpc->protocol(),
                    so, addr, limits));
        };
        _server[0] = listen(_cfg.ip, rpc::streaming_domain_type(0x55AA));
        if (listen_to_bc) {
            _server[1] = listen(broadcast_address, rpc::streaming_domain_type(0x66BB));
        }
    }
    if (_server[0]) {
        mlogger.info("Starting Messaging Service on address {} port {}", _cfg.ip, _cfg.port);
    }
    if (_server[1]) {
        mlogger.info("Starting Messaging Service on broadcast address {} port {}", broadcast_address, _cfg.port);
    }
}

messaging_service::messaging_service(config cfg)
    : _cfg(std::move(cfg))
    , _rpc(new rpc_protocol_wrapper(serializer { }))
{
    _rpc->set_logger(&rpc_logger);

    register_handler(this, messaging_verb::CLIENT_ID, [] (rpc::client_info& ci, gms::inet_address broadcast_address, uint32_t src_cpu_id) {
        ci.attach_auxiliary("baddr", broadcast_address);
        ci.attach_auxiliary("src_cpu_id", src_cpu_id);
        return rpc::no_wait;
    });
}

msg_addr messaging_service::get_source(const rpc::client_info& cinfo) {
    return msg_addr{
        cinfo.retrieve_auxiliary<gms::inet_address>("baddr"),
        cinfo.retrieve_auxiliary<uint32_t>("src_cpu_id")
    };
}

messaging_service::~messaging_service() = default;

static future<> do_with_servers(std::string_view what, std::array<std::unique_ptr<messaging_service::rpc_protocol_server_wrapper>, 2>& servers, auto method) {
    mlogger.info("{} server", what);
    co_await coroutine::parallel_for_each(servers, [&method] (auto& ptr) -> future<> {
        if (ptr) {
            co_await method(*ptr);
        }
    });
    mlogger.info("{} server - Done", what);
}

future<> messaging_service::shutdown_nontls_server() {
    return do_with_servers("Shutting down nontls", _server, std::mem_fn(&rpc_protocol_server_wrapper::shutdown));
}

future<> messaging_service::stop_nontls_server() {
    return do_with_servers("Stopping nontls", _server, std::mem_fn(&rpc_protocol_server_wrapper::stop));
}

future<> messaging_service::stop_client() {
    auto d = defer([this] {
        // no new clients should be added by get_rpc_client(), as it
        // checks that _shutting_down is false
        _clients.clear();
        mlogger.info("Stopped clients");
    });
    co_await coroutine::parallel_for_each(_clients, [] (auto& c) -> future<> {
        mlogger.info("Stopping client for address: {}", c.first);
        co_await c.second.rpc_client->stop();
        mlogger.info("Stopping client for address: {} - Done", c.first);
    });
}

future<> messaging_service::shutdown() {
    _shutting_down = true;
    co_await when_all(shutdown_nontls_server(), stop_client()).discard_result();
}

future<> messaging_service::stop() {
    if (!_shutting_down) {
        co_await shutdown();
    }
    co_await stop_nontls_server();
    co_await unregister_handler(messaging_verb::CLIENT_ID);
    if (_rpc->has_handlers()) {
        mlogger.error("RPC server still has handlers registered");
        for (auto verb = messaging_verb::DEFINITIONS_UPDATE; verb < messaging_verb::LAST;
                verb = messaging_verb(int(verb) + 1)) {
            if (_rpc->has_handler(verb)) {
                mlogger.error(" - {}", static_cast<int>(verb));
            }
        }
        on_internal_error(mlogger, "RPC server still has handlers registered");
    }
}

rpc::no_wait_type messaging_service::no_wait() {
    return rpc::no_wait;
}

shared_ptr<messaging_service::rpc_protocol_client_wrapper> messaging_service::get_rpc_client(messaging_verb verb, msg_addr id) {
    if (_shutting_down) {
        on_internal_error(mlogger, format("Cannot connect to {} for verb {}: shutting down", id, int(verb)));
    }
    auto it = _clients.find(id);
    if (it != _clients.end()) {
        auto c = it->second.rpc_client;
        if (!c->error()) {
            return c;
        }
        find_and_remove_client(_clients, id, [] (const auto&) { return true; });
    }

    auto broadcast_address = _cfg.broadcast_address;
    bool listen_to_bc = _cfg.listen_on_broadcast_address && _cfg.ip != broadcast_address;
    auto laddr = socket_address(listen_to_bc ? broadcast_address : _cfg.ip, 0);
    auto remote_addr = socket_address(id.addr, _cfg.port);

    rpc::client_options opts;
    // send keepalive messages each minute if connection is idle, drop connection after 10 failures
    opts.keepalive = std::optional<net::tcp_keepalive_params>({60s, 60s, 10});
    opts.tcp_nodelay = true;
    opts.reuseaddr = true;

    auto client = ::make_shared<rpc_protocol_client_wrapper>(_rpc->protocol(), std::move(opts),
                    remote_addr, laddr);
    auto res = _clients.emplace(id, shard_info(std::move(client)));
    client = res.first->second.rpc_client;

    uint32_t src_cpu_id = this_shard_id();
    // No reply is received, nothing to wait for.
    (void)_rpc->make_client<
            rpc::no_wait_type(gms::inet_address, uint32_t)>(messaging_verb::CLIENT_ID)(
                *client, broadcast_address, src_cpu_id)
            .handle_exception([ms = shared_from_this(), remote_addr, verb] (std::exception_ptr ep) {
        mlogger.debug("Failed to send client id to {} for verb {}: {}", remote_addr, std::underlying_type_t<messaging_verb>(verb), ep);
    });
    return client;
}

template <typename Fn>
requires std::is_invocable_r_v<bool, Fn, const messaging_service::shard_info&>
void messaging_service::find_and_remove_client(clients_map& clients, msg_addr id, Fn&& filter) {
    if (_shutting_down) {
        // if messaging service is in a processed of been stopped no need to
        // stop and remove connection here since they are being stopped already
        // and we'll just interfere
        return;
    }

    auto it = clients.find(id);
    if (it != clients.end() && filter(it->second)) {
        auto client = std::move(it->second.rpc_client);
        clients.erase(it);
        //
        // Explicitly call rpc_protocol_client_wrapper::stop() for the erased
        // item and hold the messaging_service shared pointer till it's over.
        //
        (void)client->stop().finally([addr = id.addr, client, ms = shared_from_this()] {
            mlogger.debug("dropped connection to {}", addr);
        }).discard_result();
    }
}

void messaging_service::remove_error_rpc_client(messaging_verb verb, msg_addr id) {
    find_and_remove_client(_clients, id, [] (const auto& s) { return s.rpc_client->error(); });
}

std::unique_ptr<messaging_service::rpc_protocol_wrapper>& messaging_service::rpc() {
    return _rpc;
}

void messaging_service::register_definitions_update(definitions_update_handler func) {
    register_handler(this, messaging_verb::DEFINITIONS_UPDATE, [func = std::move(func)] (const rpc::client_info& cinfo, db::frozen_schema_batch fb) {
        auto src = get_source(cinfo);
        return func(src.addr, std::move(fb)).then([] {
            return netw::messaging_service::no_wait();
        });
    });
}

future<> messaging_service::unregister_definitions_update() {
    return unregister_handler(messaging_verb::DEFINITIONS_UPDATE);
}

future<> messaging_service::send_definitions_update(gms::inet_address to, db::frozen_schema_batch fb) {
    return send_message_oneway(this, messaging_verb::DEFINITIONS_UPDATE, msg_addr(to), std::move(fb));
}

void messaging_service::register_migration_request(migration_request_handler func) {
    register_handler(this, messaging_verb::MIGRATION_REQUEST, [func = std::move(func)] (const rpc::client_info& cinfo) {
        auto src = get_source(cinfo);
        return func(src.addr);
    });
}

future<> messaging_service::unregister_migration_request() {
    return unregister_handler(messaging_verb::MIGRATION_REQUEST);
}

future<db::frozen_schema_batch> messaging_service::send_migration_request(gms::inet_address to, std::chrono::milliseconds timeout) {
    return send_message_timeout<db::frozen_schema_batch>(this, messaging_verb::MIGRATION_REQUEST, msg_addr(to),
            rpc::rpc_clock_type::now() + timeout);
}

} // namespace netw
