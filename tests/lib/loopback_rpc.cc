/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "tests/lib/loopback_rpc.hh"

#include <algorithm>

#include <seastar/rpc/rpc_types.hh>

namespace tests {

loopback_rpc::loopback_rpc(loopback_network& net, gms::inet_address address, int32_t version)
        : _net(net)
        , _address(address)
        , _version(version) {
    _net.add(*this);
}

loopback_rpc::~loopback_rpc() {
    _net.remove(*this);
}

void loopback_rpc::register_definitions_update(definitions_update_handler func) {
    _definitions_update = std::move(func);
}

future<> loopback_rpc::unregister_definitions_update() {
    _definitions_update = {};
    return make_ready_future<>();
}

void loopback_rpc::register_migration_request(migration_request_handler func) {
    _migration_request = std::move(func);
}

future<> loopback_rpc::unregister_migration_request() {
    _migration_request = {};
    return make_ready_future<>();
}

future<db::frozen_schema_batch> loopback_rpc::send_migration_request(gms::inet_address to, std::chrono::milliseconds) {
    _net._migration_requests.push_back({_address, to});
    auto* peer = _net.route(_address, to);
    if (!peer || !peer->_migration_request) {
        return make_exception_future<db::frozen_schema_batch>(rpc::closed_error());
    }
    return peer->_migration_request(_address);
}

future<> loopback_rpc::send_definitions_update(gms::inet_address to, db::frozen_schema_batch fb) {
    _net._definitions_updates.push_back({_address, to});
    auto* peer = _net.route(_address, to);
    if (!peer || !peer->_definitions_update) {
        return make_exception_future<>(rpc::closed_error());
    }
    return peer->_definitions_update(_address, std::move(fb));
}

void loopback_network::set_unreachable(gms::inet_address ep, bool unreachable) {
    if (unreachable) {
        _unreachable.insert(ep);
    } else {
        _unreachable.erase(ep);
    }
}

size_t loopback_network::definitions_updates_to(gms::inet_address ep) const {
    return std::count_if(_definitions_updates.begin(), _definitions_updates.end(), [ep] (const message& m) {
        return m.to == ep;
    });
}

size_t loopback_network::migration_requests_to(gms::inet_address ep) const {
    return std::count_if(_migration_requests.begin(), _migration_requests.end(), [ep] (const message& m) {
        return m.to == ep;
    });
}

void loopback_network::clear_history() noexcept {
    _definitions_updates.clear();
    _migration_requests.clear();
}

void loopback_network::add(loopback_rpc& rpc) {
    _endpoints[rpc.address()] = &rpc;
}

void loopback_network::remove(loopback_rpc& rpc) noexcept {
    auto it = _endpoints.find(rpc.address());
    if (it != _endpoints.end() && it->second == &rpc) {
        _endpoints.erase(it);
    }
}

loopback_rpc* loopback_network::route(gms::inet_address from, gms::inet_address to) const noexcept {
    if (_unreachable.contains(from) || _unreachable.contains(to)) {
        return nullptr;
    }
    auto it = _endpoints.find(to);
    return it == _endpoints.end() ? nullptr : it->second;
}

}
