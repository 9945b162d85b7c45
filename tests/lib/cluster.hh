/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <unordered_set>
#include <vector>

#include <seastar/core/gate.hh>
#include <seastar/core/shared_ptr.hh>

#include "db/local_schema.hh"
#include "gms/gossiper.hh"
#include "service/migration_manager.hh"
#include "tests/lib/loopback_rpc.hh"
#include "tests/lib/memory_schema_storage.hh"

namespace tests {

struct node_config {
    std::chrono::milliseconds migration_delay{60000};
    // Reported to the migration manager as the process uptime. Zero makes
    // every pull immediate.
    std::function<std::chrono::steady_clock::duration ()> uptime = [] { return std::chrono::steady_clock::duration::zero(); };
    int32_t messaging_version = netw::messaging_service::current_messaging_version;
    // A node advertising no tokens is a gossip-only member.
    sstring tokens = "0";
};

class test_cluster;

// One node of an in-process cluster: its own schema, membership view and
// migration manager, wired to the other nodes through a loopback_network.
class test_node {
public:
    const gms::inet_address address;
    const node_config cfg;
    memory_schema_storage storage;
    db::local_schema schema;
    gms::gossiper gossiper;
    service::migration_notifier notifier;
    loopback_rpc rpc;
    shared_ptr<service::migration_manager> mm;
private:
    shared_ptr<gms::i_endpoint_state_change_subscriber> _bridge;
    bool _started = false;

    friend class test_cluster;
public:
    test_node(loopback_network& net, gms::inet_address address, node_config cfg);

    bool started() const noexcept {
        return _started;
    }
    // What this node currently advertises about itself.
    gms::application_state_map local_states() const;
};

// Must be used from a seastar thread or a coroutine, and stopped before
// it is destroyed.
//
// The membership feed between the nodes is modelled by forwarding every
// local state change of a node to the gossipers of the other nodes, in
// the background and in order.
class test_cluster {
    loopback_network _net;
    std::vector<std::unique_ptr<test_node>> _nodes;
    std::unordered_set<gms::inet_address> _isolated;
    seastar::gate _feed;
public:
    test_cluster() = default;
    test_cluster(const test_cluster&) = delete;

    // Nodes get the addresses 127.0.0.1, 127.0.0.2, ... in creation order.
    test_node& add_node(node_config cfg = {});

    loopback_network& network() noexcept {
        return _net;
    }
    test_node& node(size_t i) {
        return *_nodes.at(i);
    }
    size_t size() const noexcept {
        return _nodes.size();
    }

    // Starts every node which is not started yet, and makes every started
    // node see the others as live members.
    future<> start();
    future<> stop();

    // Cuts the node off: its calls fail, its state changes are not
    // forwarded and the other nodes see it as down.
    future<> isolate(test_node& n);
    // Reconnects the node, exchanging the current states both ways.
    future<> heal(test_node& n);

    // Every started, connected node holds the same schema version.
    bool in_agreement() const;
private:
    future<> start_node(test_node& n);
    future<> introduce(test_node& from, test_node& to);
    void propagate(gms::inet_address from, gms::application_state_map states);
    bool connected(const test_node& n) const noexcept {
        return n._started && !_isolated.contains(n.address);
    }

    friend class feed_bridge;
};

}
