/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <seastar/core/shared_ptr.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/loop.hh>
#include <seastar/util/noncopyable_function.hh>
#include "utils/atomic_vector.hh"
#include "gms/versioned_value.hh"
#include "gms/application_state.hh"
#include "gms/endpoint_state.hh"
#include "gms/inet_address.hh"
#include <unordered_map>
#include <unordered_set>
#include <set>

namespace gms {

class i_endpoint_state_change_subscriber;

struct gossip_config {
    sstring cluster_name;
};

/**
 * The node side of the membership feed. It maintains the application states
 * every known endpoint advertises and the set of live endpoints, and fans
 * every change out to the registered subscribers as an endpoint_event.
 *
 * The membership protocol proper (heartbeats, failure detection, state
 * exchange) lives outside of this class and drives it through apply_state(),
 * mark_alive(), mark_dead(), restart() and remove_endpoint(). Local state is
 * published with add_local_application_state().
 *
 * All methods must be called on shard 0.
 */
class gossiper {
public:
    using clk = seastar::lowres_system_clock;
private:
    inet_address _broadcast_address;
    gossip_config _gcfg;
    bool _enabled = false;

    std::unordered_map<inet_address, endpoint_state_ptr> _endpoint_state_map;
    // Serializes changes to _endpoint_state_map and the delivery of the
    // associated notifications, so subscribers see changes in order.
    semaphore _endpoint_update_semaphore{1};

    /* subscribers for interest in endpoint_state change */
    atomic_vector<shared_ptr<i_endpoint_state_change_subscriber>> _subscribers;

    /* live member set, never contains the local node */
    std::unordered_set<inet_address> _live_endpoints;

private:
    future<semaphore_units<>> lock_endpoint_update_semaphore();
    future<> do_notify(endpoint_event event);
    void replicate(inet_address ep, endpoint_state es);
public:
    explicit gossiper(inet_address broadcast_address, gossip_config gcfg = {});

    inet_address get_broadcast_address() const noexcept {
        return _broadcast_address;
    }

    /**
     * Register for interesting state changes.
     *
     * @param subscriber module which implements the i_endpoint_state_change_subscriber
     */
    void register_(shared_ptr<i_endpoint_state_change_subscriber> subscriber);

    /**
     * Unregister interest for state changes.
     *
     * @param subscriber module which implements the i_endpoint_state_change_subscriber
     */
    future<> unregister_(shared_ptr<i_endpoint_state_change_subscriber> subscriber);

    // Live endpoints, including the local node unless it announced shutdown.
    std::set<inet_address> get_live_members() const;

    bool is_alive(inet_address ep) const;

    /**
     * A live member which does not take part in the token ring:
     * it advertises no tokens, or a status other than NORMAL.
     */
    bool is_gossip_only_member(inet_address endpoint) const;

    bool is_dead_state(const endpoint_state& eps) const;

    std::string_view get_gossip_status(const endpoint_state& ep_state) const noexcept;
    std::string_view get_gossip_status(const inet_address& endpoint) const noexcept;

    endpoint_state_ptr get_endpoint_state_ptr(inet_address ep) const noexcept;

    size_t num_endpoints() const noexcept {
        return _endpoint_state_map.size();
    }

    // Calls func for every known endpoint until it returns stop_iteration::yes.
    void for_each_endpoint_state_until(noncopyable_function<stop_iteration(const inet_address&, const endpoint_state&)> func) const;

public:
    /**
     * Merge application states heard from the membership protocol.
     * An endpoint seen for the first time is announced with a join event,
     * then every state whose value differs from the known one is announced
     * with a single change event.
     */
    future<> apply_state(inet_address endpoint, application_state_map states);

    future<> mark_alive(inet_address endpoint);

    future<> mark_dead(inet_address endpoint);

    /**
     * The endpoint came back with a fresh set of states. The endpoint is
     * considered down until it is marked alive again.
     */
    future<> restart(inet_address endpoint, application_state_map states);

    // Forget the endpoint altogether.
    future<> remove_endpoint(inet_address endpoint);

    future<> add_local_application_state(application_state state, versioned_value value);

    /**
     * Applies all states in set "atomically", as in guaranteed monotonic versions and
     * inserted into endpoint state together.
     */
    future<> add_local_application_state(application_state_map states);

    // Add multiple application states
    future<> add_local_application_state(std::convertible_to<std::pair<const application_state, versioned_value>> auto&&... states);

    // Publishes the local endpoint with the given initial states.
    future<> start(application_state_map preload_local_states = {});
    // Announces the local node as shut down.
    future<> shutdown();
    future<> stop();

    bool is_enabled() const noexcept {
        return _enabled;
    }
};

future<>
gossiper::add_local_application_state(std::convertible_to<std::pair<const application_state, versioned_value>> auto&&... states) {
    application_state_map tmp;
    (..., tmp.emplace(std::forward<decltype(states)>(states)));
    return add_local_application_state(std::move(tmp));
}

} // namespace gms
