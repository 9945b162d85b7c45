/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "gms/inet_address.hh"
#include "gms/endpoint_state.hh"
#include "gms/versioned_value.hh"
#include "gms/gossiper.hh"
#include "gms/application_state.hh"
#include "gms/i_endpoint_state_change_subscriber.hh"
#include "log.hh"
#include <fmt/ranges.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/shard_id.hh>
#include <seastar/core/on_internal_error.hh>

namespace gms {

static logging::logger logger("gossip");

gossiper::gossiper(inet_address broadcast_address, gossip_config gcfg)
        : _broadcast_address(broadcast_address)
        , _gcfg(std::move(gcfg)) {
}

future<semaphore_units<>> gossiper::lock_endpoint_update_semaphore() {
    if (this_shard_id() != 0) {
        on_internal_error(logger, "must be called on shard 0");
    }
    return get_units(_endpoint_update_semaphore, 1);
}

void gossiper::replicate(inet_address ep, endpoint_state es) {
    _endpoint_state_map[ep] = make_endpoint_state_ptr(std::move(es));
}

void gossiper::register_(shared_ptr<i_endpoint_state_change_subscriber> subscriber) {
    _subscribers.add(subscriber);
}

future<> gossiper::unregister_(shared_ptr<i_endpoint_state_change_subscriber> subscriber) {
    return _subscribers.remove(subscriber);
}

future<> gossiper::do_notify(endpoint_event event) {
    logger.trace("Notifying subscribers of {}", event);
    co_await _subscribers.for_each([&event] (shared_ptr<i_endpoint_state_change_subscriber> subscriber) {
        return subscriber->on_endpoint_event(event);
    });
}

std::set<inet_address> gossiper::get_live_members() const {
    std::set<inet_address> live_members(_live_endpoints.begin(), _live_endpoints.end());
    logger.debug("live_members before={}", live_members);
    if (get_gossip_status(_broadcast_address) != versioned_value::SHUTDOWN) {
        live_members.insert(_broadcast_address);
    }
    logger.debug("live_members after={}", live_members);
    return live_members;
}

bool gossiper::is_alive(inet_address ep) const {
    if (ep == _broadcast_address) {
        return true;
    }
    return _live_endpoints.contains(ep);
}

bool gossiper::is_dead_state(const endpoint_state& eps) const {
    auto status = eps.get_status();
    return status == versioned_value::STATUS_LEFT || status == versioned_value::SHUTDOWN;
}

bool gossiper::is_gossip_only_member(inet_address endpoint) const {
    auto es = get_endpoint_state_ptr(endpoint);
    if (!es) {
        return false;
    }
    return !is_dead_state(*es) && (!es->has_tokens() || es->get_status() != versioned_value::STATUS_NORMAL);
}

std::string_view gossiper::get_gossip_status(const endpoint_state& ep_state) const noexcept {
    return ep_state.get_status();
}

std::string_view gossiper::get_gossip_status(const inet_address& endpoint) const noexcept {
    auto it = _endpoint_state_map.find(endpoint);
    if (it == _endpoint_state_map.end()) {
        return std::string_view();
    }
    return it->second->get_status();
}

endpoint_state_ptr gossiper::get_endpoint_state_ptr(inet_address ep) const noexcept {
    auto it = _endpoint_state_map.find(ep);
    if (it == _endpoint_state_map.end()) {
        return nullptr;
    } else {
        return it->second;
    }
}

void gossiper::for_each_endpoint_state_until(noncopyable_function<stop_iteration(const inet_address&, const endpoint_state&)> func) const {
    for (const auto& [node, eps] : _endpoint_state_map) {
        if (func(node, *eps) == stop_iteration::yes) {
            return;
        }
    }
}

future<> gossiper::apply_state(inet_address endpoint, application_state_map states) {
    if (endpoint == _broadcast_address) {
        logger.debug("Ignoring remote states for the local endpoint {}", endpoint);
        co_return;
    }
    auto lock = co_await lock_endpoint_update_semaphore();

    auto eps_old = get_endpoint_state_ptr(endpoint);
    if (!eps_old) {
        auto eps = endpoint_state(states);
        logger.debug("Node {} is now part of the cluster, status = {}", endpoint, get_gossip_status(eps));
        replicate(endpoint, eps);
        co_await do_notify(endpoint_events::join{endpoint, get_endpoint_state_ptr(endpoint)});
        co_await do_notify(endpoint_events::change{endpoint, std::move(states)});
        co_return;
    }

    auto local_state = *eps_old;
    application_state_map changed;
    for (auto& [key, value] : states) {
        auto* current = local_state.get_application_state_ptr(key);
        if (current && current->value() == value.value()) {
            continue;
        }
        local_state.add_application_state(key, value);
        changed.emplace(key, value);
    }
    if (changed.empty()) {
        co_return;
    }
    logger.trace("Updating endpoint state for {}: {}", endpoint, local_state);
    replicate(endpoint, std::move(local_state));
    co_await do_notify(endpoint_events::change{endpoint, std::move(changed)});
}

future<> gossiper::mark_alive(inet_address endpoint) {
    if (endpoint == _broadcast_address) {
        co_return;
    }
    auto lock = co_await lock_endpoint_update_semaphore();

    auto es = get_endpoint_state_ptr(endpoint);
    if (!es) {
        logger.info("Node {} is not in endpoint_state_map anymore", endpoint);
        co_return;
    }

    // Do not mark a node with status shutdown as UP.
    auto status = sstring(get_gossip_status(*es));
    if (status == sstring(versioned_value::SHUTDOWN)) {
        logger.warn("Skip marking node {} with status = {} as UP", endpoint, status);
        co_return;
    }

    auto [it, inserted] = _live_endpoints.insert(endpoint);
    if (!inserted) {
        co_return;
    }
    replicate(endpoint, *es);

    logger.info("InetAddress {} is now UP, status = {}", endpoint, status);
    co_await do_notify(endpoint_events::alive{endpoint, get_endpoint_state_ptr(endpoint)});
}

future<> gossiper::mark_dead(inet_address endpoint) {
    auto lock = co_await lock_endpoint_update_semaphore();

    auto state = get_endpoint_state_ptr(endpoint);
    if (!state || !_live_endpoints.erase(endpoint)) {
        logger.trace("{} is not live, nothing to mark down", endpoint);
        co_return;
    }
    logger.info("InetAddress {} is now DOWN, status = {}", endpoint, get_gossip_status(*state));
    co_await do_notify(endpoint_events::dead{endpoint, std::move(state)});
}

future<> gossiper::restart(inet_address endpoint, application_state_map states) {
    if (endpoint == _broadcast_address) {
        co_return;
    }
    auto lock = co_await lock_endpoint_update_semaphore();

    auto eps_old = get_endpoint_state_ptr(endpoint);
    auto eps = endpoint_state(states);
    if (!eps_old) {
        logger.debug("Node {} is now part of the cluster, status = {}", endpoint, get_gossip_status(eps));
        replicate(endpoint, std::move(eps));
        co_await do_notify(endpoint_events::join{endpoint, get_endpoint_state_ptr(endpoint)});
        co_return;
    }

    logger.info("Node {} has restarted, status = {}", endpoint, get_gossip_status(eps));
    _live_endpoints.erase(endpoint);
    replicate(endpoint, std::move(eps));
    // the node restarted: it is up to the subscriber to take whatever action is necessary
    co_await do_notify(endpoint_events::restart{endpoint, std::move(eps_old)});
}

future<> gossiper::remove_endpoint(inet_address endpoint) {
    auto lock = co_await lock_endpoint_update_semaphore();

    // do subscribers first so anything in the subscriber that depends on gossiper state won't get confused
    try {
        co_await do_notify(endpoint_events::remove{endpoint});
    } catch (...) {
        logger.warn("Fail to call on_remove callback: {}", std::current_exception());
    }

    auto state = get_endpoint_state_ptr(endpoint);
    if (!state) {
        logger.warn("There is no state for the removed IP {}", endpoint);
        co_return;
    }

    bool was_alive = _live_endpoints.erase(endpoint);
    _endpoint_state_map.erase(endpoint);
    logger.info("Removed endpoint {}", endpoint);

    if (was_alive) {
        try {
            logger.info("InetAddress {} is now DOWN, status = {}", endpoint, get_gossip_status(*state));
            co_await do_notify(endpoint_events::dead{endpoint, std::move(state)});
        } catch (...) {
            logger.warn("Fail to call on_dead callback: {}", std::current_exception());
        }
    }
}

future<> gossiper::add_local_application_state(application_state state, versioned_value value) {
    application_state_map tmp;
    tmp.emplace(std::pair(std::move(state), std::move(value)));
    return add_local_application_state(std::move(tmp));
}

future<> gossiper::add_local_application_state(application_state_map states) {
    if (states.empty()) {
        co_return;
    }
    try {
        auto lock = co_await lock_endpoint_update_semaphore();
        auto ep_state_before = get_endpoint_state_ptr(_broadcast_address);
        if (!ep_state_before) {
            auto err = fmt::format("endpoint_state_map does not contain endpoint = {}, application_states = {}",
                              _broadcast_address, states);
            throw std::runtime_error(err);
        }

        auto local_state = *ep_state_before;
        for (auto& p : states) {
            auto& state = p.first;
            auto& value = p.second;
            // Notifications may have taken some time, so preventively raise the version
            // of the new value, otherwise it could be ignored by the remote node
            // if another value with a newer version was received in the meantime:
            value = versioned_value::clone_with_higher_version(value);
            local_state.add_application_state(state, value);
        }
        replicate(_broadcast_address, std::move(local_state));

        co_await do_notify(endpoint_events::change{_broadcast_address, std::move(states)});
    } catch (...) {
        logger.warn("Fail to apply application_state: {}", std::current_exception());
    }
}

future<> gossiper::start(application_state_map preload_local_states) {
    if (_enabled) {
        co_return;
    }
    auto lock = co_await lock_endpoint_update_semaphore();
    auto local_state = endpoint_state(preload_local_states);
    if (auto eps = get_endpoint_state_ptr(_broadcast_address)) {
        local_state = *eps;
        for (auto& [key, value] : preload_local_states) {
            local_state.add_application_state(key, value);
        }
    }
    replicate(_broadcast_address, std::move(local_state));
    _enabled = true;
    logger.info("Gossip started for {} in cluster {}", _broadcast_address, _gcfg.cluster_name);
}

future<> gossiper::shutdown() {
    if (!_enabled) {
        logger.info("gossip is already stopped");
        co_return;
    }
    co_await add_local_application_state(application_state::STATUS,
            versioned_value(versioned_value::version_string({sstring(versioned_value::SHUTDOWN), "true"})));
    logger.info("Announced shutdown of {}", _broadcast_address);
}

future<> gossiper::stop() {
    auto lock = co_await lock_endpoint_update_semaphore();
    _enabled = false;
    logger.info("Gossip is now stopped");
}

} // namespace gms
