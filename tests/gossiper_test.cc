/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <boost/test/unit_test.hpp>

#include <seastar/testing/thread_test_case.hh>
#include <seastar/util/defer.hh>

#include "gms/gossiper.hh"
#include "gms/i_endpoint_state_change_subscriber.hh"
#include "gms/versioned_value.hh"
#include "utils/UUID_gen.hh"

using namespace gms;

namespace {

// Records the events it is notified of as "kind(endpoint)".
class recording_subscriber : public i_endpoint_state_change_subscriber {
public:
    std::vector<sstring> events;
    std::vector<application_state_map> changes;

    virtual future<> on_endpoint_event(const endpoint_event& event) override {
        events.push_back(fmt::format("{}", event));
        if (auto* ev = std::get_if<endpoint_events::change>(&event)) {
            changes.push_back(ev->states);
        }
        return make_ready_future<>();
    }
};

}

static const inet_address self("127.0.0.1");
static const inet_address peer("127.0.0.2");

static application_state_map peer_states(const table_schema_version& version) {
    return {
        {application_state::STATUS, versioned_value::normal("42")},
        {application_state::TOKENS, versioned_value::tokens("42")},
        {application_state::NET_VERSION, versioned_value::network_version(1)},
        {application_state::SCHEMA, versioned_value::schema(version)},
    };
}

SEASTAR_THREAD_TEST_CASE(test_new_endpoint_joins_then_changes) {
    gossiper g(self, gossip_config{"test"});
    g.start({{application_state::STATUS, versioned_value::normal("1")}}).get();
    auto sub = make_shared<recording_subscriber>();
    g.register_(sub);
    auto unregister = defer([&] () noexcept { g.unregister_(sub).get(); });

    auto v1 = utils::UUID_gen::get_name_UUID("v1");
    g.apply_state(peer, peer_states(v1)).get();
    BOOST_REQUIRE(sub->events == std::vector<sstring>({"join(127.0.0.2)", "change(127.0.0.2)"}));
    BOOST_REQUIRE_EQUAL(sub->changes.back().size(), 4u);
    BOOST_REQUIRE(g.get_endpoint_state_ptr(peer)->get_schema_version() == v1);
    BOOST_REQUIRE(!g.is_alive(peer));

    // Nothing new, nothing announced.
    g.apply_state(peer, peer_states(v1)).get();
    BOOST_REQUIRE_EQUAL(sub->events.size(), 2u);

    auto v2 = utils::UUID_gen::get_name_UUID("v2");
    g.apply_state(peer, peer_states(v2)).get();
    BOOST_REQUIRE_EQUAL(sub->events.size(), 3u);
    BOOST_REQUIRE_EQUAL(sub->changes.back().size(), 1u);
    BOOST_REQUIRE(sub->changes.back().contains(application_state::SCHEMA));

    // States about the local endpoint come from add_local_application_state only.
    g.apply_state(self, peer_states(v2)).get();
    BOOST_REQUIRE_EQUAL(sub->events.size(), 3u);
}

SEASTAR_THREAD_TEST_CASE(test_liveness) {
    gossiper g(self, gossip_config{"test"});
    g.start({{application_state::STATUS, versioned_value::normal("1")}}).get();
    auto sub = make_shared<recording_subscriber>();
    g.register_(sub);
    auto unregister = defer([&] () noexcept { g.unregister_(sub).get(); });

    BOOST_REQUIRE(g.is_alive(self));
    BOOST_REQUIRE(g.get_live_members() == std::set<inet_address>{self});

    // Unknown endpoints are not marked alive.
    g.mark_alive(peer).get();
    BOOST_REQUIRE(sub->events.empty());

    g.apply_state(peer, peer_states(utils::UUID_gen::get_name_UUID("v1"))).get();
    g.mark_alive(peer).get();
    g.mark_alive(peer).get();
    BOOST_REQUIRE(g.is_alive(peer));
    BOOST_REQUIRE(g.get_live_members() == std::set<inet_address>({self, peer}));

    g.mark_dead(peer).get();
    g.mark_dead(peer).get();
    BOOST_REQUIRE(!g.is_alive(peer));
    BOOST_REQUIRE(sub->events == std::vector<sstring>({"join(127.0.0.2)", "change(127.0.0.2)", "alive(127.0.0.2)", "dead(127.0.0.2)"}));
}

SEASTAR_THREAD_TEST_CASE(test_restart_and_removal) {
    gossiper g(self, gossip_config{"test"});
    g.start().get();
    auto sub = make_shared<recording_subscriber>();
    g.register_(sub);
    auto unregister = defer([&] () noexcept { g.unregister_(sub).get(); });

    g.apply_state(peer, peer_states(utils::UUID_gen::get_name_UUID("v1"))).get();
    g.mark_alive(peer).get();
    sub->events.clear();

    g.restart(peer, peer_states(utils::UUID_gen::get_name_UUID("v2"))).get();
    BOOST_REQUIRE(!g.is_alive(peer));
    BOOST_REQUIRE(g.get_endpoint_state_ptr(peer)->get_schema_version() == utils::UUID_gen::get_name_UUID("v2"));
    g.mark_alive(peer).get();

    g.remove_endpoint(peer).get();
    BOOST_REQUIRE(!g.get_endpoint_state_ptr(peer));
    BOOST_REQUIRE_EQUAL(g.num_endpoints(), 1u);
    BOOST_REQUIRE(sub->events == std::vector<sstring>({"restart(127.0.0.2)", "alive(127.0.0.2)", "remove(127.0.0.2)", "dead(127.0.0.2)"}));
}

SEASTAR_THREAD_TEST_CASE(test_local_states) {
    gossiper g(self, gossip_config{"test"});
    auto sub = make_shared<recording_subscriber>();
    g.register_(sub);
    auto unregister = defer([&] () noexcept { g.unregister_(sub).get(); });

    // Before start there is no local endpoint to update: the failure is
    // logged, not propagated.
    g.add_local_application_state(application_state::RPC_READY, versioned_value::rpc_ready(true)).get();
    BOOST_REQUIRE(sub->events.empty());

    g.start({{application_state::STATUS, versioned_value::normal("1")}}).get();
    BOOST_REQUIRE(g.is_enabled());
    BOOST_REQUIRE(sub->events.empty());

    auto version = utils::UUID_gen::get_name_UUID("local");
    g.add_local_application_state(application_state::SCHEMA, versioned_value::schema(version)).get();
    BOOST_REQUIRE(sub->events == std::vector<sstring>({"change(127.0.0.1)"}));
    BOOST_REQUIRE(g.get_endpoint_state_ptr(self)->get_schema_version() == version);

    g.shutdown().get();
    BOOST_REQUIRE(g.is_dead_state(*g.get_endpoint_state_ptr(self)));
    BOOST_REQUIRE(!g.get_live_members().contains(self));
    g.stop().get();
    BOOST_REQUIRE(!g.is_enabled());
}

SEASTAR_THREAD_TEST_CASE(test_gossip_only_members) {
    gossiper g(self, gossip_config{"test"});
    g.start().get();
    auto version = utils::UUID_gen::get_name_UUID("v1");

    g.apply_state(peer, peer_states(version)).get();
    BOOST_REQUIRE(!g.is_gossip_only_member(peer));

    auto bootstrapping = inet_address("127.0.0.3");
    g.apply_state(bootstrapping, {
        {application_state::STATUS, versioned_value::bootstrapping("7")},
        {application_state::TOKENS, versioned_value::tokens("7")},
    }).get();
    BOOST_REQUIRE(g.is_gossip_only_member(bootstrapping));

    auto no_tokens = inet_address("127.0.0.4");
    g.apply_state(no_tokens, {
        {application_state::STATUS, versioned_value::normal("")},
    }).get();
    BOOST_REQUIRE(g.is_gossip_only_member(no_tokens));

    auto left = inet_address("127.0.0.5");
    g.apply_state(left, {
        {application_state::STATUS, versioned_value::left("9", 0)},
    }).get();
    BOOST_REQUIRE(g.is_dead_state(*g.get_endpoint_state_ptr(left)));
    BOOST_REQUIRE(!g.is_gossip_only_member(left));
}
