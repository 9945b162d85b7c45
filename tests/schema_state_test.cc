/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#define BOOST_TEST_MODULE core

#include <algorithm>

#include <boost/test/unit_test.hpp>

#include "db/schema_state.hh"
#include "db/schema_tables.hh"

using namespace db;
using namespace data_dictionary;

static keyspace_metadata make_keyspace(sstring name, sstring rf = "3") {
    return keyspace_metadata(name, "SimpleStrategy", {{"replication_factor", rf}});
}

static table_metadata make_table(sstring ks, sstring cf, sstring value_type = "text") {
    return table_metadata(ks, cf, {
        {"pk", "int", column_kind::partition_key},
        {"v", value_type, column_kind::regular_column},
    });
}

static schema_state apply_all(const schema_mutation_batch& batch) {
    schema_state s;
    s.apply(batch);
    return s;
}

BOOST_AUTO_TEST_CASE(test_apply_is_idempotent) {
    schema_mutation_batch batch{
        schema_tables::make_create_keyspace_mutation(make_keyspace("ks"), 1),
        schema_tables::make_create_table_mutation(make_table("ks", "cf"), 2),
    };
    auto once = apply_all(batch);
    auto twice = once;
    twice.apply(batch);
    twice.apply(batch[1]);
    BOOST_REQUIRE(once == twice);
    BOOST_REQUIRE(schema_tables::calculate_schema_digest(once) == schema_tables::calculate_schema_digest(twice));
}

BOOST_AUTO_TEST_CASE(test_apply_is_commutative) {
    auto ks = make_keyspace("ks");
    auto t1 = make_table("ks", "cf");
    auto t2 = make_table("ks", "cf", "blob");
    schema_mutation_batch batch{
        schema_tables::make_create_keyspace_mutation(ks, 1),
        schema_tables::make_create_table_mutation(t1, 2),
        schema_tables::make_update_table_mutation(t1, t2, 3),
        schema_tables::make_update_keyspace_mutation(ks, make_keyspace("ks", "1"), 4),
    };
    auto expected = apply_all(batch);
    BOOST_REQUIRE_EQUAL(expected.find(schema_tables::table_key("ks", "cf"))->at("column.v"), "regular:0:blob");

    std::vector<size_t> order{0, 1, 2, 3};
    while (std::next_permutation(order.begin(), order.end())) {
        schema_state s;
        for (auto i : order) {
            s.apply(batch[i]);
        }
        BOOST_REQUIRE(s == expected);
    }
}

BOOST_AUTO_TEST_CASE(test_concurrent_writes_to_the_same_field) {
    auto a = schema_mutation{schema_tables::table_key("ks", "cf"), schema_change_kind::update, 5, {{"option.comment", "a"}}};
    auto b = schema_mutation{schema_tables::table_key("ks", "cf"), schema_change_kind::update, 5, {{"option.comment", "b"}}};
    auto del = schema_mutation{schema_tables::table_key("ks", "cf"), schema_change_kind::update, 5, {{"option.comment", std::nullopt}}};
    BOOST_REQUIRE(apply_all({a, b}) == apply_all({b, a}));
    BOOST_REQUIRE(apply_all({a, del}) == apply_all({del, a}));
    BOOST_REQUIRE(apply_all({a, b, del}) == apply_all({del, b, a}));
}

BOOST_AUTO_TEST_CASE(test_keyspace_drop_shadows_its_contents) {
    auto state = apply_all({
        schema_tables::make_create_keyspace_mutation(make_keyspace("ks"), 1),
        schema_tables::make_create_table_mutation(make_table("ks", "cf"), 2),
        schema_tables::make_create_type_mutation(user_type_metadata("ks", "t", {{"a", "int"}}), 2),
        schema_tables::make_create_keyspace_mutation(make_keyspace("other"), 2),
        schema_tables::make_create_table_mutation(make_table("other", "cf"), 2),
        schema_tables::make_drop_keyspace_mutation("ks", 3),
    });
    BOOST_REQUIRE(!state.contains(schema_tables::keyspace_key("ks")));
    BOOST_REQUIRE(!state.contains(schema_tables::table_key("ks", "cf")));
    BOOST_REQUIRE(!state.contains(schema_tables::type_key("ks", "t")));
    BOOST_REQUIRE(state.contains(schema_tables::table_key("other", "cf")));

    // A table created after the drop, e.g. by a node which did not see it yet, survives.
    state.apply(schema_tables::make_create_keyspace_mutation(make_keyspace("ks"), 4));
    state.apply(schema_tables::make_create_table_mutation(make_table("ks", "cf2"), 4));
    BOOST_REQUIRE(state.contains(schema_tables::table_key("ks", "cf2")));
    BOOST_REQUIRE(!state.contains(schema_tables::table_key("ks", "cf")));
}

BOOST_AUTO_TEST_CASE(test_recreate_does_not_resurrect_old_fields) {
    auto key = schema_tables::table_key("ks", "cf");
    auto state = apply_all({
        schema_mutation{key, schema_change_kind::create, 1, {{"column.pk", "partition_key:0:int"}, {"option.comment", "old"}}},
        schema_tables::make_drop_table_mutation("ks", "cf", 2),
        schema_mutation{key, schema_change_kind::create, 3, {{"column.pk", "partition_key:0:int"}}},
    });
    auto fields = state.find(key);
    BOOST_REQUIRE(fields);
    BOOST_REQUIRE(!fields->contains("option.comment"));
    BOOST_REQUIRE_EQUAL(fields->size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_to_mutations_reproduces_state) {
    auto ks = make_keyspace("ks");
    auto t1 = make_table("ks", "cf");
    auto state = apply_all({
        schema_tables::make_create_keyspace_mutation(ks, 1),
        schema_tables::make_create_table_mutation(t1, 2),
        schema_tables::make_update_table_mutation(t1, make_table("ks", "cf", "blob"), 3),
        schema_tables::make_create_table_mutation(make_table("ks", "gone"), 2),
        schema_tables::make_drop_table_mutation("ks", "gone", 5),
    });
    auto copy = apply_all(state.to_mutations());
    BOOST_REQUIRE(copy == state);
}

BOOST_AUTO_TEST_CASE(test_digest_depends_on_live_definitions_only) {
    auto ks = make_keyspace("ks");
    auto t = make_table("ks", "cf");

    BOOST_REQUIRE(schema_tables::calculate_schema_digest(schema_state{}) == schema_tables::empty_version());

    auto a = apply_all({
        schema_tables::make_create_keyspace_mutation(ks, 1),
        schema_tables::make_create_table_mutation(t, 2),
    });
    // Same definitions reached through another history, at other timestamps.
    auto b = apply_all({
        schema_tables::make_create_keyspace_mutation(ks, 10),
        schema_tables::make_create_table_mutation(make_table("ks", "cf", "blob"), 11),
        schema_tables::make_create_table_mutation(make_table("ks", "tmp"), 11),
        schema_tables::make_update_table_mutation(make_table("ks", "cf", "blob"), t, 12),
        schema_tables::make_drop_table_mutation("ks", "tmp", 13),
    });
    BOOST_REQUIRE(!(a == b));
    BOOST_REQUIRE(schema_tables::calculate_schema_digest(a) == schema_tables::calculate_schema_digest(b));

    auto c = apply_all({
        schema_tables::make_create_keyspace_mutation(ks, 1),
        schema_tables::make_create_table_mutation(make_table("ks", "cf", "blob"), 2),
    });
    BOOST_REQUIRE(schema_tables::calculate_schema_digest(a) != schema_tables::calculate_schema_digest(c));
    BOOST_REQUIRE(schema_tables::calculate_schema_digest(a) != schema_tables::empty_version());

    auto dropped = a;
    dropped.apply(schema_tables::make_drop_keyspace_mutation("ks", 3));
    BOOST_REQUIRE(schema_tables::calculate_schema_digest(dropped) == schema_tables::empty_version());
}

BOOST_AUTO_TEST_CASE(test_diff_schema) {
    auto ks = make_keyspace("ks");
    auto before = apply_all({
        schema_tables::make_create_keyspace_mutation(ks, 1),
        schema_tables::make_create_table_mutation(make_table("ks", "kept"), 1),
        schema_tables::make_create_table_mutation(make_table("ks", "altered"), 1),
        schema_tables::make_create_table_mutation(make_table("ks", "dropped"), 1),
    });
    auto after = before;
    after.apply(schema_mutation_batch{
        schema_tables::make_update_table_mutation(make_table("ks", "altered"), make_table("ks", "altered", "blob"), 2),
        schema_tables::make_drop_table_mutation("ks", "dropped", 2),
        schema_tables::make_create_type_mutation(user_type_metadata("ks", "t", {{"a", "int"}}), 2),
    });

    auto diff = schema_tables::diff_schema(before.live_objects(), after.live_objects());
    BOOST_REQUIRE(diff.keyspaces.empty());
    BOOST_REQUIRE(diff.tables.created.empty());
    BOOST_REQUIRE(diff.tables.altered == std::vector<schema_object_key>{schema_tables::table_key("ks", "altered")});
    BOOST_REQUIRE(diff.tables.dropped == std::vector<schema_object_key>{schema_tables::table_key("ks", "dropped")});
    BOOST_REQUIRE(diff.types.created == std::vector<schema_object_key>{schema_tables::type_key("ks", "t")});

    BOOST_REQUIRE(schema_tables::diff_schema(after.live_objects(), after.live_objects()).empty());
}
