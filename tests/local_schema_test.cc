/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <boost/test/unit_test.hpp>

#include <seastar/testing/thread_test_case.hh>

#include "db/local_schema.hh"
#include "tests/lib/memory_schema_storage.hh"
#include "tests/lib/tmpdir.hh"

using namespace db;
using namespace data_dictionary;

static keyspace_metadata make_keyspace(sstring name) {
    return keyspace_metadata(name, "SimpleStrategy", {{"replication_factor", "1"}});
}

static table_metadata make_table(sstring ks, sstring cf) {
    return table_metadata(ks, cf, {
        {"pk", "int", column_kind::partition_key},
        {"v", "text", column_kind::regular_column},
    });
}

static schema_mutation_batch make_schema(api::timestamp_type ts) {
    return {
        schema_tables::make_create_keyspace_mutation(make_keyspace("ks"), ts),
        schema_tables::make_create_table_mutation(make_table("ks", "cf"), ts),
        schema_tables::make_create_type_mutation(user_type_metadata("ks", "t", {{"a", "int"}}), ts),
    };
}

SEASTAR_THREAD_TEST_CASE(test_starts_at_empty_version) {
    tests::memory_schema_storage storage;
    local_schema schema(storage);
    BOOST_REQUIRE(schema.has_empty_version());
    schema.load().get();
    BOOST_REQUIRE(schema.get_version() == schema_tables::empty_version());
    BOOST_REQUIRE(schema.keyspace_names().empty());
}

SEASTAR_THREAD_TEST_CASE(test_merge_reports_changes) {
    tests::memory_schema_storage storage;
    local_schema schema(storage);

    auto diff = schema.merge(make_schema(1)).get();
    BOOST_REQUIRE_EQUAL(diff.keyspaces.created.size(), 1u);
    BOOST_REQUIRE_EQUAL(diff.tables.created.size(), 1u);
    BOOST_REQUIRE_EQUAL(diff.types.created.size(), 1u);
    BOOST_REQUIRE(!schema.has_empty_version());
    BOOST_REQUIRE_EQUAL(storage.batches().size(), 1u);

    BOOST_REQUIRE(schema.find_keyspace("ks") == make_keyspace("ks"));
    BOOST_REQUIRE(schema.find_table("ks", "cf") == make_table("ks", "cf"));
    BOOST_REQUIRE(schema.find_type("ks", "t"));
    BOOST_REQUIRE(!schema.find_table("ks", "nope"));
    BOOST_REQUIRE(schema.keyspace_names() == std::vector<sstring>{"ks"});
    BOOST_REQUIRE(schema.table_names("ks") == std::vector<sstring>{"cf"});
    BOOST_REQUIRE(schema.type_names("ks") == std::vector<sstring>{"t"});
    BOOST_REQUIRE(schema.table_names("other").empty());

    diff = schema.merge({schema_tables::make_drop_keyspace_mutation("ks", 2)}).get();
    BOOST_REQUIRE_EQUAL(diff.keyspaces.dropped.size(), 1u);
    BOOST_REQUIRE_EQUAL(diff.tables.dropped.size(), 1u);
    BOOST_REQUIRE_EQUAL(diff.types.dropped.size(), 1u);
    BOOST_REQUIRE(schema.has_empty_version());
}

SEASTAR_THREAD_TEST_CASE(test_dropping_everything_returns_to_empty_version) {
    tests::memory_schema_storage storage;
    local_schema schema(storage);
    BOOST_REQUIRE(schema.state().newest_timestamp() == api::missing_timestamp);

    schema.merge(make_schema(1)).get();
    schema.merge({schema_tables::make_drop_keyspace_mutation("ks", 5)}).get();
    BOOST_REQUIRE(schema.has_empty_version());
    BOOST_REQUIRE_EQUAL(schema.state().newest_timestamp(), 5);

    // Older definitions, as a lagging peer would send them, stay dropped.
    auto diff = schema.merge(make_schema(3)).get();
    BOOST_REQUIRE(diff.keyspaces.created.empty());
    BOOST_REQUIRE(schema.has_empty_version());
    BOOST_REQUIRE(schema.keyspace_names().empty());

    schema.merge({schema_tables::make_create_keyspace_mutation(make_keyspace("ks"), 6)}).get();
    BOOST_REQUIRE(!schema.has_empty_version());
    BOOST_REQUIRE_EQUAL(schema.state().newest_timestamp(), 6);
}

SEASTAR_THREAD_TEST_CASE(test_reapplied_batch_is_not_persisted) {
    tests::memory_schema_storage storage;
    local_schema schema(storage);
    schema.merge(make_schema(1)).get();
    auto version = schema.get_version();

    auto diff = schema.merge(make_schema(1)).get();
    BOOST_REQUIRE(diff.empty());
    BOOST_REQUIRE(schema.get_version() == version);
    BOOST_REQUIRE_EQUAL(storage.batches().size(), 1u);
}

SEASTAR_THREAD_TEST_CASE(test_failed_persist_changes_nothing) {
    tests::memory_schema_storage storage;
    local_schema schema(storage);
    schema.merge(make_schema(1)).get();
    auto version = schema.get_version();
    auto state = schema.state();

    storage.fail_appends();
    BOOST_REQUIRE_THROW(schema.merge({schema_tables::make_drop_table_mutation("ks", "cf", 2)}).get(), std::system_error);
    BOOST_REQUIRE(schema.get_version() == version);
    BOOST_REQUIRE(schema.state() == state);
    BOOST_REQUIRE(schema.find_table("ks", "cf"));
}

SEASTAR_THREAD_TEST_CASE(test_export_reproduces_version) {
    tests::memory_schema_storage s1, s2;
    local_schema a(s1);
    local_schema b(s2);
    a.merge(make_schema(1)).get();
    a.merge({schema_tables::make_drop_table_mutation("ks", "cf", 2)}).get();

    b.merge(unfreeze(a.export_schema())).get();
    BOOST_REQUIRE(b.get_version() == a.get_version());
    BOOST_REQUIRE(b.state() == a.state());
}

SEASTAR_THREAD_TEST_CASE(test_truncate_and_clear) {
    tests::memory_schema_storage storage;
    local_schema schema(storage);
    schema.merge(make_schema(1)).get();

    schema.truncate().get();
    BOOST_REQUIRE(storage.batches().empty());
    // Truncating the durable copy leaves the definitions in place.
    BOOST_REQUIRE(schema.has_keyspace("ks"));

    schema.clear();
    BOOST_REQUIRE(schema.has_empty_version());
    BOOST_REQUIRE(!schema.has_keyspace("ks"));
}

SEASTAR_THREAD_TEST_CASE(test_load_restores_persisted_schema) {
    tmpdir tmp;
    table_schema_version version;
    {
        file_schema_storage storage(tmp.path());
        local_schema schema(storage);
        schema.load().get();
        schema.merge(make_schema(1)).get();
        schema.merge({schema_tables::make_create_table_mutation(make_table("ks", "cf2"), 2)}).get();
        version = schema.get_version();
    }
    file_schema_storage storage(tmp.path());
    local_schema schema(storage);
    schema.load().get();
    BOOST_REQUIRE(schema.get_version() == version);
    BOOST_REQUIRE(schema.find_table("ks", "cf2"));
}
