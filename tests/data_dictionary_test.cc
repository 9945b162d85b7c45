/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#define BOOST_TEST_MODULE core

#include <boost/test/unit_test.hpp>

#include "data_dictionary/keyspace_metadata.hh"
#include "data_dictionary/table_metadata.hh"
#include "data_dictionary/user_type_metadata.hh"
#include "exceptions/exceptions.hh"
#include "marshal_exception.hh"

using namespace data_dictionary;

static table_metadata make_table(std::vector<column_definition> columns) {
    return table_metadata("ks", "cf", std::move(columns));
}

static std::vector<column_definition> base_columns() {
    return {
        {"pk", "int", column_kind::partition_key},
        {"ck", "timestamp", column_kind::clustering_key},
        {"v", "text", column_kind::regular_column},
    };
}

BOOST_AUTO_TEST_CASE(test_names) {
    BOOST_REQUIRE(is_valid_name("ks_1"));
    BOOST_REQUIRE(is_valid_name(sstring(max_name_length, 'a')));
    BOOST_REQUIRE(!is_valid_name(""));
    BOOST_REQUIRE(!is_valid_name(sstring(max_name_length + 1, 'a')));
    BOOST_REQUIRE(!is_valid_name("ks-1"));
    BOOST_REQUIRE(!is_valid_name("ks.cf"));
}

BOOST_AUTO_TEST_CASE(test_keyspace_validation) {
    keyspace_metadata("ks", "SimpleStrategy", {{"replication_factor", "3"}}).validate();
    BOOST_REQUIRE_THROW(keyspace_metadata("bad name", "SimpleStrategy", {}).validate(), exceptions::invalid_request_exception);
    BOOST_REQUIRE_THROW(keyspace_metadata("ks", "", {}).validate(), exceptions::configuration_exception);
}

BOOST_AUTO_TEST_CASE(test_keyspace_fields) {
    keyspace_metadata ksm("ks", "NetworkTopologyStrategy", {{"dc1", "3"}, {"dc2", "1"}}, false);
    auto fields = ksm.to_fields();
    BOOST_REQUIRE_EQUAL(fields.at("strategy_class"), "NetworkTopologyStrategy");
    BOOST_REQUIRE_EQUAL(fields.at("strategy_options.dc1"), "3");
    BOOST_REQUIRE_EQUAL(fields.at("durable_writes"), "false");
    BOOST_REQUIRE(keyspace_metadata::from_fields("ks", fields) == ksm);

    fields["durable_writes"] = "maybe";
    BOOST_REQUIRE_THROW(keyspace_metadata::from_fields("ks", fields), marshal_exception);
    BOOST_REQUIRE_THROW(keyspace_metadata::from_fields("ks", {{"bogus", "1"}}), marshal_exception);
}

BOOST_AUTO_TEST_CASE(test_table_validation) {
    make_table(base_columns()).validate();

    BOOST_REQUIRE_THROW(make_table({{"v", "text", column_kind::regular_column}}).validate(), exceptions::invalid_request_exception);
    BOOST_REQUIRE_THROW(make_table({
        {"pk", "int", column_kind::partition_key},
        {"pk", "text", column_kind::regular_column},
    }).validate(), exceptions::invalid_request_exception);
    BOOST_REQUIRE_THROW(make_table({
        {"pk", "int", column_kind::partition_key},
        {"s", "int", column_kind::static_column},
    }).validate(), exceptions::invalid_request_exception);
    BOOST_REQUIRE_THROW(make_table({
        {"pk", "", column_kind::partition_key},
    }).validate(), exceptions::invalid_request_exception);
    BOOST_REQUIRE_THROW(table_metadata("ks", "", base_columns()).validate(), exceptions::invalid_request_exception);
}

BOOST_AUTO_TEST_CASE(test_table_fields_keep_column_order) {
    table_metadata t("ks", "cf", {
        {"v2", "int", column_kind::regular_column},
        {"pk_b", "int", column_kind::partition_key},
        {"v1", "text", column_kind::regular_column},
        {"pk_a", "int", column_kind::partition_key},
    }, {{"comment", "hello"}});
    auto fields = t.to_fields();
    BOOST_REQUIRE_EQUAL(fields.at("column.pk_b"), "partition_key:0:int");
    BOOST_REQUIRE_EQUAL(fields.at("column.pk_a"), "partition_key:1:int");
    BOOST_REQUIRE_EQUAL(fields.at("column.v2"), "regular:0:int");
    BOOST_REQUIRE_EQUAL(fields.at("option.comment"), "hello");

    auto back = table_metadata::from_fields("ks", "cf", fields);
    BOOST_REQUIRE(back == t);
    auto pk = back.columns(column_kind::partition_key);
    BOOST_REQUIRE_EQUAL(pk.size(), 2u);
    BOOST_REQUIRE_EQUAL(pk[0].name, "pk_b");
    BOOST_REQUIRE_EQUAL(pk[1].name, "pk_a");

    BOOST_REQUIRE_THROW(table_metadata::from_fields("ks", "cf", {{"column.x", "regular"}}), marshal_exception);
    BOOST_REQUIRE_THROW(table_metadata::from_fields("ks", "cf", {{"column.x", "weird:0:int"}}), marshal_exception);
    BOOST_REQUIRE_THROW(table_metadata::from_fields("ks", "cf", {{"column.x", "regular:z:int"}}), marshal_exception);
}

BOOST_AUTO_TEST_CASE(test_table_compatible_updates) {
    auto old = make_table(base_columns());

    auto added = base_columns();
    added.push_back({"w", "blob", column_kind::regular_column});
    added.push_back({"s", "int", column_kind::static_column});
    make_table(added).validate_update_of(old);

    auto dropped = base_columns();
    dropped.pop_back();
    make_table(dropped).validate_update_of(old);

    make_table(base_columns()).validate_update_of(old);
}

BOOST_AUTO_TEST_CASE(test_table_incompatible_updates) {
    auto old = make_table(base_columns());

    auto retyped = base_columns();
    retyped[2].type = "int";
    BOOST_REQUIRE_THROW(make_table(retyped).validate_update_of(old), exceptions::invalid_change_exception);

    auto rekeyed = base_columns();
    rekeyed[1].type = "int";
    BOOST_REQUIRE_THROW(make_table(rekeyed).validate_update_of(old), exceptions::invalid_change_exception);

    auto new_key = base_columns();
    new_key.push_back({"ck2", "int", column_kind::clustering_key});
    BOOST_REQUIRE_THROW(make_table(new_key).validate_update_of(old), exceptions::invalid_change_exception);

    auto moved = base_columns();
    moved[2].kind = column_kind::static_column;
    BOOST_REQUIRE_THROW(make_table(moved).validate_update_of(old), exceptions::invalid_change_exception);
}

BOOST_AUTO_TEST_CASE(test_user_type_validation) {
    user_type_metadata("ks", "address", {{"street", "text"}, {"zip", "int"}}).validate();
    BOOST_REQUIRE_THROW(user_type_metadata("ks", "empty", {}).validate(), exceptions::invalid_request_exception);
    BOOST_REQUIRE_THROW(user_type_metadata("ks", "dup", {{"a", "int"}, {"a", "text"}}).validate(), exceptions::invalid_request_exception);
    BOOST_REQUIRE_THROW(user_type_metadata("ks", "t", {{"a", ""}}).validate(), exceptions::invalid_request_exception);
}

BOOST_AUTO_TEST_CASE(test_user_type_fields) {
    user_type_metadata t("ks", "address", {{"zip", "int"}, {"street", "text"}});
    auto back = user_type_metadata::from_fields("ks", "address", t.to_fields());
    BOOST_REQUIRE(back == t);
    BOOST_REQUIRE_EQUAL(back.fields()[0].first, "zip");
    BOOST_REQUIRE_THROW(user_type_metadata::from_fields("ks", "address", {{"zip", "0:int"}}), marshal_exception);
}

BOOST_AUTO_TEST_CASE(test_user_type_updates) {
    user_type_metadata old("ks", "address", {{"street", "text"}, {"zip", "int"}});

    user_type_metadata("ks", "address", {{"street", "text"}, {"zip", "int"}, {"city", "text"}}).validate_update_of(old);

    BOOST_REQUIRE_THROW(user_type_metadata("ks", "address", {{"street", "text"}}).validate_update_of(old),
            exceptions::invalid_change_exception);
    BOOST_REQUIRE_THROW(user_type_metadata("ks", "address", {{"zip", "int"}, {"street", "text"}}).validate_update_of(old),
            exceptions::invalid_change_exception);
    BOOST_REQUIRE_THROW(user_type_metadata("ks", "address", {{"street", "text"}, {"zip", "bigint"}}).validate_update_of(old),
            exceptions::invalid_change_exception);
}
