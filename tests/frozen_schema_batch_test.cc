/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#define BOOST_TEST_MODULE core

#include <boost/test/unit_test.hpp>

#include "db/frozen_schema_batch.hh"
#include "marshal_exception.hh"

using namespace db;

static schema_mutation make_mutation(schema_object_kind kind, sstring ks, sstring name, schema_change_kind change,
        api::timestamp_type ts, schema_fields payload = {}) {
    return schema_mutation{schema_object_key{kind, std::move(ks), std::move(name)}, change, ts, std::move(payload)};
}

static schema_mutation_batch make_batch() {
    return {
        make_mutation(schema_object_kind::keyspace, "ks", "", schema_change_kind::create, 10,
                {{"strategy_class", "SimpleStrategy"}, {"strategy_options.replication_factor", "3"}, {"durable_writes", "true"}}),
        make_mutation(schema_object_kind::table, "ks", "cf", schema_change_kind::create, 11,
                {{"column.pk", "partition_key:0:int"}, {"column.v", "regular:0:text"}}),
        make_mutation(schema_object_kind::table, "ks", "cf", schema_change_kind::update, 12,
                {{"column.v", std::nullopt}, {"column.w", "regular:0:blob"}}),
        make_mutation(schema_object_kind::type, "ks", "address", schema_change_kind::drop, 13),
    };
}

// Little endian, as the batch codec writes it.
static sstring encode_int32(int32_t v) {
    sstring s(4, '\0');
    auto u = uint32_t(v);
    for (int i = 0; i < 4; ++i) {
        s[i] = char((u >> (8 * i)) & 0xff);
    }
    return s;
}

BOOST_AUTO_TEST_CASE(test_round_trip_preserves_records_and_order) {
    auto batch = make_batch();
    auto fb = freeze(batch);
    auto decoded = unfreeze(fb);
    BOOST_REQUIRE_EQUAL(decoded.size(), batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        BOOST_REQUIRE(decoded[i] == batch[i]);
    }
    // A deleted field survives as a deletion.
    BOOST_REQUIRE(decoded[2].payload.at("column.v") == std::nullopt);
}

BOOST_AUTO_TEST_CASE(test_empty_batch) {
    auto fb = freeze({});
    BOOST_REQUIRE_EQUAL(fb.size(), 4u);
    BOOST_REQUIRE(fb.representation() == encode_int32(0));
    BOOST_REQUIRE(unfreeze(fb).empty());
}

BOOST_AUTO_TEST_CASE(test_serialized_size_matches_encoding) {
    auto batch = make_batch();
    BOOST_REQUIRE_EQUAL(serialized_size(batch), freeze(batch).size());
    size_t sum = 4;
    for (auto& m : batch) {
        sum += serialized_size(m);
    }
    BOOST_REQUIRE_EQUAL(sum, serialized_size(batch));
}

BOOST_AUTO_TEST_CASE(test_negative_count_is_rejected) {
    BOOST_REQUIRE_THROW(unfreeze(frozen_schema_batch(encode_int32(-1))), corrupt_stream_exception);
    BOOST_REQUIRE_THROW(unfreeze(frozen_schema_batch(encode_int32(std::numeric_limits<int32_t>::min()))), corrupt_stream_exception);
}

BOOST_AUTO_TEST_CASE(test_count_above_limit_is_rejected) {
    auto batch = make_batch();
    auto fb = freeze(batch);
    BOOST_REQUIRE_THROW(unfreeze(fb, batch.size() - 1), corrupt_stream_exception);
    BOOST_REQUIRE_EQUAL(unfreeze(fb, batch.size()).size(), batch.size());
}

BOOST_AUTO_TEST_CASE(test_count_larger_than_input_is_rejected) {
    // Claims two billion records in a few bytes.
    BOOST_REQUIRE_THROW(unfreeze(frozen_schema_batch(encode_int32(std::numeric_limits<int32_t>::max()))), corrupt_stream_exception);
    BOOST_REQUIRE_THROW(unfreeze(frozen_schema_batch(encode_int32(1))), corrupt_stream_exception);
}

BOOST_AUTO_TEST_CASE(test_truncated_input_is_rejected) {
    BOOST_REQUIRE_THROW(unfreeze(frozen_schema_batch(sstring("\x01\x00", 2))), corrupt_stream_exception);

    auto bytes = freeze(make_batch()).representation();
    for (size_t len : {size_t(5), size_t(9), bytes.size() / 2, bytes.size() - 1}) {
        BOOST_TEST_MESSAGE(fmt::format("truncated to {} bytes", len));
        BOOST_REQUIRE_THROW(unfreeze(frozen_schema_batch(bytes.substr(0, len))), corrupt_stream_exception);
    }
}

BOOST_AUTO_TEST_CASE(test_trailing_bytes_are_rejected) {
    auto bytes = freeze(make_batch()).representation();
    BOOST_REQUIRE_THROW(unfreeze(frozen_schema_batch(bytes + sstring("x"))), corrupt_stream_exception);
}

BOOST_AUTO_TEST_CASE(test_unknown_object_kind_is_rejected) {
    auto bytes = freeze({make_mutation(schema_object_kind::keyspace, "ks", "", schema_change_kind::drop, 1)}).representation();
    // Count, then the record length, then the object kind.
    bytes[8] = char(42);
    BOOST_REQUIRE_THROW(unfreeze(frozen_schema_batch(bytes)), corrupt_stream_exception);
}
