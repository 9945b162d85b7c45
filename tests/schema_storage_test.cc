/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <fstream>

#include <boost/test/unit_test.hpp>

#include <seastar/testing/thread_test_case.hh>

#include "db/schema_storage.hh"
#include "tests/lib/tmpdir.hh"

using namespace db;

static frozen_schema_batch make_batch(api::timestamp_type ts) {
    return freeze({schema_mutation{schema_object_key{schema_object_kind::keyspace, "ks", ""}, schema_change_kind::drop, ts, {}}});
}

static std::vector<sstring> representations(const std::vector<frozen_schema_batch>& batches) {
    std::vector<sstring> ret;
    for (auto& fb : batches) {
        ret.push_back(fb.representation());
    }
    return ret;
}

SEASTAR_THREAD_TEST_CASE(test_empty_directory) {
    tmpdir tmp;
    file_schema_storage storage(tmp.path() / "schema");
    BOOST_REQUIRE(storage.load().get().empty());
    BOOST_REQUIRE(fs::is_directory(tmp.path() / "schema"));
}

SEASTAR_THREAD_TEST_CASE(test_append_then_load_in_order) {
    tmpdir tmp;
    std::vector<sstring> expected;
    {
        file_schema_storage storage(tmp.path());
        for (int i = 0; i < 12; ++i) {
            auto fb = make_batch(i);
            storage.append(fb).get();
            expected.push_back(fb.representation());
        }
        BOOST_REQUIRE(representations(storage.load().get()) == expected);
    }

    // A fresh instance, as after a restart, sees the same batches and
    // appends after them.
    file_schema_storage storage(tmp.path());
    BOOST_REQUIRE(representations(storage.load().get()) == expected);
    auto fb = make_batch(100);
    storage.append(fb).get();
    expected.push_back(fb.representation());
    BOOST_REQUIRE(representations(file_schema_storage(tmp.path()).load().get()) == expected);
}

SEASTAR_THREAD_TEST_CASE(test_truncate) {
    tmpdir tmp;
    file_schema_storage storage(tmp.path());
    storage.append(make_batch(1)).get();
    storage.append(make_batch(2)).get();
    storage.truncate().get();
    BOOST_REQUIRE(storage.load().get().empty());
    BOOST_REQUIRE(file_schema_storage(tmp.path()).load().get().empty());

    auto fb = make_batch(3);
    storage.append(fb).get();
    BOOST_REQUIRE(representations(storage.load().get()) == std::vector<sstring>{fb.representation()});
}

SEASTAR_THREAD_TEST_CASE(test_incomplete_segments_are_discarded) {
    tmpdir tmp;
    auto fb = make_batch(1);
    file_schema_storage(tmp.path()).append(fb).get();

    std::ofstream(tmp.path() / "schema-00000000000000000001.bin.tmp") << "garbage";
    std::ofstream(tmp.path() / "README") << "not a segment";

    file_schema_storage storage(tmp.path());
    BOOST_REQUIRE(representations(storage.load().get()) == std::vector<sstring>{fb.representation()});
    BOOST_REQUIRE(!fs::exists(tmp.path() / "schema-00000000000000000001.bin.tmp"));
    BOOST_REQUIRE(fs::exists(tmp.path() / "README"));
}
