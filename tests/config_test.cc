/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#define BOOST_TEST_MODULE core

#include <boost/test/unit_test.hpp>

#include "db/config.hh"

BOOST_AUTO_TEST_CASE(test_defaults) {
    db::config cfg;
    BOOST_REQUIRE_EQUAL(cfg.listen_address(), "localhost");
    BOOST_REQUIRE_EQUAL(cfg.storage_port(), 7000);
    BOOST_REQUIRE_EQUAL(cfg.migration_delay_in_ms(), 60000u);
    BOOST_REQUIRE_EQUAL(cfg.max_schema_batch_records(), 1000000u);
    BOOST_REQUIRE(cfg.broadcast_address().empty());
}

BOOST_AUTO_TEST_CASE(test_parse_yaml) {
    db::config cfg;
    cfg.read_from_yaml("cluster_name: 'Test Cluster'\n"
                       "storage_port: 7010\n"
                       "migration_delay_in_ms: 500\n"
                       "broadcast_address:\n"
                       "schema_directory: /tmp/schema\n");
    BOOST_REQUIRE_EQUAL(cfg.cluster_name(), "Test Cluster");
    BOOST_REQUIRE_EQUAL(cfg.storage_port(), 7010);
    BOOST_REQUIRE_EQUAL(cfg.migration_delay_in_ms(), 500u);
    BOOST_REQUIRE_EQUAL(cfg.schema_directory(), "/tmp/schema");
    // An empty value keeps the default.
    BOOST_REQUIRE(cfg.broadcast_address().empty());
    BOOST_REQUIRE(cfg.find("storage_port")->source() == utils::config_file::config_source::SettingsFile);
}

BOOST_AUTO_TEST_CASE(test_empty_document) {
    db::config cfg;
    cfg.read_from_yaml("");
    cfg.read_from_yaml("# only a comment\n");
    BOOST_REQUIRE_EQUAL(cfg.api_port(), 10000);
}

BOOST_AUTO_TEST_CASE(test_errors_go_to_the_handler) {
    db::config cfg;
    std::vector<sstring> reported;
    cfg.read_from_yaml("no_such_option: 1\n"
                       "storage_port: not-a-port\n"
                       "api_port: 10001\n",
            [&] (const sstring& opt, const sstring&, std::optional<db::config::value_status> status) {
        reported.push_back(opt);
        if (opt == "no_such_option") {
            BOOST_REQUIRE(!status);
        } else {
            BOOST_REQUIRE(status == db::config::value_status::Used);
        }
    });
    BOOST_REQUIRE_EQUAL(reported.size(), 2u);
    BOOST_REQUIRE_EQUAL(reported[0], "no_such_option");
    BOOST_REQUIRE_EQUAL(reported[1], "storage_port");
    BOOST_REQUIRE_EQUAL(cfg.storage_port(), 7000);
    BOOST_REQUIRE_EQUAL(cfg.api_port(), 10001);
}

BOOST_AUTO_TEST_CASE(test_default_handler_throws) {
    db::config cfg;
    BOOST_REQUIRE_THROW(cfg.read_from_yaml("no_such_option: 1\n"), std::invalid_argument);
    BOOST_REQUIRE_THROW(cfg.read_from_yaml("- a\n- b\n"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_command_line_overrides_file) {
    db::config cfg;
    bpo::options_description desc;
    auto init = desc.add_options();
    cfg.add_options(init);

    const char* argv[] = {"schemasync", "--migration_delay_in_ms", "30000"};
    bpo::variables_map vm;
    bpo::store(bpo::parse_command_line(3, argv, desc), vm);
    bpo::notify(vm);
    BOOST_REQUIRE_EQUAL(cfg.migration_delay_in_ms(), 30000u);

    cfg.read_from_yaml("migration_delay_in_ms: 10\n");
    BOOST_REQUIRE_EQUAL(cfg.migration_delay_in_ms(), 30000u);
}
