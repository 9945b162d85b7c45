/*
 * Copyright (C) 2015-present ScyllaDB
 *
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <filesystem>

#include <seastar/core/sstring.hh>

#include "seastarx.hh"
#include "utils/config_file.hh"

namespace db {

class config final : public utils::config_file {
public:
    config();
    config(const config&) = delete;

    // Return the path of a file under the configuration directory
    // ($SCHEMASYNC_CONF or ./conf).
    static std::filesystem::path get_conf_sub(std::filesystem::path);

    named_value<sstring> cluster_name;
    named_value<sstring> listen_address;
    named_value<sstring> broadcast_address;
    named_value<uint16_t> storage_port;
    named_value<sstring> initial_token;
    named_value<sstring> api_address;
    named_value<uint16_t> api_port;
    named_value<sstring> schema_directory;
    named_value<uint32_t> migration_delay_in_ms;
    named_value<uint32_t> schema_pull_timeout_in_ms;
    named_value<uint32_t> max_schema_batch_records;
};

}
