/*
 * Copyright (C) 2015-present ScyllaDB
 *
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <cstdlib>

#include "db/config.hh"

namespace db {

config::config()
    : utils::config_file()
    , cluster_name(this, "cluster_name", value_status::Used, "",
        "The name of the cluster; used to prevent machines in one logical cluster from joining another. All nodes participating in a cluster must have the same value.")
    , listen_address(this, "listen_address", value_status::Used, "localhost",
        "The IP address or hostname that this node binds to for connecting to other nodes.")
    , broadcast_address(this, "broadcast_address", value_status::Used, {/* listen_address */},
        "The IP address this node advertises to other nodes. Defaults to listen_address.")
    , storage_port(this, "storage_port", value_status::Used, 7000,
        "The port for inter-node communication.")
    , initial_token(this, "initial_token", value_status::Used, "0",
        "The token this node advertises on the membership feed. Peers only pull schema from nodes advertising tokens.")
    , api_address(this, "api_address", value_status::Used, "",
        "The address the admin REST API listens on. Defaults to listen_address.")
    , api_port(this, "api_port", value_status::Used, 10000,
        "The port the admin REST API listens on.")
    , schema_directory(this, "schema_directory", value_status::Used, "/var/lib/schemasync/schema",
        "The directory where the node persists the schema definitions it holds.")
    , migration_delay_in_ms(this, "migration_delay_in_ms", value_status::Used, 60000,
        "After this much uptime, a schema version advertised by a peer is only pulled if it still differs once this delay has passed again. Before that, or while the local schema is empty, it is pulled immediately.")
    , schema_pull_timeout_in_ms(this, "schema_pull_timeout_in_ms", value_status::Used, 10000,
        "How long to wait for a peer to answer a schema pull request.")
    , max_schema_batch_records(this, "max_schema_batch_records", value_status::Used, 1000000,
        "Upper bound on the number of records a received schema batch may declare. Larger batches are rejected as corrupt.")
{}

std::filesystem::path config::get_conf_sub(std::filesystem::path sub) {
    const char* conf = std::getenv("SCHEMASYNC_CONF");
    std::filesystem::path dir = conf ? conf : "conf";
    return dir / sub;
}

}
