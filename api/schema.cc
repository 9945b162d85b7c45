/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "schema.hh"
#include "api/api.hh"
#include "service/migration_manager.hh"
#include "db/local_schema.hh"

namespace api {
using namespace seastar::httpd;
using namespace json;

// One keyspace and the names of what it contains.
struct keyspace_info : public json::json_base {
    json::json_element<sstring> name;
    json::json_element<sstring> replication_strategy;
    json::json_element<bool> durable_writes;
    json::json_list<sstring> tables;
    json::json_list<sstring> types;

    void register_params() {
        add(&name, "name");
        add(&replication_strategy, "replication_strategy");
        add(&durable_writes, "durable_writes");
        add(&tables, "tables");
        add(&types, "types");
    }
    keyspace_info() {
        register_params();
    }
    keyspace_info(const keyspace_info& e) : json::json_base() {
        register_params();
        name = e.name;
        replication_strategy = e.replication_strategy;
        durable_writes = e.durable_writes;
        tables = e.tables;
        types = e.types;
    }
    keyspace_info& operator=(const keyspace_info& e) {
        name = e.name;
        replication_strategy = e.replication_strategy;
        durable_writes = e.durable_writes;
        tables = e.tables;
        types = e.types;
        return *this;
    }
};

void set_schema(http_context& ctx, routes& r, service::migration_manager& mm) {
    set_route(r, GET, "/schema/keyspaces", [&mm] (std::unique_ptr<http::request> req) {
        const auto& schema = mm.get_schema();
        std::vector<keyspace_info> res;
        for (const auto& ks_name : schema.keyspace_names()) {
            auto ksm = schema.find_keyspace(ks_name);
            if (!ksm) {
                continue;
            }
            keyspace_info ks;
            ks.name = ksm->name();
            ks.replication_strategy = ksm->strategy_name();
            ks.durable_writes = ksm->durable_writes();
            ks.tables = schema.table_names(ks_name);
            ks.types = schema.type_names(ks_name);
            res.push_back(std::move(ks));
        }
        return make_ready_future<json::json_return_type>(std::move(res));
    });
}

void unset_schema(http_context& ctx, routes& r) {
    unset_route(r, GET, "/schema/keyspaces");
}

}
