/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/core/coroutine.hh>

#include "storage_service.hh"
#include "api/api.hh"
#include "service/migration_manager.hh"
#include "log.hh"

extern logging::logger apilog;

namespace api {
using namespace seastar::httpd;
using namespace json;

void set_storage_service(http_context& ctx, routes& r, service::migration_manager& mm) {
    set_route(r, GET, "/storage_service/schema_version", [&mm] (std::unique_ptr<http::request> req) {
        return make_ready_future<json::json_return_type>(fmt::to_string(mm.get_schema_version()));
    });

    set_route(r, POST, "/storage_service/reset_local_schema", [&mm] (std::unique_ptr<http::request> req) -> future<json::json_return_type> {
        apilog.info("reset_local_schema");
        co_await mm.reset_local_schema();
        co_return json_void();
    });

    set_route(r, GET, "/storage_service/schema_agreement", [&mm] (std::unique_ptr<http::request> req) {
        return make_ready_future<json::json_return_type>(mm.have_schema_agreement());
    });
}

void unset_storage_service(http_context& ctx, routes& r) {
    unset_route(r, GET, "/storage_service/schema_version");
    unset_route(r, POST, "/storage_service/reset_local_schema");
    unset_route(r, GET, "/storage_service/schema_agreement");
}

}
