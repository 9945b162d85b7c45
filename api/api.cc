/*
 * Copyright 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "api.hh"
#include "gossiper.hh"
#include "storage_service.hh"
#include "schema.hh"
#include "exceptions/exceptions.hh"
#include "log.hh"

logging::logger apilog("api");

namespace api {
using namespace seastar::httpd;

static std::unique_ptr<reply> exception_reply(std::exception_ptr eptr) {
    try {
        std::rethrow_exception(eptr);
    } catch (const exceptions::configuration_exception& ex) {
        throw bad_param_exception(ex.what());
    }
    // We never going to get here
    throw std::runtime_error("exception_reply");
}

future<> set_server_init(http_context& ctx) {
    return ctx.http_server.set_routes([] (routes& r) {
        r.register_exeption_handler(exception_reply);
    });
}

future<> set_server_gossip(http_context& ctx, gms::gossiper& g) {
    return ctx.http_server.set_routes([&ctx, &g] (routes& r) { set_gossiper(ctx, r, g); });
}

future<> unset_server_gossip(http_context& ctx) {
    return ctx.http_server.set_routes([&ctx] (routes& r) { unset_gossiper(ctx, r); });
}

future<> set_server_migration_manager(http_context& ctx, service::migration_manager& mm) {
    return ctx.http_server.set_routes([&ctx, &mm] (routes& r) {
        set_storage_service(ctx, r, mm);
        set_schema(ctx, r, mm);
    });
}

future<> unset_server_migration_manager(http_context& ctx) {
    return ctx.http_server.set_routes([&ctx] (routes& r) {
        unset_schema(ctx, r);
        unset_storage_service(ctx, r);
    });
}

}
