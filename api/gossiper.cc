/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "gossiper.hh"
#include "gms/gossiper.hh"
#include "api/api.hh"

namespace api {
using namespace seastar::httpd;
using namespace json;

void set_gossiper(http_context& ctx, routes& r, gms::gossiper& g) {
    set_route(r, GET, "/gossiper/endpoint/live", [&g] (std::unique_ptr<http::request> req) {
        return make_ready_future<json::json_return_type>(container_to_vec(g.get_live_members()));
    });
}

void unset_gossiper(http_context& ctx, routes& r) {
    unset_route(r, GET, "/gossiper/endpoint/live");
}

}
