/*
 * Copyright 2016 ScylaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#pragma once

#include <seastar/http/httpd.hh>
#include <seastar/core/future.hh>

#include "seastarx.hh"

using request = http::request;
using reply = http::reply;

namespace service {

class migration_manager;

} // namespace service

namespace gms {

class gossiper;

}

namespace api {

struct http_context {
    httpd::http_server_control http_server;
};

future<> set_server_init(http_context& ctx);
future<> set_server_gossip(http_context& ctx, gms::gossiper& g);
future<> unset_server_gossip(http_context& ctx);
future<> set_server_migration_manager(http_context& ctx, service::migration_manager& mm);
future<> unset_server_migration_manager(http_context& ctx);

}
