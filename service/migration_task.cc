/*
 * Copyright (C) 2015-present ScyllaDB
 *
 * Modified by ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include <seastar/core/coroutine.hh>

#include "service/migration_task.hh"
#include "service/migration_manager.hh"
#include "gms/gossiper.hh"
#include "exceptions/exceptions.hh"
#include "log.hh"

namespace service {

static logging::logger mlogger("migration_task");

future<bool> migration_task::run(migration_manager& mm, const gms::gossiper& gossiper) const {
    if (!gossiper.is_alive(_endpoint)) {
        mlogger.warn("Can't send migration request: node {} is down.", _endpoint);
        co_return false;
    }
    auto endpoint = _endpoint;
    co_return co_await mm.merge_schema_from(endpoint).then([] {
        return true;
    }).handle_exception([endpoint] (std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const exceptions::configuration_exception& e) {
            mlogger.error("Configuration exception merging remote schema from {}: {}", endpoint, e.what());
        } catch (...) {
            mlogger.warn("Fail to pull schema from {}: {}", endpoint, std::current_exception());
        }
        return false;
    });
}

}
