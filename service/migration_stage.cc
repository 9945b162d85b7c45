/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/core/coroutine.hh>

#include "service/migration_stage.hh"

namespace service {

future<> migration_stage::submit(task func) {
    auto holder = _gate.hold();
    ++_pending;
    std::exception_ptr ex;
    try {
        auto units = co_await get_units(_sem, 1);
        co_await func();
    } catch (...) {
        ex = std::current_exception();
    }
    --_pending;
    if (ex) {
        std::rethrow_exception(std::move(ex));
    }
}

future<> migration_stage::close() {
    return _gate.close();
}

}
