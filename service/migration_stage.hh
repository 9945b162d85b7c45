/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/util/noncopyable_function.hh>

#include "seastarx.hh"

namespace service {

// The single place where the local schema is changed. Tasks submitted
// here run one at a time, in submission order, whether they apply a
// pulled batch or a locally announced one.
class migration_stage {
    semaphore _sem{1};
    gate _gate;
    // Submitted tasks which have not completed yet.
    size_t _pending = 0;
public:
    using task = noncopyable_function<future<> ()>;

    // Resolves with the outcome of func once it has run. Fails with
    // gate_closed_exception after close().
    future<> submit(task func);

    bool is_idle() const noexcept {
        return _pending == 0;
    }

    // Rejects new tasks and waits for the submitted ones.
    future<> close();
};

}
