/*
 * Copyright (C) 2015-present ScyllaDB
 *
 * Modified by ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/lowres_clock.hh>

#include "seastarx.hh"
#include "gms/inet_address.hh"

namespace gms { class gossiper; }

namespace service {

class migration_manager;

// One pull of the complete schema of a peer, followed by its merge.
// A task runs once and is never retried, whatever its outcome.
class migration_task {
    gms::inet_address _endpoint;
    lowres_clock::time_point _created;
public:
    explicit migration_task(gms::inet_address endpoint)
        : _endpoint(endpoint)
        , _created(lowres_clock::now())
    { }

    const gms::inet_address& endpoint() const noexcept {
        return _endpoint;
    }
    lowres_clock::time_point created() const noexcept {
        return _created;
    }

    // Resolves to false if the pull was not attempted or did not succeed.
    // Does not fail.
    future<bool> run(migration_manager& mm, const gms::gossiper& gossiper) const;
};

}
