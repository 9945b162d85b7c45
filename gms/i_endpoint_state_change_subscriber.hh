/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <seastar/core/future.hh>

#include "gms/endpoint_event.hh"

namespace gms {

/**
 * This is called by the gossiper to notify
 * interested parties about changes in the the state associated with any endpoint.
 * For instance if node A figures there is a changes in state for an endpoint B
 * it notifies all interested parties of this change. It is upto to the registered
 * instance to decide what it does with this change. Not all modules maybe interested
 * in all state changes.
 *
 * Notifications are delivered one subscriber at a time, in registration order.
 * A subscriber must not wait on long running work from inside the callback.
 */
class i_endpoint_state_change_subscriber {
public:
    virtual ~i_endpoint_state_change_subscriber() {}

    virtual future<> on_endpoint_event(const endpoint_event& event) = 0;
};

} // namespace gms
