/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/future.hh>
#include <chrono>
#include <functional>

#include "gms/inet_address.hh"
#include "db/frozen_schema_batch.hh"

namespace netw {

/**
 * The inter-node calls used to move schema between nodes.
 *
 * MIGRATION_REQUEST asks a peer for its complete schema and carries no
 * payload. DEFINITIONS_UPDATE pushes a batch to a peer and expects no
 * reply. Delivery, retries and framing belong to the implementation.
 */
class schema_rpc {
public:
    using definitions_update_handler = std::function<future<> (gms::inet_address from, db::frozen_schema_batch)>;
    using migration_request_handler = std::function<future<db::frozen_schema_batch> (gms::inet_address from)>;

    virtual ~schema_rpc() = default;

    // The messaging protocol version this node speaks.
    virtual int32_t current_version() const noexcept = 0;

    virtual void register_definitions_update(definitions_update_handler func) = 0;
    virtual future<> unregister_definitions_update() = 0;
    virtual void register_migration_request(migration_request_handler func) = 0;
    virtual future<> unregister_migration_request() = 0;

    // Fails with seastar::rpc::timeout_error once the timeout elapses.
    virtual future<db::frozen_schema_batch> send_migration_request(gms::inet_address to, std::chrono::milliseconds timeout) = 0;
    // Resolves once the message is handed to the transport.
    virtual future<> send_definitions_update(gms::inet_address to, db::frozen_schema_batch fb) = 0;
};

}
