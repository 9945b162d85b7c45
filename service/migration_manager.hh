/*
 * Copyright (C) 2015-present ScyllaDB
 *
 * Modified by ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "service/migration_listener.hh"
#include "service/migration_stage.hh"
#include "gms/endpoint_state.hh"
#include <seastar/core/abort_source.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/shared_ptr.hh>
#include "gms/inet_address.hh"
#include "gms/i_endpoint_state_change_subscriber.hh"
#include "schema/schema_fwd.hh"
#include "db/schema_mutation.hh"
#include "db/frozen_schema_batch.hh"
#include "db/schema_tables.hh"
#include "timestamp.hh"
#include "data_dictionary/keyspace_metadata.hh"
#include "data_dictionary/table_metadata.hh"
#include "data_dictionary/user_type_metadata.hh"

#include <chrono>
#include <functional>

namespace netw { class schema_rpc; }

namespace gms {

class gossiper;

}

namespace db {
class local_schema;
}

namespace service {

struct migration_manager_config {
    // How long to wait before pulling from a peer whose version differs,
    // once the node is past its own startup.
    std::chrono::milliseconds migration_delay{60000};
    std::chrono::milliseconds schema_pull_timeout{10000};
    uint32_t max_schema_batch_records = 1000000;
    // Process uptime, compared against migration_delay.
    std::function<std::chrono::steady_clock::duration ()> uptime;
};

/**
 * Keeps the schema of this node in agreement with the rest of the cluster.
 *
 * It watches the schema versions peers advertise on the membership feed and
 * pulls from a peer whose version differs. Schema changes made on this node
 * are applied locally and then pushed to the live peers. Every change to
 * the local schema, pulled or announced, goes through one migration_stage.
 *
 * Must be used from shard 0 only.
 */
class migration_manager : public gms::i_endpoint_state_change_subscriber,
                          public seastar::enable_shared_from_this<migration_manager> {
public:
    struct stats {
        uint64_t migration_tasks_submitted = 0;
        uint64_t migration_tasks_failed = 0;
        uint64_t definitions_updates_received = 0;
        uint64_t definitions_updates_pushed = 0;
    };
private:
    migration_notifier& _notifier;
    gms::gossiper& _gossiper;
    netw::schema_rpc& _messaging;
    db::local_schema& _schema;
    migration_manager_config _cfg;

    migration_stage _stage;
    seastar::gate _background_tasks;
    seastar::abort_source _as;
    stats _stats;
    api::timestamp_type _last_schema_change_timestamp = api::missing_timestamp;
    bool _started = false;
public:
    migration_manager(migration_notifier&, gms::gossiper&, netw::schema_rpc&, db::local_schema&, migration_manager_config = {});

    migration_notifier& get_notifier() { return _notifier; }
    const migration_notifier& get_notifier() const { return _notifier; }
    const db::local_schema& get_schema() const { return _schema; }
    const stats& get_stats() const noexcept { return _stats; }

    const table_schema_version& get_schema_version() const noexcept;

    // Reacts to peers advertising a schema version. Never waits for a pull
    // to complete: the membership feed must not be held up by schema work.
    virtual future<> on_endpoint_event(const gms::endpoint_event& event) override;

    // Pulls from the endpoint if the version it advertises differs from ours,
    // right away or after migration_delay. Does not wait for the pull.
    void schedule_schema_pull(const gms::inet_address& endpoint, const gms::endpoint_state& state);

    // Resolves once the pull, if any, completed or was given up on.
    future<> maybe_schedule_schema_pull(const table_schema_version& their_version, const gms::inet_address& endpoint);

    // Pulls the complete schema of the endpoint and merges it. Failures
    // are logged, and not retried: the next version advertisement of the
    // endpoint triggers another pull.
    future<> submit_migration_task(const gms::inet_address& endpoint);

    // Pulls the complete schema of the endpoint and merges it through the
    // migration stage. Fails if the pull or the merge fails.
    future<> merge_schema_from(const gms::inet_address& endpoint);

    // Merges a batch received from src through the migration stage.
    future<> merge_schema_from(const gms::inet_address& src, const db::frozen_schema_batch& fb);

    // The endpoint speaks a protocol we understand and is a member of the ring.
    bool should_pull_schema_from(const gms::inet_address& endpoint) const;
    // The endpoint is able to decode the batches we send.
    bool can_push_schema_to(const gms::inet_address& endpoint) const;

    /**
     * Schema changes originated on this node.
     *
     * Each validates the change against the local schema, failing with
     * already_exists_exception, not_found_exception or
     * invalid_change_exception before anything is applied. The change is
     * applied locally with a single timestamp, and the returned future
     * resolves once it is. Live peers are then sent the change in the
     * background.
     */
    future<> announce_new_keyspace(data_dictionary::keyspace_metadata ksm);
    future<> announce_keyspace_update(data_dictionary::keyspace_metadata ksm);
    future<> announce_keyspace_drop(const sstring& ks_name);

    future<> announce_new_column_family(data_dictionary::table_metadata cfm);
    future<> announce_column_family_update(data_dictionary::table_metadata cfm);
    future<> announce_column_family_drop(const sstring& ks_name, const sstring& cf_name);

    future<> announce_new_type(data_dictionary::user_type_metadata new_type);
    future<> announce_type_update(data_dictionary::user_type_metadata updated_type);
    future<> announce_type_drop(const sstring& ks_name, const sstring& type_name);

    // Publishes the local schema version on the membership feed.
    future<> passive_announce(table_schema_version version);
    future<> passive_announce();

    /**
     * Throws away the persisted schema and the local definitions, then
     * pulls the schema from the first live peer we can pull from. With no
     * such peer the node stays at the empty version until a peer
     * advertises one.
     *
     * A failure to remove the persisted schema is propagated and leaves
     * the local definitions in place. Segments removed before the failure
     * are not restored.
     */
    future<> reset_local_schema();

    /**
     * Known peers which are alive all advertise our schema version.
     */
    bool have_schema_agreement();
    // Polls have_schema_agreement() until it holds. Fails with
    // std::runtime_error once the deadline is reached.
    future<> wait_for_schema_agreement(lowres_clock::time_point deadline, seastar::abort_source* as = nullptr);

    // No schema change is being applied or waiting to be.
    bool is_ready_for_bootstrap() const noexcept {
        return _stage.is_idle();
    }

    // Starts answering pulls and pushes, and watching the membership feed.
    future<> start();
    // Stops watching, cancels the delayed pulls and waits for background work.
    future<> stop();
private:
    using batch_builder = noncopyable_function<db::schema_mutation_batch (api::timestamp_type)>;

    future<> announce(batch_builder prepare);
    future<> push_schema_mutation(db::frozen_schema_batch fb);
    future<> do_merge_schema_from(const gms::inet_address& endpoint);
    future<> apply_and_notify(db::schema_mutation_batch batch);
    future<> notify_and_advertise(db::schema_tables::schema_diff diff);
    api::timestamp_type next_schema_change_timestamp();

    void init_messaging_service();
    future<> uninit_messaging_service();
};

}
