/*
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include <algorithm>

#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>
#include <seastar/core/thread.hh>
#include <seastar/coroutine/parallel_for_each.hh>

#include "service/migration_manager.hh"
#include "service/migration_task.hh"
#include "message/schema_rpc.hh"
#include "gms/gossiper.hh"
#include "gms/versioned_value.hh"
#include "db/local_schema.hh"
#include "db/schema_tables.hh"
#include "exceptions/exceptions.hh"
#include "utils/overloaded_functor.hh"
#include "utils/runtime.hh"
#include "log.hh"

namespace service {

static logging::logger mlogger("migration_manager");

using namespace std::chrono_literals;

migration_manager::migration_manager(migration_notifier& notifier, gms::gossiper& gossiper, netw::schema_rpc& ms,
            db::local_schema& schema, migration_manager_config cfg)
        : _notifier(notifier)
        , _gossiper(gossiper)
        , _messaging(ms)
        , _schema(schema)
        , _cfg(std::move(cfg))
{
    if (!_cfg.uptime) {
        _cfg.uptime = runtime::get_uptime;
    }
}

const table_schema_version& migration_manager::get_schema_version() const noexcept {
    return _schema.get_version();
}

future<> migration_manager::start() {
    init_messaging_service();
    _gossiper.register_(shared_from_this());
    _started = true;
    co_return;
}

future<> migration_manager::stop() {
    mlogger.info("stopping migration service");
    if (!_as.abort_requested()) {
        _as.request_abort();
    }
    if (_started) {
        _started = false;
        co_await _gossiper.unregister_(shared_from_this());
        co_await uninit_messaging_service();
    }
    if (!_background_tasks.is_closed()) {
        co_await _background_tasks.close();
    }
    co_await _stage.close();
}

void migration_manager::init_messaging_service()
{
    _messaging.register_definitions_update([this] (gms::inet_address src, db::frozen_schema_batch fb) {
        ++_stats.definitions_updates_received;
        // The merge waits for the migration stage, don't hold the sender meanwhile.
        (void)seastar::try_with_gate(_background_tasks, [this, src, fb = std::move(fb)] {
            return merge_schema_from(src, fb);
        }).then_wrapped([src] (auto&& f) {
            if (f.failed()) {
                mlogger.error("Failed to update definitions from {}: {}", src, f.get_exception());
            } else {
                mlogger.debug("Applied definitions update from {}.", src);
            }
        });
        return make_ready_future<>();
    });
    _messaging.register_migration_request([this] (gms::inet_address src) {
        mlogger.debug("Sending schema version {} to {}", get_schema_version(), src);
        return make_ready_future<db::frozen_schema_batch>(_schema.export_schema());
    });
}

future<> migration_manager::uninit_messaging_service()
{
    co_await _messaging.unregister_migration_request();
    co_await _messaging.unregister_definitions_update();
}

future<> migration_manager::on_endpoint_event(const gms::endpoint_event& event) {
    if (gms::event_endpoint(event) == _gossiper.get_broadcast_address()) {
        return make_ready_future<>();
    }
    std::visit(overloaded_functor{
        [this] (const gms::endpoint_events::alive& ev) {
            if (ev.state) {
                schedule_schema_pull(ev.endpoint, *ev.state);
            }
        },
        [this] (const gms::endpoint_events::change& ev) {
            if (!ev.states.contains(gms::application_state::SCHEMA)) {
                return;
            }
            auto ep_state = _gossiper.get_endpoint_state_ptr(ev.endpoint);
            if (!ep_state || _gossiper.is_dead_state(*ep_state)) {
                mlogger.debug("Ignoring state change for dead or unknown endpoint: {}", ev.endpoint);
                return;
            }
            schedule_schema_pull(ev.endpoint, *ep_state);
        },
        // Divergence is only detected through the versions endpoints advertise.
        [] (const auto&) {}
    }, event);
    return make_ready_future<>();
}

void migration_manager::schedule_schema_pull(const gms::inet_address& endpoint, const gms::endpoint_state& state)
{
    if (endpoint == _gossiper.get_broadcast_address() || !state.get_application_state_ptr(gms::application_state::SCHEMA)) {
        return;
    }
    auto their_version = state.get_schema_version();
    if (!their_version) {
        mlogger.warn("Ignoring malformed schema version advertised by {}", endpoint);
        return;
    }
    (void)seastar::try_with_gate(_background_tasks, [this, version = *their_version, endpoint] {
        return maybe_schedule_schema_pull(version, endpoint);
    }).handle_exception([endpoint] (std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const seastar::sleep_aborted&) {
            mlogger.debug("Delayed schema pull from {} cancelled", endpoint);
        } catch (const seastar::gate_closed_exception&) {
            mlogger.debug("Not pulling schema from {}: shutting down", endpoint);
        } catch (...) {
            mlogger.warn("Fail to pull schema from {}: {}", endpoint, std::current_exception());
        }
    });
}

future<> migration_manager::maybe_schedule_schema_pull(const table_schema_version& their_version, const gms::inet_address& endpoint)
{
    if (get_schema_version() == their_version || !should_pull_schema_from(endpoint)) {
        mlogger.debug("Not pulling schema because versions match or shouldPullSchemaFrom returned false");
        co_return;
    }

    if (_schema.has_empty_version() || _cfg.uptime() < _cfg.migration_delay) {
        // We may be bootstrapping or have recently started, pull right away
        mlogger.debug("Submitting migration task for {}", endpoint);
        co_await submit_migration_task(endpoint);
        co_return;
    }

    // Give changes pushed out at the same time a chance to arrive first
    co_await sleep_abortable<lowres_clock>(_cfg.migration_delay, _as);

    // The endpoint may have moved on since the pull was scheduled
    auto ep_state = _gossiper.get_endpoint_state_ptr(endpoint);
    if (!ep_state) {
        mlogger.debug("epState vanished for {}, not submitting migration task", endpoint);
        co_return;
    }
    auto current_version = ep_state->get_schema_version();
    if (!current_version) {
        mlogger.debug("application_state::SCHEMA does not exist for {}, not submitting migration task", endpoint);
        co_return;
    }
    if (get_schema_version() == *current_version) {
        mlogger.debug("not submitting migration task for {} because our versions match", endpoint);
        co_return;
    }
    mlogger.debug("submitting migration task for {}", endpoint);
    co_await submit_migration_task(endpoint);
}

future<> migration_manager::submit_migration_task(const gms::inet_address& endpoint)
{
    ++_stats.migration_tasks_submitted;
    migration_task task(endpoint);
    if (!co_await task.run(*this, _gossiper)) {
        ++_stats.migration_tasks_failed;
    }
}

future<> migration_manager::merge_schema_from(const gms::inet_address& endpoint)
{
    if (_as.abort_requested()) {
        return make_exception_future<>(abort_requested_exception());
    }
    return _stage.submit([this, endpoint] {
        return do_merge_schema_from(endpoint);
    });
}

future<> migration_manager::do_merge_schema_from(const gms::inet_address& endpoint)
{
    mlogger.info("Pulling schema from {}", endpoint);
    auto fb = co_await _messaging.send_migration_request(endpoint, _cfg.schema_pull_timeout);
    auto batch = db::unfreeze(fb, _cfg.max_schema_batch_records);
    co_await apply_and_notify(std::move(batch));
    mlogger.info("Schema merge with {} completed", endpoint);
}

future<> migration_manager::merge_schema_from(const gms::inet_address& src, const db::frozen_schema_batch& fb)
{
    if (_as.abort_requested()) {
        return make_exception_future<>(abort_requested_exception());
    }
    return _stage.submit([this, src, fb] () -> future<> {
        mlogger.debug("Applying schema mutations from {}", src);
        auto batch = db::unfreeze(fb, _cfg.max_schema_batch_records);
        return apply_and_notify(std::move(batch));
    });
}

future<> migration_manager::apply_and_notify(db::schema_mutation_batch batch)
{
    auto diff = co_await _schema.merge(std::move(batch));
    co_await notify_and_advertise(std::move(diff));
}

future<> migration_manager::notify_and_advertise(db::schema_tables::schema_diff diff)
{
    std::exception_ptr ex;
    try {
        co_await db::schema_tables::notify_schema_changes(_notifier, diff);
    } catch (...) {
        ex = std::current_exception();
    }
    // The merge is committed: peers must see the new version even if a
    // listener failed.
    co_await passive_announce();
    if (ex) {
        std::rethrow_exception(std::move(ex));
    }
}

api::timestamp_type migration_manager::next_schema_change_timestamp()
{
    // Strictly above anything already written, so that a change always
    // supersedes the definitions it was validated against.
    auto ts = std::max({api::new_timestamp(), _last_schema_change_timestamp + 1, _schema.state().newest_timestamp() + 1});
    _last_schema_change_timestamp = ts;
    return ts;
}

bool migration_manager::should_pull_schema_from(const gms::inet_address& endpoint) const {
    auto ep_state = _gossiper.get_endpoint_state_ptr(endpoint);
    if (!ep_state) {
        return false;
    }
    auto version = ep_state->get_network_version();
    return version && *version <= _messaging.current_version() && !_gossiper.is_gossip_only_member(endpoint);
}

bool migration_manager::can_push_schema_to(const gms::inet_address& endpoint) const {
    auto ep_state = _gossiper.get_endpoint_state_ptr(endpoint);
    if (!ep_state || !_gossiper.is_alive(endpoint)) {
        return false;
    }
    auto version = ep_state->get_network_version();
    return version && *version >= _messaging.current_version();
}

bool migration_manager::have_schema_agreement() {
    if (_gossiper.num_endpoints() == 1) {
        // Us.
        return true;
    }
    auto our_version = get_schema_version();
    auto self = _gossiper.get_broadcast_address();
    bool match = true;
    _gossiper.for_each_endpoint_state_until([&] (const gms::inet_address& endpoint, const gms::endpoint_state& eps) {
        if (endpoint == self || !_gossiper.is_alive(endpoint)) {
            return stop_iteration::no;
        }
        mlogger.debug("Checking schema state for {}.", endpoint);
        auto remote_version = eps.get_schema_version();
        if (!remote_version) {
            mlogger.info("Schema state not yet available for {}.", endpoint);
            match = false;
            return stop_iteration::yes;
        }
        if (our_version != *remote_version) {
            mlogger.info("Schema mismatch for {} ({} != {}).", endpoint, our_version, *remote_version);
            match = false;
            return stop_iteration::yes;
        }
        return stop_iteration::no;
    });
    if (match) {
        mlogger.debug("Schema agreement check passed.");
    }
    return match;
}

future<> migration_manager::wait_for_schema_agreement(lowres_clock::time_point deadline, seastar::abort_source* as) {
    while (!have_schema_agreement()) {
        if (as) {
            as->check();
        }
        if (lowres_clock::now() > deadline) {
            throw std::runtime_error("Unable to reach schema agreement");
        }
        co_await (as ? sleep_abortable(500ms, *as) : sleep(500ms));
    }
}

future<> migration_manager::announce(batch_builder prepare)
{
    db::frozen_schema_batch fb;
    bool applied = false;
    std::exception_ptr ex;
    try {
        co_await _stage.submit([this, &prepare, &fb, &applied] () -> future<> {
            auto batch = prepare(next_schema_change_timestamp());
            fb = db::freeze(batch);
            auto diff = co_await _schema.merge(std::move(batch));
            applied = true;
            co_await notify_and_advertise(std::move(diff));
        });
    } catch (...) {
        if (!applied) {
            throw;
        }
        ex = std::current_exception();
    }
    // The change is applied here. Peers learn about it in the background,
    // those we miss will notice the version change and pull.
    (void)seastar::try_with_gate(_background_tasks, [this, fb = std::move(fb)] () mutable {
        return push_schema_mutation(std::move(fb));
    }).handle_exception([] (std::exception_ptr ep) {
        mlogger.error("failed to announce migration to all nodes: {}", ep);
    });
    if (ex) {
        std::rethrow_exception(std::move(ex));
    }
}

future<> migration_manager::push_schema_mutation(db::frozen_schema_batch fb)
{
    // Peers which become live from now on will pull instead
    auto self = _gossiper.get_broadcast_address();
    std::vector<gms::inet_address> live_members;
    for (auto& endpoint : _gossiper.get_live_members()) {
        if (endpoint == self) {
            continue;
        }
        if (!can_push_schema_to(endpoint)) {
            mlogger.debug("Not pushing schema to {}: incompatible messaging version", endpoint);
            continue;
        }
        live_members.push_back(endpoint);
    }
    co_await coroutine::parallel_for_each(live_members, [this, &fb] (gms::inet_address endpoint) {
        mlogger.debug("Pushing schema to {}", endpoint);
        ++_stats.definitions_updates_pushed;
        return _messaging.send_definitions_update(endpoint, fb);
    });
}

future<> migration_manager::announce_new_keyspace(data_dictionary::keyspace_metadata ksm)
{
    return announce([this, ksm = std::move(ksm)] (api::timestamp_type ts) {
        ksm.validate();
        if (_schema.has_keyspace(ksm.name())) {
            throw exceptions::already_exists_exception{ksm.name()};
        }
        mlogger.info("Create new Keyspace: {}", ksm);
        return db::schema_mutation_batch{db::schema_tables::make_create_keyspace_mutation(ksm, ts)};
    });
}

future<> migration_manager::announce_keyspace_update(data_dictionary::keyspace_metadata ksm)
{
    return announce([this, ksm = std::move(ksm)] (api::timestamp_type ts) {
        auto old = _schema.find_keyspace(ksm.name());
        if (!old) {
            throw exceptions::not_found_exception(ksm.name(), "", format("Cannot update non existing keyspace '{}'.", ksm.name()));
        }
        ksm.validate();
        mlogger.info("Update Keyspace: {}", ksm);
        return db::schema_mutation_batch{db::schema_tables::make_update_keyspace_mutation(*old, ksm, ts)};
    });
}

future<> migration_manager::announce_keyspace_drop(const sstring& ks_name)
{
    return announce([this, ks_name] (api::timestamp_type ts) {
        if (!_schema.has_keyspace(ks_name)) {
            throw exceptions::not_found_exception(ks_name, "", format("Cannot drop non existing keyspace '{}'.", ks_name));
        }
        mlogger.info("Drop Keyspace '{}'", ks_name);
        return db::schema_mutation_batch{db::schema_tables::make_drop_keyspace_mutation(ks_name, ts)};
    });
}

future<> migration_manager::announce_new_column_family(data_dictionary::table_metadata cfm)
{
    return announce([this, cfm = std::move(cfm)] (api::timestamp_type ts) {
        cfm.validate();
        if (!_schema.has_keyspace(cfm.ks_name())) {
            throw exceptions::not_found_exception(cfm.ks_name(), cfm.cf_name(),
                    format("Cannot add table '{}' to non existing keyspace '{}'.", cfm.cf_name(), cfm.ks_name()));
        }
        if (_schema.find_table(cfm.ks_name(), cfm.cf_name())) {
            throw exceptions::already_exists_exception(cfm.ks_name(), cfm.cf_name());
        }
        mlogger.info("Create new ColumnFamily: {}", cfm);
        return db::schema_mutation_batch{db::schema_tables::make_create_table_mutation(cfm, ts)};
    });
}

future<> migration_manager::announce_column_family_update(data_dictionary::table_metadata cfm)
{
    return announce([this, cfm = std::move(cfm)] (api::timestamp_type ts) {
        auto old = _schema.find_table(cfm.ks_name(), cfm.cf_name());
        if (!old) {
            throw exceptions::not_found_exception(cfm.ks_name(), cfm.cf_name(),
                    format("Cannot update non existing table '{}' in keyspace '{}'.", cfm.cf_name(), cfm.ks_name()));
        }
        cfm.validate();
        cfm.validate_update_of(*old);
        mlogger.info("Update table '{}.{}' From {} To {}", cfm.ks_name(), cfm.cf_name(), *old, cfm);
        return db::schema_mutation_batch{db::schema_tables::make_update_table_mutation(*old, cfm, ts)};
    });
}

future<> migration_manager::announce_column_family_drop(const sstring& ks_name, const sstring& cf_name)
{
    return announce([this, ks_name, cf_name] (api::timestamp_type ts) {
        if (!_schema.find_table(ks_name, cf_name)) {
            throw exceptions::not_found_exception(ks_name, cf_name,
                    format("Cannot drop non existing table '{}' in keyspace '{}'.", cf_name, ks_name));
        }
        mlogger.info("Drop table '{}.{}'", ks_name, cf_name);
        return db::schema_mutation_batch{db::schema_tables::make_drop_table_mutation(ks_name, cf_name, ts)};
    });
}

future<> migration_manager::announce_new_type(data_dictionary::user_type_metadata new_type)
{
    return announce([this, new_type = std::move(new_type)] (api::timestamp_type ts) {
        new_type.validate();
        if (!_schema.has_keyspace(new_type.keyspace())) {
            throw exceptions::not_found_exception(new_type.keyspace(), new_type.name(),
                    format("Cannot add type '{}' to non existing keyspace '{}'.", new_type.name(), new_type.keyspace()));
        }
        if (_schema.find_type(new_type.keyspace(), new_type.name())) {
            throw exceptions::already_exists_exception(new_type.keyspace(), new_type.name(),
                    format("A user type of name {}.{} already exists", new_type.keyspace(), new_type.name()));
        }
        mlogger.info("Prepare Create new User Type: {}", new_type);
        return db::schema_mutation_batch{db::schema_tables::make_create_type_mutation(new_type, ts)};
    });
}

future<> migration_manager::announce_type_update(data_dictionary::user_type_metadata updated_type)
{
    return announce([this, updated_type = std::move(updated_type)] (api::timestamp_type ts) {
        auto old = _schema.find_type(updated_type.keyspace(), updated_type.name());
        if (!old) {
            throw exceptions::not_found_exception(updated_type.keyspace(), updated_type.name(),
                    format("Cannot update non existing type '{}' in keyspace '{}'.", updated_type.name(), updated_type.keyspace()));
        }
        updated_type.validate();
        updated_type.validate_update_of(*old);
        mlogger.info("Prepare Update User Type: {}", updated_type);
        return db::schema_mutation_batch{db::schema_tables::make_update_type_mutation(*old, updated_type, ts)};
    });
}

future<> migration_manager::announce_type_drop(const sstring& ks_name, const sstring& type_name)
{
    return announce([this, ks_name, type_name] (api::timestamp_type ts) {
        if (!_schema.find_type(ks_name, type_name)) {
            throw exceptions::not_found_exception(ks_name, type_name,
                    format("Cannot drop non existing type '{}' in keyspace '{}'.", type_name, ks_name));
        }
        mlogger.info("Drop User Type: {}.{}", ks_name, type_name);
        return db::schema_mutation_batch{db::schema_tables::make_drop_type_mutation(ks_name, type_name, ts)};
    });
}

future<> migration_manager::passive_announce(table_schema_version version) {
    mlogger.debug("Gossiping my schema version {}", version);
    return _gossiper.add_local_application_state(gms::application_state::SCHEMA, gms::versioned_value::schema(version));
}

future<> migration_manager::passive_announce() {
    return passive_announce(get_schema_version());
}

future<> migration_manager::reset_local_schema()
{
    mlogger.info("Starting local schema reset...");
    co_await _stage.submit([this] () -> future<> {
        mlogger.debug("Truncating schema tables...");
        co_await _schema.truncate();
        mlogger.debug("Clearing local schema keyspace definitions...");
        _schema.clear();
        co_await passive_announce();
    });

    auto self = _gossiper.get_broadcast_address();
    for (auto& endpoint : _gossiper.get_live_members()) {
        if (endpoint == self || !should_pull_schema_from(endpoint)) {
            continue;
        }
        mlogger.debug("Requesting schema from {}", endpoint);
        co_await submit_migration_task(endpoint);
        break;
    }
    mlogger.info("Local schema reset is complete.");
}

void migration_notifier::register_listener(migration_listener* listener)
{
    _listeners.add(listener);
}

future<> migration_notifier::unregister_listener(migration_listener* listener)
{
    return _listeners.remove(listener);
}

future<> migration_notifier::on_schema_change(std::function<void(migration_listener*)> notify, std::function<std::string(std::exception_ptr)> describe_error) {
    return seastar::async([this, notify = std::move(notify), describe_error = std::move(describe_error)] {
        std::exception_ptr ex;
        _listeners.thread_for_each([&] (migration_listener* listener) {
            try {
                notify(listener);
            } catch (...) {
                ex = std::current_exception();
                mlogger.error("{}", describe_error(ex));
            }
        });
        if (ex) {
            std::rethrow_exception(std::move(ex));
        }
    });
}

future<> migration_notifier::create_keyspace(const sstring& ks_name) {
    co_await on_schema_change([&] (migration_listener* listener) {
        listener->on_create_keyspace(ks_name);
    }, [&] (std::exception_ptr ex) {
        return fmt::format("Create keyspace notification failed {}: {}", ks_name, ex);
    });
}

future<> migration_notifier::create_column_family(const sstring& ks_name, const sstring& cf_name) {
    co_await on_schema_change([&] (migration_listener* listener) {
        listener->on_create_column_family(ks_name, cf_name);
    }, [&] (std::exception_ptr ex) {
        return fmt::format("Create column family notification failed {}.{}: {}", ks_name, cf_name, ex);
    });
}

future<> migration_notifier::create_user_type(const sstring& ks_name, const sstring& type_name) {
    co_await on_schema_change([&] (migration_listener* listener) {
        listener->on_create_user_type(ks_name, type_name);
    }, [&] (std::exception_ptr ex) {
        return fmt::format("Create user type notification failed {}.{}: {}", ks_name, type_name, ex);
    });
}

future<> migration_notifier::update_keyspace(const sstring& ks_name) {
    co_await on_schema_change([&] (migration_listener* listener) {
        listener->on_update_keyspace(ks_name);
    }, [&] (std::exception_ptr ex) {
        return fmt::format("Update keyspace notification failed {}: {}", ks_name, ex);
    });
}

future<> migration_notifier::update_column_family(const sstring& ks_name, const sstring& cf_name) {
    co_await on_schema_change([&] (migration_listener* listener) {
        listener->on_update_column_family(ks_name, cf_name);
    }, [&] (std::exception_ptr ex) {
        return fmt::format("Update column family notification failed {}.{}: {}", ks_name, cf_name, ex);
    });
}

future<> migration_notifier::update_user_type(const sstring& ks_name, const sstring& type_name) {
    co_await on_schema_change([&] (migration_listener* listener) {
        listener->on_update_user_type(ks_name, type_name);
    }, [&] (std::exception_ptr ex) {
        return fmt::format("Update user type notification failed {}.{}: {}", ks_name, type_name, ex);
    });
}

future<> migration_notifier::drop_keyspace(const sstring& ks_name) {
    co_await on_schema_change([&] (migration_listener* listener) {
        listener->on_drop_keyspace(ks_name);
    }, [&] (std::exception_ptr ex) {
        return fmt::format("Drop keyspace notification failed {}: {}", ks_name, ex);
    });
}

future<> migration_notifier::drop_column_family(const sstring& ks_name, const sstring& cf_name) {
    co_await on_schema_change([&] (migration_listener* listener) {
        listener->on_drop_column_family(ks_name, cf_name);
    }, [&] (std::exception_ptr ex) {
        return fmt::format("Drop column family notification failed {}.{}: {}", ks_name, cf_name, ex);
    });
}

future<> migration_notifier::drop_user_type(const sstring& ks_name, const sstring& type_name) {
    co_await on_schema_change([&] (migration_listener* listener) {
        listener->on_drop_user_type(ks_name, type_name);
    }, [&] (std::exception_ptr ex) {
        return fmt::format("Drop user type notification failed {}.{}: {}", ks_name, type_name, ex);
    });
}

}
