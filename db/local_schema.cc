/*
 * Copyright (C) 2014-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/core/coroutine.hh>

#include "db/local_schema.hh"
#include "log.hh"

namespace db {

static logging::logger dblog("local_schema");

local_schema::local_schema(schema_storage& storage)
    : _storage(storage)
    , _version(schema_tables::empty_version())
{}

void local_schema::update_version() {
    _version = schema_tables::calculate_schema_digest(_state);
}

std::optional<data_dictionary::keyspace_metadata> local_schema::find_keyspace(const sstring& ks_name) const {
    auto fields = _state.find(schema_tables::keyspace_key(ks_name));
    if (!fields) {
        return std::nullopt;
    }
    return data_dictionary::keyspace_metadata::from_fields(ks_name, *fields);
}

std::optional<data_dictionary::table_metadata> local_schema::find_table(const sstring& ks_name, const sstring& cf_name) const {
    auto fields = _state.find(schema_tables::table_key(ks_name, cf_name));
    if (!fields) {
        return std::nullopt;
    }
    return data_dictionary::table_metadata::from_fields(ks_name, cf_name, *fields);
}

std::optional<data_dictionary::user_type_metadata> local_schema::find_type(const sstring& ks_name, const sstring& type_name) const {
    auto fields = _state.find(schema_tables::type_key(ks_name, type_name));
    if (!fields) {
        return std::nullopt;
    }
    return data_dictionary::user_type_metadata::from_fields(ks_name, type_name, *fields);
}

bool local_schema::has_keyspace(const sstring& ks_name) const {
    return _state.contains(schema_tables::keyspace_key(ks_name));
}

std::vector<sstring> local_schema::names_in(schema_object_kind kind, const sstring& ks_name) const {
    std::vector<sstring> names;
    for (auto& [key, fields] : _state.live_objects()) {
        if (key.kind == kind && (kind == schema_object_kind::keyspace || key.keyspace == ks_name)) {
            names.push_back(kind == schema_object_kind::keyspace ? key.keyspace : key.name);
        }
    }
    return names;
}

std::vector<sstring> local_schema::keyspace_names() const {
    return names_in(schema_object_kind::keyspace, {});
}

std::vector<sstring> local_schema::table_names(const sstring& ks_name) const {
    return names_in(schema_object_kind::table, ks_name);
}

std::vector<sstring> local_schema::type_names(const sstring& ks_name) const {
    return names_in(schema_object_kind::type, ks_name);
}

future<> local_schema::load() {
    auto batches = co_await _storage.load();
    for (auto& fb : batches) {
        _state.apply(unfreeze(fb));
    }
    update_version();
    dblog.info("Loaded {} schema batches, schema version is {}", batches.size(), _version);
}

future<schema_tables::schema_diff> local_schema::merge(schema_mutation_batch batch) {
    auto next = _state;
    next.apply(batch);
    if (next == _state) {
        dblog.debug("Schema batch of {} mutations is already applied", batch.size());
        co_return schema_tables::schema_diff{};
    }
    co_await _storage.append(freeze(batch));
    auto before = _state.live_objects();
    _state = std::move(next);
    update_version();
    dblog.debug("Merged {} schema mutations, schema version is {}", batch.size(), _version);
    co_return schema_tables::diff_schema(before, _state.live_objects());
}

frozen_schema_batch local_schema::export_schema() const {
    return freeze(_state.to_mutations());
}

future<> local_schema::truncate() {
    return _storage.truncate();
}

void local_schema::clear() noexcept {
    _state.clear();
    _version = schema_tables::empty_version();
}

}
