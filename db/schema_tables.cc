/*
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include <seastar/core/coroutine.hh>

#include "db/schema_tables.hh"
#include "service/migration_listener.hh"
#include "utils/UUID_gen.hh"
#include "md5_hasher.hh"
#include "log.hh"

namespace db {

namespace schema_tables {

static logging::logger slogger("schema_tables");

static void feed_hash_for_schema_digest(md5_hasher& h, const schema_object_key& key, const data_dictionary::field_map& fields) {
    feed_hash(h, uint8_t(key.kind));
    feed_hash(h, std::string_view(key.keyspace));
    feed_hash(h, std::string_view(key.name));
    feed_hash(h, uint32_t(fields.size()));
    for (auto& [name, value] : fields) {
        feed_hash(h, std::string_view(name));
        feed_hash(h, std::string_view(value));
    }
}

table_schema_version calculate_schema_digest(const schema_state& state) {
    md5_hasher hash;
    for (auto& [key, fields] : state.live_objects()) {
        feed_hash_for_schema_digest(hash, key, fields);
        if (slogger.is_enabled(logging::log_level::trace)) {
            md5_hasher h;
            feed_hash_for_schema_digest(h, key, fields);
            slogger.trace("Digest {} for {}", utils::UUID_gen::get_name_UUID(h.finalize_array()), key);
        }
    }
    return utils::UUID_gen::get_name_UUID(hash.finalize_array());
}

const table_schema_version& empty_version() {
    static const table_schema_version version = calculate_schema_digest(schema_state{});
    return version;
}

schema_object_key keyspace_key(const sstring& ks_name) {
    return schema_object_key{schema_object_kind::keyspace, ks_name, {}};
}

schema_object_key table_key(const sstring& ks_name, const sstring& cf_name) {
    return schema_object_key{schema_object_kind::table, ks_name, cf_name};
}

schema_object_key type_key(const sstring& ks_name, const sstring& type_name) {
    return schema_object_key{schema_object_kind::type, ks_name, type_name};
}

static schema_fields all_fields(const data_dictionary::field_map& fields) {
    schema_fields ret;
    for (auto& [name, value] : fields) {
        ret.emplace(name, value);
    }
    return ret;
}

// Only what changed: new or modified fields, and deletions of the fields
// the new definition no longer has.
static schema_fields changed_fields(const data_dictionary::field_map& before, const data_dictionary::field_map& after) {
    schema_fields ret;
    for (auto& [name, value] : after) {
        auto i = before.find(name);
        if (i == before.end() || i->second != value) {
            ret.emplace(name, value);
        }
    }
    for (auto& [name, value] : before) {
        if (!after.contains(name)) {
            ret.emplace(name, std::nullopt);
        }
    }
    return ret;
}

schema_mutation make_create_keyspace_mutation(const data_dictionary::keyspace_metadata& ksm, api::timestamp_type ts) {
    return schema_mutation{keyspace_key(ksm.name()), schema_change_kind::create, ts, all_fields(ksm.to_fields())};
}

schema_mutation make_update_keyspace_mutation(const data_dictionary::keyspace_metadata& old_ksm, const data_dictionary::keyspace_metadata& ksm, api::timestamp_type ts) {
    return schema_mutation{keyspace_key(ksm.name()), schema_change_kind::update, ts, changed_fields(old_ksm.to_fields(), ksm.to_fields())};
}

schema_mutation make_drop_keyspace_mutation(const sstring& ks_name, api::timestamp_type ts) {
    return schema_mutation{keyspace_key(ks_name), schema_change_kind::drop, ts, {}};
}

schema_mutation make_create_table_mutation(const data_dictionary::table_metadata& table, api::timestamp_type ts) {
    return schema_mutation{table_key(table.ks_name(), table.cf_name()), schema_change_kind::create, ts, all_fields(table.to_fields())};
}

schema_mutation make_update_table_mutation(const data_dictionary::table_metadata& old_table, const data_dictionary::table_metadata& table, api::timestamp_type ts) {
    return schema_mutation{table_key(table.ks_name(), table.cf_name()), schema_change_kind::update, ts, changed_fields(old_table.to_fields(), table.to_fields())};
}

schema_mutation make_drop_table_mutation(const sstring& ks_name, const sstring& cf_name, api::timestamp_type ts) {
    return schema_mutation{table_key(ks_name, cf_name), schema_change_kind::drop, ts, {}};
}

schema_mutation make_create_type_mutation(const data_dictionary::user_type_metadata& type, api::timestamp_type ts) {
    return schema_mutation{type_key(type.keyspace(), type.name()), schema_change_kind::create, ts, all_fields(type.to_fields())};
}

schema_mutation make_update_type_mutation(const data_dictionary::user_type_metadata& old_type, const data_dictionary::user_type_metadata& type, api::timestamp_type ts) {
    return schema_mutation{type_key(type.keyspace(), type.name()), schema_change_kind::update, ts, changed_fields(old_type.to_fields(), type.to_fields())};
}

schema_mutation make_drop_type_mutation(const sstring& ks_name, const sstring& type_name, api::timestamp_type ts) {
    return schema_mutation{type_key(ks_name, type_name), schema_change_kind::drop, ts, {}};
}

static schema_diff::objects& objects_of_kind(schema_diff& diff, schema_object_kind kind) {
    switch (kind) {
    case schema_object_kind::keyspace: return diff.keyspaces;
    case schema_object_kind::table: return diff.tables;
    case schema_object_kind::type: return diff.types;
    }
    throw std::invalid_argument(fmt::format("unknown schema object kind {}", int(kind)));
}

schema_diff diff_schema(const live_objects& before, const live_objects& after) {
    schema_diff diff;
    for (auto& [key, fields] : after) {
        auto i = before.find(key);
        if (i == before.end()) {
            objects_of_kind(diff, key.kind).created.push_back(key);
        } else if (i->second != fields) {
            objects_of_kind(diff, key.kind).altered.push_back(key);
        }
    }
    for (auto& [key, fields] : before) {
        if (!after.contains(key)) {
            objects_of_kind(diff, key.kind).dropped.push_back(key);
        }
    }
    return diff;
}

future<> notify_schema_changes(service::migration_notifier& notifier, const schema_diff& diff) {
    // notify about keyspaces
    for (auto& key : diff.keyspaces.created) {
        co_await notifier.create_keyspace(key.keyspace);
    }
    for (auto& key : diff.keyspaces.altered) {
        co_await notifier.update_keyspace(key.keyspace);
    }
    // notify about user types
    for (auto& key : diff.types.created) {
        co_await notifier.create_user_type(key.keyspace, key.name);
    }
    for (auto& key : diff.types.altered) {
        co_await notifier.update_user_type(key.keyspace, key.name);
    }
    // notify about tables
    for (auto& key : diff.tables.created) {
        co_await notifier.create_column_family(key.keyspace, key.name);
    }
    for (auto& key : diff.tables.altered) {
        co_await notifier.update_column_family(key.keyspace, key.name);
    }
    // Drops go in reverse order: tables, types, then keyspaces
    for (auto& key : diff.tables.dropped) {
        co_await notifier.drop_column_family(key.keyspace, key.name);
    }
    for (auto& key : diff.types.dropped) {
        co_await notifier.drop_user_type(key.keyspace, key.name);
    }
    for (auto& key : diff.keyspaces.dropped) {
        co_await notifier.drop_keyspace(key.keyspace);
    }
}

}

}
