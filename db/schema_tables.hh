/*
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <vector>

#include <seastar/core/future.hh>

#include "schema/schema_fwd.hh"
#include "db/schema_mutation.hh"
#include "db/schema_state.hh"
#include "data_dictionary/keyspace_metadata.hh"
#include "data_dictionary/table_metadata.hh"
#include "data_dictionary/user_type_metadata.hh"

namespace service {
class migration_notifier;
}

namespace db {

namespace schema_tables {

/**
 * Calculates the MD5 digest of every live definition, which is then
 * converted into a UUID acting as a content based version of the schema.
 * Timestamps and shadowed data do not take part in it, so nodes holding
 * the same definitions agree on the version whatever way they got them.
 */
table_schema_version calculate_schema_digest(const schema_state& state);

// Version of a node which holds no definition.
const table_schema_version& empty_version();

schema_object_key keyspace_key(const sstring& ks_name);
schema_object_key table_key(const sstring& ks_name, const sstring& cf_name);
schema_object_key type_key(const sstring& ks_name, const sstring& type_name);

schema_mutation make_create_keyspace_mutation(const data_dictionary::keyspace_metadata& ksm, api::timestamp_type ts);
schema_mutation make_update_keyspace_mutation(const data_dictionary::keyspace_metadata& old_ksm, const data_dictionary::keyspace_metadata& ksm, api::timestamp_type ts);
schema_mutation make_drop_keyspace_mutation(const sstring& ks_name, api::timestamp_type ts);

schema_mutation make_create_table_mutation(const data_dictionary::table_metadata& table, api::timestamp_type ts);
schema_mutation make_update_table_mutation(const data_dictionary::table_metadata& old_table, const data_dictionary::table_metadata& table, api::timestamp_type ts);
schema_mutation make_drop_table_mutation(const sstring& ks_name, const sstring& cf_name, api::timestamp_type ts);

schema_mutation make_create_type_mutation(const data_dictionary::user_type_metadata& type, api::timestamp_type ts);
schema_mutation make_update_type_mutation(const data_dictionary::user_type_metadata& old_type, const data_dictionary::user_type_metadata& type, api::timestamp_type ts);
schema_mutation make_drop_type_mutation(const sstring& ks_name, const sstring& type_name, api::timestamp_type ts);

// What a merge changed, per kind of object.
struct schema_diff {
    struct objects {
        std::vector<schema_object_key> created;
        std::vector<schema_object_key> altered;
        std::vector<schema_object_key> dropped;

        bool empty() const {
            return created.empty() && altered.empty() && dropped.empty();
        }
    };
    objects keyspaces;
    objects tables;
    objects types;

    bool empty() const {
        return keyspaces.empty() && tables.empty() && types.empty();
    }
};

using live_objects = std::map<schema_object_key, data_dictionary::field_map>;

schema_diff diff_schema(const live_objects& before, const live_objects& after);

// Creations and alterations are notified keyspaces first, then types and
// tables. Drops go the other way round, so that no listener hears about a
// keyspace being dropped before the objects it contained.
future<> notify_schema_changes(service::migration_notifier& notifier, const schema_diff& diff);

}

}
