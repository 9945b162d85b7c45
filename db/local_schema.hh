/*
 * Copyright (C) 2014-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <vector>

#include <seastar/core/future.hh>

#include "seastarx.hh"
#include "schema/schema_fwd.hh"
#include "db/schema_state.hh"
#include "db/schema_storage.hh"
#include "db/schema_tables.hh"
#include "db/frozen_schema_batch.hh"

namespace db {

// The schema definitions held by this node, their version and their
// durable copy.
//
// merge() is not safe to run concurrently with itself, truncate() or
// clear(): callers serialize them (see service::migration_stage).
class local_schema {
    schema_storage& _storage;
    schema_state _state;
    table_schema_version _version;
public:
    explicit local_schema(schema_storage& storage);

    const table_schema_version& get_version() const noexcept {
        return _version;
    }
    // The version only covers live definitions, so a node which dropped
    // everything is back at the empty version as well. Its tombstones are
    // kept, a pull in that state cannot resurrect anything.
    bool has_empty_version() const noexcept {
        return _version == schema_tables::empty_version();
    }
    const schema_state& state() const noexcept {
        return _state;
    }

    std::optional<data_dictionary::keyspace_metadata> find_keyspace(const sstring& ks_name) const;
    std::optional<data_dictionary::table_metadata> find_table(const sstring& ks_name, const sstring& cf_name) const;
    std::optional<data_dictionary::user_type_metadata> find_type(const sstring& ks_name, const sstring& type_name) const;
    bool has_keyspace(const sstring& ks_name) const;

    std::vector<sstring> keyspace_names() const;
    std::vector<sstring> table_names(const sstring& ks_name) const;
    std::vector<sstring> type_names(const sstring& ks_name) const;

    // Replays the persisted batches. Does not notify anyone.
    future<> load();

    // Persists the batch, then applies it and recomputes the version.
    // A batch that changes nothing is neither persisted nor applied. If
    // persisting fails, nothing changes and the error is propagated.
    future<schema_tables::schema_diff> merge(schema_mutation_batch batch);

    // The whole state as a batch, for peers pulling from us.
    frozen_schema_batch export_schema() const;

    // Removes the persisted copy. The in-memory state is left alone.
    future<> truncate();
    // Forgets every definition and goes back to the empty version.
    void clear() noexcept;
private:
    void update_version();
    std::vector<sstring> names_in(schema_object_kind kind, const sstring& ks_name) const;
};

}
