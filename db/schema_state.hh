/*
 * Copyright (C) 2016-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <map>
#include <optional>

#include "db/schema_mutation.hh"
#include "data_dictionary/keyspace_element.hh"

namespace db {

struct schema_cell {
    api::timestamp_type timestamp = api::missing_timestamp;
    // Disengaged for a deleted field.
    std::optional<sstring> value;

    bool operator==(const schema_cell&) const = default;
};

// Everything that was ever written about one schema object.
struct schema_row {
    // Timestamp of the latest create, if any.
    api::timestamp_type marker = api::missing_timestamp;
    // Timestamp of the latest drop, if any.
    api::timestamp_type tombstone = api::missing_timestamp;
    std::map<sstring, schema_cell> cells;

    bool operator==(const schema_row&) const = default;
};

// The merged set of schema definitions held by a node.
//
// Merging is last-write-wins per field: a create writes the row marker and
// its fields, an update writes its fields, a drop writes a row tombstone
// which also shadows every table and type of a dropped keyspace that is
// not newer than it. Applying the same mutations in any order, any number
// of times, yields the same state.
class schema_state {
public:
    using rows_type = std::map<schema_object_key, schema_row>;
private:
    rows_type _rows;
public:
    void apply(const schema_mutation& m);
    void apply(const schema_mutation_batch& batch);

    // Returns the live fields of an object, or nothing if the object does
    // not exist.
    std::optional<data_dictionary::field_map> find(const schema_object_key& key) const;
    bool contains(const schema_object_key& key) const;

    // All live objects with their live fields.
    std::map<schema_object_key, data_dictionary::field_map> live_objects() const;

    // A batch which, applied to an empty state, reproduces this state.
    schema_mutation_batch to_mutations() const;

    // The highest timestamp written to any object, or missing_timestamp
    // when nothing was ever written.
    api::timestamp_type newest_timestamp() const noexcept;

    const rows_type& rows() const noexcept {
        return _rows;
    }
    bool empty() const noexcept {
        return _rows.empty();
    }
    void clear() noexcept {
        _rows.clear();
    }

    bool operator==(const schema_state&) const = default;
private:
    api::timestamp_type shadowing_tombstone(const schema_object_key& key, const schema_row& row) const;
    bool is_live(const schema_object_key& key, const schema_row& row) const;
    data_dictionary::field_map live_fields(const schema_object_key& key, const schema_row& row) const;
};

}
