/*
 * Copyright (C) 2016-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>

#include "db/schema_state.hh"

namespace db {

// Reconciles two versions of a field: the newer write wins; on a timestamp
// tie a deletion wins over a value and a larger value wins over a smaller
// one.
static bool supersedes(const schema_cell& a, const schema_cell& b) {
    if (a.timestamp != b.timestamp) {
        return a.timestamp > b.timestamp;
    }
    if (!a.value || !b.value) {
        return !a.value && b.value;
    }
    return *a.value > *b.value;
}

void schema_state::apply(const schema_mutation& m) {
    auto& row = _rows[m.target];
    switch (m.change) {
    case schema_change_kind::create:
        row.marker = std::max(row.marker, m.timestamp);
        break;
    case schema_change_kind::update:
        break;
    case schema_change_kind::drop:
        row.tombstone = std::max(row.tombstone, m.timestamp);
        return;
    }
    for (auto& [name, value] : m.payload) {
        schema_cell cell{m.timestamp, value};
        auto [it, inserted] = row.cells.try_emplace(name, cell);
        if (!inserted && supersedes(cell, it->second)) {
            it->second = std::move(cell);
        }
    }
}

void schema_state::apply(const schema_mutation_batch& batch) {
    for (auto& m : batch) {
        apply(m);
    }
}

api::timestamp_type schema_state::newest_timestamp() const noexcept {
    auto t = api::missing_timestamp;
    for (auto& [key, row] : _rows) {
        t = std::max({t, row.marker, row.tombstone});
        for (auto& [name, cell] : row.cells) {
            t = std::max(t, cell.timestamp);
        }
    }
    return t;
}

api::timestamp_type schema_state::shadowing_tombstone(const schema_object_key& key, const schema_row& row) const {
    auto t = row.tombstone;
    if (key.kind != schema_object_kind::keyspace) {
        auto ks = _rows.find(schema_object_key{schema_object_kind::keyspace, key.keyspace, {}});
        if (ks != _rows.end()) {
            t = std::max(t, ks->second.tombstone);
        }
    }
    return t;
}

bool schema_state::is_live(const schema_object_key& key, const schema_row& row) const {
    return row.marker != api::missing_timestamp && row.marker > shadowing_tombstone(key, row);
}

data_dictionary::field_map schema_state::live_fields(const schema_object_key& key, const schema_row& row) const {
    data_dictionary::field_map fields;
    auto t = shadowing_tombstone(key, row);
    for (auto& [name, cell] : row.cells) {
        if (cell.value && cell.timestamp > t) {
            fields.emplace(name, *cell.value);
        }
    }
    return fields;
}

std::optional<data_dictionary::field_map> schema_state::find(const schema_object_key& key) const {
    auto i = _rows.find(key);
    if (i == _rows.end() || !is_live(key, i->second)) {
        return std::nullopt;
    }
    return live_fields(key, i->second);
}

bool schema_state::contains(const schema_object_key& key) const {
    auto i = _rows.find(key);
    return i != _rows.end() && is_live(key, i->second);
}

std::map<schema_object_key, data_dictionary::field_map> schema_state::live_objects() const {
    std::map<schema_object_key, data_dictionary::field_map> ret;
    for (auto& [key, row] : _rows) {
        if (is_live(key, row)) {
            ret.emplace(key, live_fields(key, row));
        }
    }
    return ret;
}

schema_mutation_batch schema_state::to_mutations() const {
    schema_mutation_batch batch;
    for (auto& [key, row] : _rows) {
        // Fields grouped by the timestamp they were written at. Those
        // written at the marker timestamp travel with the create.
        std::map<api::timestamp_type, schema_fields> by_timestamp;
        for (auto& [name, cell] : row.cells) {
            by_timestamp[cell.timestamp].emplace(name, cell.value);
        }
        if (row.marker != api::missing_timestamp) {
            auto i = by_timestamp.find(row.marker);
            schema_fields payload;
            if (i != by_timestamp.end()) {
                payload = std::move(i->second);
                by_timestamp.erase(i);
            }
            batch.push_back(schema_mutation{key, schema_change_kind::create, row.marker, std::move(payload)});
        }
        for (auto& [ts, payload] : by_timestamp) {
            batch.push_back(schema_mutation{key, schema_change_kind::update, ts, std::move(payload)});
        }
        if (row.tombstone != api::missing_timestamp) {
            batch.push_back(schema_mutation{key, schema_change_kind::drop, row.tombstone, {}});
        }
    }
    return batch;
}

}
