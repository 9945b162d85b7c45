/*
 * Copyright (C) 2016-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <tuple>
#include <vector>

#include <seastar/core/sstring.hh>
#include <fmt/format.h>

#include "seastarx.hh"
#include "timestamp.hh"

namespace db {

enum class schema_object_kind : uint8_t {
    keyspace,
    table,
    type,
};

enum class schema_change_kind : uint8_t {
    create,
    update,
    drop,
};

// Identifies one schema object. `name` is empty for a keyspace.
struct schema_object_key {
    schema_object_kind kind;
    sstring keyspace;
    sstring name;

    bool operator==(const schema_object_key&) const = default;
    bool operator<(const schema_object_key& o) const {
        return std::tie(kind, keyspace, name) < std::tie(o.kind, o.keyspace, o.name);
    }
};

// Field values of a definition. A disengaged value deletes the field.
using schema_fields = std::map<sstring, std::optional<sstring>>;

// One create, update or drop of a keyspace, table or type. Mutations
// merge per field, with the highest timestamp winning, so applying them
// is idempotent and commutative.
struct schema_mutation {
    schema_object_key target;
    schema_change_kind change;
    api::timestamp_type timestamp;
    schema_fields payload;

    bool operator==(const schema_mutation&) const = default;
};

using schema_mutation_batch = std::vector<schema_mutation>;

}

template <>
struct fmt::formatter<db::schema_object_kind> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(db::schema_object_kind k, FormatContext& ctx) const {
        string_view name = "unknown";
        switch (k) {
        case db::schema_object_kind::keyspace: name = "keyspace"; break;
        case db::schema_object_kind::table: name = "table"; break;
        case db::schema_object_kind::type: name = "type"; break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<db::schema_change_kind> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(db::schema_change_kind k, FormatContext& ctx) const {
        string_view name = "unknown";
        switch (k) {
        case db::schema_change_kind::create: name = "create"; break;
        case db::schema_change_kind::update: name = "update"; break;
        case db::schema_change_kind::drop: name = "drop"; break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<db::schema_object_key> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const db::schema_object_key& k, FormatContext& ctx) const {
        if (k.kind == db::schema_object_kind::keyspace) {
            return fmt::format_to(ctx.out(), "{} {}", k.kind, k.keyspace);
        }
        return fmt::format_to(ctx.out(), "{} {}.{}", k.kind, k.keyspace, k.name);
    }
};

template <>
struct fmt::formatter<db::schema_mutation> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const db::schema_mutation& m, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{{{} {} at {}, {} fields}}", m.change, m.target, m.timestamp, m.payload.size());
    }
};
