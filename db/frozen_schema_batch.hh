/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <limits>
#include <seastar/core/sstring.hh>

#include "seastarx.hh"
#include "db/schema_mutation.hh"
#include "serializer_impl.hh"

namespace db {

// The serialized form of a schema_mutation_batch, as it travels between
// nodes and as it is persisted.
//
// Layout (little endian):
//
//   int32  record count
//   record*:
//     uint32 record length, followed by that many bytes:
//       uint8  object kind
//       uint8  change kind
//       string keyspace
//       string name
//       int64  timestamp
//       uint32 field count
//       (string field name, optional<string> value)*
//
// string is a uint32 length followed by the bytes. optional<> is a bool
// byte followed by the value when it is engaged.
class frozen_schema_batch final {
    sstring _bytes;
public:
    frozen_schema_batch() = default;
    explicit frozen_schema_batch(sstring bytes) : _bytes(std::move(bytes)) {}

    const sstring& representation() const noexcept {
        return _bytes;
    }
    size_t size() const noexcept {
        return _bytes.size();
    }
};

frozen_schema_batch freeze(const schema_mutation_batch& batch);

// Throws corrupt_stream_exception if the declared record count is negative,
// larger than max_records or larger than the input could hold, or if a
// record is malformed. Nothing is allocated for the batch before the count
// has been checked.
schema_mutation_batch unfreeze(const frozen_schema_batch& fb,
        uint32_t max_records = std::numeric_limits<int32_t>::max());

// Size of freeze(batch), computed without serializing it.
size_t serialized_size(const schema_mutation_batch& batch);
size_t serialized_size(const schema_mutation& m);

}

namespace ser {

template <>
struct serializer<db::frozen_schema_batch> {
    template <typename Input>
    static db::frozen_schema_batch read(Input& in) {
        return db::frozen_schema_batch(deserialize(in, boost::type<sstring>()));
    }
    template <typename Output>
    static void write(Output& out, const db::frozen_schema_batch& v) {
        serialize(out, v.representation());
    }
    template <typename Input>
    static void skip(Input& in) {
        serializer<sstring>::skip(in);
    }
};

}
