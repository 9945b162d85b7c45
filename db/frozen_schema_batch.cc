/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <stdexcept>

#include <seastar/core/simple-stream.hh>

#include "db/frozen_schema_batch.hh"
#include "marshal_exception.hh"
#include "serializer_impl.hh"

namespace db {

static constexpr size_t count_size = sizeof(int32_t);
static constexpr size_t length_size = sizeof(uint32_t);

static size_t string_size(const sstring& s) {
    return length_size + s.size();
}

// Size of a record body, not counting its own length prefix.
static size_t body_size(const schema_mutation& m) {
    size_t size = sizeof(uint8_t) * 2
        + string_size(m.target.keyspace)
        + string_size(m.target.name)
        + sizeof(int64_t)
        + length_size;
    for (auto& [name, value] : m.payload) {
        size += string_size(name) + sizeof(uint8_t);
        if (value) {
            size += string_size(*value);
        }
    }
    return size;
}

size_t serialized_size(const schema_mutation& m) {
    return length_size + body_size(m);
}

size_t serialized_size(const schema_mutation_batch& batch) {
    size_t size = count_size;
    for (auto& m : batch) {
        size += serialized_size(m);
    }
    return size;
}

template <typename Output>
static void write_record(Output& out, const schema_mutation& m) {
    ser::safe_serialize_as_uint32(out, body_size(m));
    ser::serialize(out, uint8_t(m.target.kind));
    ser::serialize(out, uint8_t(m.change));
    ser::serialize(out, m.target.keyspace);
    ser::serialize(out, m.target.name);
    ser::serialize(out, int64_t(m.timestamp));
    ser::serialize(out, m.payload);
}

frozen_schema_batch freeze(const schema_mutation_batch& batch) {
    if (batch.size() > size_t(std::numeric_limits<int32_t>::max())) {
        throw std::runtime_error("Schema batch is too big for serialization");
    }
    auto size = serialized_size(batch);
    sstring bytes = uninitialized_string(size);
    seastar::simple_memory_output_stream out(bytes.data(), size);
    ser::serialize(out, int32_t(batch.size()));
    for (auto& m : batch) {
        write_record(out, m);
    }
    return frozen_schema_batch(std::move(bytes));
}

static schema_object_kind read_object_kind(seastar::simple_memory_input_stream& in) {
    auto v = ser::deserialize(in, boost::type<uint8_t>());
    if (v > uint8_t(schema_object_kind::type)) {
        throw corrupt_stream_exception(fmt::format("unknown schema object kind {}", v));
    }
    return schema_object_kind(v);
}

static schema_change_kind read_change_kind(seastar::simple_memory_input_stream& in) {
    auto v = ser::deserialize(in, boost::type<uint8_t>());
    if (v > uint8_t(schema_change_kind::drop)) {
        throw corrupt_stream_exception(fmt::format("unknown schema change kind {}", v));
    }
    return schema_change_kind(v);
}

static schema_mutation read_record(seastar::simple_memory_input_stream& in) {
    auto len = ser::deserialize(in, boost::type<uint32_t>());
    if (len > in.size()) {
        throw corrupt_stream_exception(fmt::format("record of {} bytes overruns the {} remaining", len, in.size()));
    }
    auto body = in.read_substream(len);
    schema_mutation m;
    m.target.kind = read_object_kind(body);
    m.change = read_change_kind(body);
    m.target.keyspace = ser::deserialize(body, boost::type<sstring>());
    m.target.name = ser::deserialize(body, boost::type<sstring>());
    m.timestamp = ser::deserialize(body, boost::type<int64_t>());
    m.payload = ser::deserialize(body, boost::type<schema_fields>());
    if (body.size()) {
        throw corrupt_stream_exception(fmt::format("{} unexpected bytes at the end of a record", body.size()));
    }
    return m;
}

schema_mutation_batch unfreeze(const frozen_schema_batch& fb, uint32_t max_records) {
    auto& bytes = fb.representation();
    seastar::simple_memory_input_stream in(bytes.data(), bytes.size());
    if (in.size() < count_size) {
        throw corrupt_stream_exception(fmt::format("batch of {} bytes has no record count", in.size()));
    }
    auto count = ser::deserialize(in, boost::type<int32_t>());
    if (count < 0) {
        throw corrupt_stream_exception(fmt::format("negative record count {}", count));
    }
    // Each record carries at least its length prefix.
    if (uint32_t(count) > max_records || size_t(count) * length_size > in.size()) {
        throw corrupt_stream_exception(fmt::format("implausible record count {} for {} bytes", count, in.size()));
    }
    schema_mutation_batch batch;
    batch.reserve(count);
    try {
        while (count--) {
            batch.push_back(read_record(in));
        }
    } catch (const std::out_of_range& e) {
        throw corrupt_stream_exception(e.what());
    }
    if (in.size()) {
        throw corrupt_stream_exception(fmt::format("{} unexpected bytes after the last record", in.size()));
    }
    return batch;
}

}
