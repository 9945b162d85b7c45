/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <vector>

#include <seastar/core/future.hh>

#include "seastarx.hh"
#include "db/frozen_schema_batch.hh"

namespace db {

// Durable home of the schema mutations a node has merged. I/O errors are
// reported as std::system_error (or std::filesystem::filesystem_error)
// through the returned futures.
class schema_storage {
public:
    virtual ~schema_storage() = default;

    // All batches appended since the last truncate(), in append order.
    virtual future<std::vector<frozen_schema_batch>> load() = 0;
    virtual future<> append(const frozen_schema_batch& batch) = 0;
    // Removes everything. Not atomic: a failure may leave part of the
    // batches behind.
    virtual future<> truncate() = 0;
};

// Keeps one segment file per appended batch under a directory.
class file_schema_storage final : public schema_storage {
    std::filesystem::path _dir;
    uint64_t _next_segment = 0;
    bool _initialized = false;
public:
    explicit file_schema_storage(std::filesystem::path dir);

    virtual future<std::vector<frozen_schema_batch>> load() override;
    virtual future<> append(const frozen_schema_batch& batch) override;
    virtual future<> truncate() override;

    const std::filesystem::path& directory() const noexcept {
        return _dir;
    }
private:
    future<> init();
    // Sequence numbers of the complete segments, sorted.
    future<std::vector<uint64_t>> list_segments();
    std::filesystem::path segment_path(uint64_t seq) const;
};

}
