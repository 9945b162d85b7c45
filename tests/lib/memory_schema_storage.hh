/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <system_error>
#include <vector>

#include <seastar/core/future.hh>

#include "db/schema_storage.hh"

namespace tests {

// Keeps the appended batches in memory. Appends and truncations can be
// made to fail with EIO.
class memory_schema_storage final : public db::schema_storage {
    std::vector<db::frozen_schema_batch> _batches;
    bool _fail_appends = false;
    bool _fail_truncate = false;
    size_t _truncations = 0;
public:
    virtual future<std::vector<db::frozen_schema_batch>> load() override {
        return make_ready_future<std::vector<db::frozen_schema_batch>>(_batches);
    }
    virtual future<> append(const db::frozen_schema_batch& batch) override {
        if (_fail_appends) {
            return make_exception_future<>(std::system_error(EIO, std::system_category(), "injected append failure"));
        }
        _batches.push_back(batch);
        return make_ready_future<>();
    }
    virtual future<> truncate() override {
        if (_fail_truncate) {
            return make_exception_future<>(std::system_error(EIO, std::system_category(), "injected truncate failure"));
        }
        ++_truncations;
        _batches.clear();
        return make_ready_future<>();
    }

    void fail_appends(bool v = true) noexcept {
        _fail_appends = v;
    }
    void fail_truncate(bool v = true) noexcept {
        _fail_truncate = v;
    }
    const std::vector<db::frozen_schema_batch>& batches() const noexcept {
        return _batches;
    }
    size_t truncations() const noexcept {
        return _truncations;
    }
};

}
