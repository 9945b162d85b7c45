/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>
#include <charconv>

#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/util/file.hh>

#include "db/schema_storage.hh"
#include "log.hh"

static logging::logger slogger("schema_storage");

namespace db {

static constexpr std::string_view segment_prefix = "schema-";
static constexpr std::string_view segment_suffix = ".bin";
static constexpr std::string_view tmp_suffix = ".tmp";

// Returns the sequence number of a segment file name, if it is one.
static std::optional<uint64_t> parse_segment_name(std::string_view name) {
    if (!name.starts_with(segment_prefix) || !name.ends_with(segment_suffix)) {
        return std::nullopt;
    }
    auto digits = name.substr(segment_prefix.size(), name.size() - segment_prefix.size() - segment_suffix.size());
    uint64_t seq = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), seq);
    if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return seq;
}

file_schema_storage::file_schema_storage(std::filesystem::path dir)
    : _dir(std::move(dir))
{}

std::filesystem::path file_schema_storage::segment_path(uint64_t seq) const {
    return _dir / fmt::format("{}{:020}{}", segment_prefix, seq, segment_suffix);
}

future<std::vector<uint64_t>> file_schema_storage::list_segments() {
    std::vector<uint64_t> segments;
    std::vector<sstring> leftovers;
    auto dir = co_await open_directory(_dir.native());
    std::exception_ptr ex;
    try {
        co_await dir.list_directory([&] (directory_entry de) {
            std::string_view name = de.name;
            if (auto seq = parse_segment_name(name)) {
                segments.push_back(*seq);
            } else if (name.starts_with(segment_prefix) && name.ends_with(tmp_suffix)) {
                leftovers.push_back(de.name);
            }
            return make_ready_future<>();
        }).done();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await dir.close();
    if (ex) {
        std::rethrow_exception(ex);
    }
    // Segments that were not completely written before a crash.
    for (auto& name : leftovers) {
        slogger.info("Removing incomplete schema segment {}", _dir / name.c_str());
        co_await remove_file((_dir / name.c_str()).native());
    }
    std::sort(segments.begin(), segments.end());
    co_return segments;
}

future<> file_schema_storage::init() {
    if (_initialized) {
        co_return;
    }
    co_await recursive_touch_directory(_dir.native());
    auto segments = co_await list_segments();
    _next_segment = segments.empty() ? 0 : segments.back() + 1;
    _initialized = true;
}

future<std::vector<frozen_schema_batch>> file_schema_storage::load() {
    co_await init();
    std::vector<frozen_schema_batch> batches;
    auto segments = co_await list_segments();
    batches.reserve(segments.size());
    for (auto seq : segments) {
        auto data = co_await util::read_entire_file_contiguous(segment_path(seq));
        batches.emplace_back(std::move(data));
    }
    slogger.info("Loaded {} schema segments from {}", batches.size(), _dir);
    co_return batches;
}

future<> file_schema_storage::append(const frozen_schema_batch& batch) {
    co_await init();
    auto seq = _next_segment++;
    auto path = segment_path(seq);
    auto tmp = path.native() + std::string(tmp_suffix);
    auto f = co_await open_file_dma(tmp, open_flags::wo | open_flags::create | open_flags::truncate);
    auto out = co_await make_file_output_stream(std::move(f));
    std::exception_ptr ex;
    try {
        co_await out.write(batch.representation().data(), batch.size());
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        std::rethrow_exception(ex);
    }
    co_await rename_file(tmp, path.native());
    co_await sync_directory(_dir.native());
    slogger.debug("Appended schema segment {} ({} bytes)", path, batch.size());
}

future<> file_schema_storage::truncate() {
    co_await init();
    auto segments = co_await list_segments();
    for (auto seq : segments) {
        co_await remove_file(segment_path(seq).native());
    }
    co_await sync_directory(_dir.native());
    _next_segment = 0;
    slogger.info("Removed {} schema segments from {}", segments.size(), _dir);
}

}
