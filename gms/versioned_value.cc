/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include <seastar/core/on_internal_error.hh>
#include <seastar/core/shard_id.hh>

#include "gms/versioned_value.hh"
#include "version.hh"
#include "log.hh"

#include <fmt/ranges.h>
#include <charconv>

namespace gms {

namespace version_generator {

static version_type version;

static logging::logger logger("version_generator");

version_type get_next_version() noexcept
{
    if (this_shard_id() != 0) [[unlikely]] {
        on_fatal_internal_error(logger, format(
                "{} can only be called on shard 0, but it was called on shard {}",
                __FUNCTION__, this_shard_id()));
    }
    return ++version;
}

}

static_assert(std::is_nothrow_default_constructible_v<versioned_value>);
static_assert(std::is_nothrow_move_constructible_v<versioned_value>);

sstring versioned_value::version_string(const std::initializer_list<sstring>& args) {
    return fmt::to_string(fmt::join(args, std::string_view(versioned_value::DELIMITER_STR)));
}

versioned_value versioned_value::release_version() {
    return versioned_value(version::release());
}

std::optional<int32_t> versioned_value::network_version_from_string(const sstring& s) {
    int32_t v;
    const char* const end = s.data() + s.size();
    auto r = std::from_chars(s.data(), end, v);
    if (r.ec != std::errc() || r.ptr != end) {
        return std::nullopt;
    }
    return v;
}

}
