/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <fmt/core.h>

namespace gms {

enum class application_state {
    STATUS = 0,
    SCHEMA,
    DC,
    RACK,
    RELEASE_VERSION,
    NET_VERSION,
    HOST_ID,
    TOKENS,
    RPC_READY,
};

}

template <>
struct fmt::formatter<gms::application_state> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(gms::application_state, fmt::format_context& ctx) const -> decltype(ctx.out());
};
