/*
 * Modified by ScyllaDB
 * Copyright 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "gms/application_state.hh"
#include <seastar/core/sstring.hh>
#include <map>
#include "seastarx.hh"

namespace gms {

static const std::map<application_state, sstring> application_state_names = {
    {application_state::STATUS,                 "STATUS"},
    {application_state::SCHEMA,                 "SCHEMA"},
    {application_state::DC,                     "DC"},
    {application_state::RACK,                   "RACK"},
    {application_state::RELEASE_VERSION,        "RELEASE_VERSION"},
    {application_state::NET_VERSION,            "NET_VERSION"},
    {application_state::HOST_ID,                "HOST_ID"},
    {application_state::TOKENS,                 "TOKENS"},
    {application_state::RPC_READY,              "RPC_READY"},
};

}

auto fmt::formatter<gms::application_state>::format(gms::application_state m,
                                                    fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    std::string_view name = "UNKNOWN";
    auto it = gms::application_state_names.find(m);
    if (it != gms::application_state_names.end()) {
        name = it->second;
    }
    return fmt::format_to(ctx.out(), "{}", name);
}
