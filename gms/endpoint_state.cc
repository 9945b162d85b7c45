/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "gms/endpoint_state.hh"
#include "log.hh"
#include "marshal_exception.hh"

namespace gms {

static logging::logger logger("endpoint_state");

static_assert(std::is_nothrow_default_constructible_v<application_state_map>);

// Note: although std::unordered_map::find is not guaranteed to be noexcept
// hashing and comparing application_state cannot throw.
const versioned_value* endpoint_state::get_application_state_ptr(application_state key) const noexcept {
    auto it = _application_state.find(key);
    if (it == _application_state.end()) {
        return nullptr;
    } else {
        return &it->second;
    }
}

std::optional<int32_t> endpoint_state::get_network_version() const noexcept {
    auto* app_state = get_application_state_ptr(application_state::NET_VERSION);
    if (!app_state) {
        return std::nullopt;
    }
    return versioned_value::network_version_from_string(app_state->value());
}

std::optional<table_schema_version> endpoint_state::get_schema_version() const noexcept {
    auto* app_state = get_application_state_ptr(application_state::SCHEMA);
    if (!app_state) {
        return std::nullopt;
    }
    try {
        return table_schema_version(std::string_view(app_state->value()));
    } catch (const marshal_exception& e) {
        logger.debug("Ignoring malformed schema version {}: {}", app_state->value(), e.what());
        return std::nullopt;
    }
}

}

auto fmt::formatter<gms::endpoint_state>::format(const gms::endpoint_state& x,
                                                 fmt::format_context& ctx) const -> decltype(ctx.out()) {
    auto out = ctx.out();
    out = fmt::format_to(out, "AppStateMap =");
    for (auto& [state, value] : x._application_state) {
        out = fmt::format_to(out, " {{ {} : {} }} ", state, value);
    }
    return out;
}
