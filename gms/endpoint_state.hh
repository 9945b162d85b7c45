/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <seastar/core/shared_ptr.hh>
#include <unordered_map>
#include <optional>

#include "gms/application_state.hh"
#include "gms/versioned_value.hh"
#include "schema/schema_fwd.hh"

namespace gms {

using application_state_map = std::unordered_map<application_state, versioned_value>;

/**
 * The application states a node advertises on the membership feed.
 * Any state for a given endpoint can be retrieved from this instance.
 */
class endpoint_state {
    application_state_map _application_state;

public:
    bool operator==(const endpoint_state& other) const = default;

    endpoint_state() noexcept = default;

    explicit endpoint_state(const application_state_map& application_state)
        : _application_state(application_state)
    {
    }

    const versioned_value* get_application_state_ptr(application_state key) const noexcept;

    const application_state_map& get_application_state_map() const noexcept {
        return _application_state;
    }

    void add_application_state(application_state key, versioned_value value) {
        _application_state[key] = std::move(value);
    }

public:
    std::string_view get_status() const noexcept {
        constexpr std::string_view empty;
        const auto* app_state = get_application_state_ptr(application_state::STATUS);
        if (!app_state) {
            return empty;
        }
        const std::string_view value = app_state->value();
        if (value.empty()) {
            return empty;
        }
        const auto pos = value.find(versioned_value::DELIMITER);
        // npos allowed (full value)
        return value.substr(0, pos);
    }

    bool has_tokens() const noexcept {
        const auto* app_state = get_application_state_ptr(application_state::TOKENS);
        return app_state && !app_state->value().empty();
    }

    // The integer advertised in NET_VERSION, if any.
    std::optional<int32_t> get_network_version() const noexcept;

    // The schema version advertised in SCHEMA, if any and well formed.
    std::optional<table_schema_version> get_schema_version() const noexcept;

    friend fmt::formatter<endpoint_state>;
};

using endpoint_state_ptr = lw_shared_ptr<const endpoint_state>;

inline endpoint_state_ptr make_endpoint_state_ptr(const endpoint_state& eps) {
    return make_lw_shared<endpoint_state>(eps);
}

inline endpoint_state_ptr make_endpoint_state_ptr(endpoint_state&& eps) {
    return make_lw_shared<endpoint_state>(std::move(eps));
}

} // gms

template <>
struct fmt::formatter<gms::endpoint_state> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(const gms::endpoint_state&, fmt::format_context& ctx) const -> decltype(ctx.out());
};
