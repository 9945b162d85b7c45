/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <variant>

#include "gms/inet_address.hh"
#include "gms/endpoint_state.hh"

namespace gms {

// One membership feed notification. Every event carries the endpoint
// it concerns; the state snapshot is taken when the event is fired.
namespace endpoint_events {

// A previously unknown endpoint appeared on the feed.
struct join {
    inet_address endpoint;
    endpoint_state_ptr state;
};

struct alive {
    inet_address endpoint;
    endpoint_state_ptr state;
};

struct dead {
    inet_address endpoint;
    endpoint_state_ptr state;
};

// The endpoint came back with a new generation.
struct restart {
    inet_address endpoint;
    endpoint_state_ptr state;
};

struct remove {
    inet_address endpoint;
};

// Some application states of the endpoint changed; `states` holds only the
// changed ones.
struct change {
    inet_address endpoint;
    application_state_map states;
};

}

using endpoint_event = std::variant<
    endpoint_events::join,
    endpoint_events::alive,
    endpoint_events::dead,
    endpoint_events::restart,
    endpoint_events::remove,
    endpoint_events::change>;

inline inet_address event_endpoint(const endpoint_event& ev) noexcept {
    return std::visit([] (const auto& e) { return e.endpoint; }, ev);
}

} // namespace gms

template <>
struct fmt::formatter<gms::endpoint_event> : fmt::formatter<string_view> {
    auto format(const gms::endpoint_event& ev, fmt::format_context& ctx) const {
        static constexpr std::string_view names[] = {"join", "alive", "dead", "restart", "remove", "change"};
        return fmt::format_to(ctx.out(), "{}({})", names[ev.index()], gms::event_endpoint(ev));
    }
};
