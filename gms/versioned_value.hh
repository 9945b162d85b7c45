/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <seastar/core/sstring.hh>
#include <fmt/format.h>
#include "schema/schema_fwd.hh"
#include "seastarx.hh"
#include <initializer_list>
#include <optional>

namespace gms {

class version_type {
    int32_t _value = 0;
public:
    constexpr version_type() noexcept = default;
    explicit constexpr version_type(int32_t v) noexcept : _value(v) {}
    constexpr int32_t value() const noexcept { return _value; }
    version_type& operator++() noexcept { ++_value; return *this; }
    friend constexpr auto operator<=>(const version_type&, const version_type&) noexcept = default;
};

namespace version_generator {
// Versions of the states this node generates. Only used on shard 0.
version_type get_next_version() noexcept;
}

/**
 * This abstraction represents the state associated with a particular node which an
 * application wants to make available to the rest of the nodes in the cluster.
 * Whenever a piece of state needs to be disseminated to the rest of cluster wrap
 * the state in a versioned_value and add it to the gossiper.
 */
class versioned_value {
    version_type _version;
    sstring _value;
public:
    // this must be a char that cannot be present in any token
    static constexpr char DELIMITER = ',';
    static constexpr const char DELIMITER_STR[] = { DELIMITER, 0 };

    // values for application_state::STATUS
    static constexpr const char* STATUS_UNKNOWN = "UNKNOWN";
    static constexpr const char* STATUS_BOOTSTRAPPING = "BOOT";
    static constexpr const char* STATUS_NORMAL = "NORMAL";
    static constexpr const char* STATUS_LEFT = "LEFT";

    static constexpr const char* SHUTDOWN = "shutdown";

    version_type version() const noexcept { return _version; };
    const sstring& value() const noexcept { return _value; };
public:
    bool operator==(const versioned_value& other) const noexcept {
        return _version == other._version &&
               _value   == other._value;
    }

public:
    versioned_value(const sstring& value, version_type version = version_generator::get_next_version())
        : _version(version), _value(value) {
    }

    versioned_value(sstring&& value, version_type version = version_generator::get_next_version()) noexcept
        : _version(version), _value(std::move(value)) {
    }

    versioned_value() noexcept
        : _version(-1) {
    }

    static sstring version_string(const std::initializer_list<sstring>& args);

    static versioned_value clone_with_higher_version(const versioned_value& value) noexcept {
        return versioned_value(value.value());
    }

    static versioned_value bootstrapping(const sstring& tokens) {
        return versioned_value(version_string({sstring(versioned_value::STATUS_BOOTSTRAPPING), tokens}));
    }

    static versioned_value normal(const sstring& tokens) {
        return versioned_value(version_string({sstring(versioned_value::STATUS_NORMAL), tokens}));
    }

    static versioned_value left(const sstring& tokens, int64_t expire_time) {
        return versioned_value(version_string({sstring(versioned_value::STATUS_LEFT),
                                               tokens,
                                               std::to_string(expire_time)}));
    }

    static versioned_value schema(const table_schema_version& new_version) {
        return versioned_value(new_version.to_sstring());
    }

    static versioned_value tokens(const sstring& tokens) {
        return versioned_value(tokens);
    }

    static versioned_value host_id(const utils::UUID& host_id) {
        return versioned_value(host_id.to_sstring());
    }

    static versioned_value datacenter(const sstring& dc_id) {
        return versioned_value(dc_id);
    }

    static versioned_value rack(const sstring& rack_id) {
        return versioned_value(rack_id);
    }

    static versioned_value release_version();

    // Advertises the given messaging protocol version.
    static versioned_value network_version(int32_t version) {
        return versioned_value(format("{}", version));
    }

    // Reverse of network_version(); std::nullopt when the value is not an integer.
    static std::optional<int32_t> network_version_from_string(const sstring& s);

    static versioned_value rpc_ready(bool value) {
        return versioned_value(to_sstring(int(value)));
    };
}; // class versioned_value

} // namespace gms

template <>
struct fmt::formatter<gms::version_type> : fmt::formatter<string_view> {
    auto format(gms::version_type v, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", v.value());
    }
};

template <> struct fmt::formatter<gms::versioned_value> : fmt::formatter<string_view> {
    auto format(const gms::versioned_value& v, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "Value({},{})", v.value(), v.version());
    }
};
