/*
 * Copyright (C) 2021-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <map>
#include <string_view>
#include <seastar/core/sstring.hh>
#include <fmt/format.h>

#include "seastarx.hh"
#include "data_dictionary/keyspace_element.hh"

namespace data_dictionary {

using replication_strategy_config_options = std::map<sstring, sstring>;

class keyspace_metadata final : public keyspace_element {
    sstring _name;
    sstring _strategy_name;
    replication_strategy_config_options _strategy_options;
    bool _durable_writes;
public:
    keyspace_metadata(std::string_view name,
                 std::string_view strategy_name,
                 replication_strategy_config_options strategy_options,
                 bool durable_writes = true);

    // Rebuilds a keyspace out of the fields stored for it.
    // Throws marshal_exception on malformed fields.
    static keyspace_metadata from_fields(std::string_view name, const field_map& fields);

    const sstring& name() const {
        return _name;
    }
    const sstring& strategy_name() const {
        return _strategy_name;
    }
    const replication_strategy_config_options& strategy_options() const {
        return _strategy_options;
    }
    bool durable_writes() const {
        return _durable_writes;
    }

    virtual sstring keypace_name() const override { return name(); }
    virtual sstring element_name() const override { return name(); }
    virtual sstring element_type() const override { return "keyspace"; }
    virtual field_map to_fields() const override;
    virtual void validate() const override;

    bool operator==(const keyspace_metadata&) const = default;
};

}

template <>
struct fmt::formatter<data_dictionary::keyspace_metadata> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(const data_dictionary::keyspace_metadata& ksm, fmt::format_context& ctx) const -> decltype(ctx.out());
};
