/*
 * Copyright (C) 2014-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <string_view>
#include <utility>
#include <vector>
#include <seastar/core/sstring.hh>
#include <fmt/format.h>

#include "seastarx.hh"
#include "data_dictionary/keyspace_element.hh"

namespace data_dictionary {

class user_type_metadata final : public keyspace_element {
public:
    // (field name, field type), in declaration order
    using field = std::pair<sstring, sstring>;
private:
    sstring _keyspace;
    sstring _name;
    std::vector<field> _fields;
public:
    user_type_metadata(std::string_view keyspace, std::string_view name, std::vector<field> fields);

    // Throws marshal_exception on malformed fields.
    static user_type_metadata from_fields(std::string_view keyspace, std::string_view name, const field_map& fields);

    const sstring& keyspace() const {
        return _keyspace;
    }
    const sstring& name() const {
        return _name;
    }
    const std::vector<field>& fields() const {
        return _fields;
    }

    virtual sstring keypace_name() const override { return keyspace(); }
    virtual sstring element_name() const override { return name(); }
    virtual sstring element_type() const override { return "type"; }
    virtual field_map to_fields() const override;
    virtual void validate() const override;

    // A type can only grow: existing fields must be kept, in order and
    // with their types. Throws exceptions::invalid_change_exception.
    void validate_update_of(const user_type_metadata& old) const;

    bool operator==(const user_type_metadata&) const = default;
};

}

template <>
struct fmt::formatter<data_dictionary::user_type_metadata> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(const data_dictionary::user_type_metadata& t, fmt::format_context& ctx) const -> decltype(ctx.out());
};
