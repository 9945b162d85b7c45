/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <map>
#include <string_view>
#include <vector>
#include <seastar/core/sstring.hh>
#include <fmt/format.h>

#include "seastarx.hh"
#include "data_dictionary/keyspace_element.hh"

namespace data_dictionary {

enum class column_kind { partition_key, clustering_key, static_column, regular_column };

std::string_view to_string(column_kind k);
// Throws marshal_exception on an unknown name.
column_kind column_kind_from_string(std::string_view);

struct column_definition {
    sstring name;
    sstring type;
    column_kind kind;

    bool is_primary_key() const {
        return kind == column_kind::partition_key || kind == column_kind::clustering_key;
    }
    bool operator==(const column_definition&) const = default;
};

class table_metadata final : public keyspace_element {
    sstring _ks_name;
    sstring _cf_name;
    // Ordered by kind and then by declaration order.
    std::vector<column_definition> _columns;
    std::map<sstring, sstring> _options;
public:
    table_metadata(std::string_view ks_name, std::string_view cf_name,
                 std::vector<column_definition> columns,
                 std::map<sstring, sstring> options = {});

    // Throws marshal_exception on malformed fields.
    static table_metadata from_fields(std::string_view ks_name, std::string_view cf_name, const field_map& fields);

    const sstring& ks_name() const {
        return _ks_name;
    }
    const sstring& cf_name() const {
        return _cf_name;
    }
    const std::vector<column_definition>& all_columns() const {
        return _columns;
    }
    const std::map<sstring, sstring>& options() const {
        return _options;
    }
    std::vector<column_definition> columns(column_kind kind) const;
    const column_definition* get_column_definition(std::string_view name) const;

    virtual sstring keypace_name() const override { return ks_name(); }
    virtual sstring element_name() const override { return cf_name(); }
    virtual sstring element_type() const override { return "table"; }
    virtual field_map to_fields() const override;
    virtual void validate() const override;

    // Throws exceptions::invalid_change_exception unless this definition
    // can replace `old`: the primary key is untouched, surviving columns
    // keep their type and kind, and added columns are not key columns.
    void validate_update_of(const table_metadata& old) const;

    bool operator==(const table_metadata&) const = default;
};

}

template <>
struct fmt::formatter<data_dictionary::table_metadata> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(const data_dictionary::table_metadata& t, fmt::format_context& ctx) const -> decltype(ctx.out());
};
