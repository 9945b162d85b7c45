/*
 * Copyright (C) 2021-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "keyspace_metadata.hh"
#include "table_metadata.hh"
#include "user_type_metadata.hh"
#include "exceptions/exceptions.hh"
#include "marshal_exception.hh"
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <charconv>
#include <set>
#include <tuple>

namespace data_dictionary {

static constexpr std::string_view strategy_class_field = "strategy_class";
static constexpr std::string_view strategy_options_prefix = "strategy_options.";
static constexpr std::string_view durable_writes_field = "durable_writes";
static constexpr std::string_view column_prefix = "column.";
static constexpr std::string_view option_prefix = "option.";
static constexpr std::string_view type_field_prefix = "field.";

bool is_valid_name(std::string_view name) noexcept {
    return !name.empty() && name.size() <= max_name_length
        && std::all_of(name.begin(), name.end(), [] (char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
        });
}

static void validate_name(std::string_view what, std::string_view name) {
    if (!is_valid_name(name)) {
        throw exceptions::invalid_request_exception(fmt::format("{} name must not be empty, more than {} characters long, or contain non-alphanumeric-underscore characters (got \"{}\")",
                what, max_name_length, name));
    }
}

static std::string_view strip_prefix(std::string_view key, std::string_view prefix) {
    return key.starts_with(prefix) ? key.substr(prefix.size()) : std::string_view();
}

static uint32_t parse_index(std::string_view s, std::string_view field) {
    uint32_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        throw marshal_exception(fmt::format("invalid position \"{}\" in field {}", s, field));
    }
    return v;
}

// Splits "a:b" at the first colon.
static std::pair<std::string_view, std::string_view> split_once(std::string_view s, std::string_view field) {
    auto pos = s.find(':');
    if (pos == std::string_view::npos) {
        throw marshal_exception(fmt::format("malformed value \"{}\" in field {}", s, field));
    }
    return {s.substr(0, pos), s.substr(pos + 1)};
}

keyspace_metadata::keyspace_metadata(std::string_view name,
             std::string_view strategy_name,
             replication_strategy_config_options strategy_options,
             bool durable_writes)
    : _name{name}
    , _strategy_name{strategy_name}
    , _strategy_options{std::move(strategy_options)}
    , _durable_writes{durable_writes}
{}

keyspace_metadata keyspace_metadata::from_fields(std::string_view name, const field_map& fields) {
    sstring strategy;
    replication_strategy_config_options options;
    bool durable_writes = true;
    for (auto& [key, value] : fields) {
        if (key == strategy_class_field) {
            strategy = value;
        } else if (key == durable_writes_field) {
            if (value != "true" && value != "false") {
                throw marshal_exception(fmt::format("invalid durable_writes value \"{}\" for keyspace {}", value, name));
            }
            durable_writes = value == "true";
        } else if (auto opt = strip_prefix(key, strategy_options_prefix); !opt.empty()) {
            options.emplace(sstring(opt), value);
        } else {
            throw marshal_exception(fmt::format("unknown field {} for keyspace {}", key, name));
        }
    }
    return keyspace_metadata(name, strategy, std::move(options), durable_writes);
}

field_map keyspace_metadata::to_fields() const {
    field_map fields;
    fields.emplace(sstring(strategy_class_field), _strategy_name);
    for (auto& [k, v] : _strategy_options) {
        fields.emplace(sstring(strategy_options_prefix) + k, v);
    }
    fields.emplace(sstring(durable_writes_field), _durable_writes ? "true" : "false");
    return fields;
}

void keyspace_metadata::validate() const {
    validate_name("Keyspace", _name);
    if (_strategy_name.empty()) {
        throw exceptions::configuration_exception("Missing mandatory replication strategy class");
    }
    for (auto& [k, v] : _strategy_options) {
        if (k.empty()) {
            throw exceptions::configuration_exception(fmt::format("Empty replication option name for keyspace {}", _name));
        }
    }
}

std::string_view to_string(column_kind k) {
    switch (k) {
    case column_kind::partition_key:  return "partition_key";
    case column_kind::clustering_key: return "clustering";
    case column_kind::static_column:  return "static";
    case column_kind::regular_column: return "regular";
    }
    throw std::invalid_argument(fmt::format("unknown column kind {}", int(k)));
}

column_kind column_kind_from_string(std::string_view s) {
    if (s == "partition_key") {
        return column_kind::partition_key;
    } else if (s == "clustering") {
        return column_kind::clustering_key;
    } else if (s == "static") {
        return column_kind::static_column;
    } else if (s == "regular") {
        return column_kind::regular_column;
    }
    throw marshal_exception(fmt::format("unknown column kind \"{}\"", s));
}

table_metadata::table_metadata(std::string_view ks_name, std::string_view cf_name,
             std::vector<column_definition> columns,
             std::map<sstring, sstring> options)
    : _ks_name{ks_name}
    , _cf_name{cf_name}
    , _columns{std::move(columns)}
    , _options{std::move(options)}
{
    std::stable_sort(_columns.begin(), _columns.end(), [] (const column_definition& a, const column_definition& b) {
        return a.kind < b.kind;
    });
}

table_metadata table_metadata::from_fields(std::string_view ks_name, std::string_view cf_name, const field_map& fields) {
    // (kind, position, name) -> type
    std::map<std::tuple<column_kind, uint32_t, sstring>, sstring> columns;
    std::map<sstring, sstring> options;
    for (auto& [key, value] : fields) {
        if (auto name = strip_prefix(key, column_prefix); !name.empty()) {
            auto [kind, rest] = split_once(value, key);
            auto [pos, type] = split_once(rest, key);
            columns.emplace(std::make_tuple(column_kind_from_string(kind), parse_index(pos, key), sstring(name)), sstring(type));
        } else if (auto opt = strip_prefix(key, option_prefix); !opt.empty()) {
            options.emplace(sstring(opt), value);
        } else {
            throw marshal_exception(fmt::format("unknown field {} for table {}.{}", key, ks_name, cf_name));
        }
    }
    std::vector<column_definition> defs;
    defs.reserve(columns.size());
    for (auto& [k, type] : columns) {
        defs.push_back(column_definition{std::get<2>(k), type, std::get<0>(k)});
    }
    return table_metadata(ks_name, cf_name, std::move(defs), std::move(options));
}

std::vector<column_definition> table_metadata::columns(column_kind kind) const {
    std::vector<column_definition> ret;
    std::copy_if(_columns.begin(), _columns.end(), std::back_inserter(ret), [kind] (const column_definition& c) {
        return c.kind == kind;
    });
    return ret;
}

const column_definition* table_metadata::get_column_definition(std::string_view name) const {
    auto i = std::find_if(_columns.begin(), _columns.end(), [name] (const column_definition& c) {
        return c.name == name;
    });
    return i == _columns.end() ? nullptr : &*i;
}

field_map table_metadata::to_fields() const {
    field_map fields;
    std::map<column_kind, uint32_t> positions;
    for (auto& c : _columns) {
        auto pos = positions[c.kind]++;
        fields.emplace(sstring(column_prefix) + c.name, fmt::format("{}:{}:{}", to_string(c.kind), pos, c.type));
    }
    for (auto& [k, v] : _options) {
        fields.emplace(sstring(option_prefix) + k, v);
    }
    return fields;
}

void table_metadata::validate() const {
    validate_name("Keyspace", _ks_name);
    validate_name("Table", _cf_name);
    std::set<sstring> names;
    for (auto& c : _columns) {
        validate_name("Column", c.name);
        if (c.type.empty()) {
            throw exceptions::invalid_request_exception(fmt::format("Column {} of table {}.{} has no type", c.name, _ks_name, _cf_name));
        }
        if (!names.insert(c.name).second) {
            throw exceptions::invalid_request_exception(fmt::format("Multiple definition of identifier {}", c.name));
        }
    }
    if (columns(column_kind::partition_key).empty()) {
        throw exceptions::invalid_request_exception(fmt::format("No PRIMARY KEY specified for table {}.{} (exactly one required)", _ks_name, _cf_name));
    }
    if (!columns(column_kind::static_column).empty() && columns(column_kind::clustering_key).empty()) {
        throw exceptions::invalid_request_exception(fmt::format("Static columns are only useful (and thus allowed) if the table has at least one clustering column"));
    }
}

void table_metadata::validate_update_of(const table_metadata& old) const {
    for (auto kind : {column_kind::partition_key, column_kind::clustering_key}) {
        if (columns(kind) != old.columns(kind)) {
            throw exceptions::invalid_change_exception(fmt::format("Cannot alter PRIMARY KEY of table {}.{}", _ks_name, _cf_name));
        }
    }
    for (auto& c : _columns) {
        auto prev = old.get_column_definition(c.name);
        if (!prev) {
            if (c.is_primary_key()) {
                throw exceptions::invalid_change_exception(fmt::format("Cannot add PRIMARY KEY column {} to table {}.{}", c.name, _ks_name, _cf_name));
            }
            continue;
        }
        if (prev->kind != c.kind) {
            throw exceptions::invalid_change_exception(fmt::format("Cannot change column {} of table {}.{} from {} to {}",
                    c.name, _ks_name, _cf_name, to_string(prev->kind), to_string(c.kind)));
        }
        if (prev->type != c.type) {
            throw exceptions::invalid_change_exception(fmt::format("Cannot change the type of column {} of table {}.{} from {} to {}",
                    c.name, _ks_name, _cf_name, prev->type, c.type));
        }
    }
}

user_type_metadata::user_type_metadata(std::string_view keyspace, std::string_view name, std::vector<field> fields)
    : _keyspace{keyspace}
    , _name{name}
    , _fields{std::move(fields)}
{}

user_type_metadata user_type_metadata::from_fields(std::string_view keyspace, std::string_view name, const field_map& fields) {
    std::map<std::pair<uint32_t, sstring>, sstring> ordered;
    for (auto& [key, value] : fields) {
        auto field_name = strip_prefix(key, type_field_prefix);
        if (field_name.empty()) {
            throw marshal_exception(fmt::format("unknown field {} for type {}.{}", key, keyspace, name));
        }
        auto [pos, type] = split_once(value, key);
        ordered.emplace(std::make_pair(parse_index(pos, key), sstring(field_name)), sstring(type));
    }
    std::vector<field> ret;
    ret.reserve(ordered.size());
    for (auto& [k, type] : ordered) {
        ret.emplace_back(k.second, type);
    }
    return user_type_metadata(keyspace, name, std::move(ret));
}

field_map user_type_metadata::to_fields() const {
    field_map ret;
    for (uint32_t i = 0; i < _fields.size(); ++i) {
        ret.emplace(sstring(type_field_prefix) + _fields[i].first, fmt::format("{}:{}", i, _fields[i].second));
    }
    return ret;
}

void user_type_metadata::validate() const {
    validate_name("Keyspace", _keyspace);
    validate_name("Type", _name);
    if (_fields.empty()) {
        throw exceptions::invalid_request_exception(fmt::format("Type {}.{} must have at least one field", _keyspace, _name));
    }
    std::set<sstring> names;
    for (auto& [name, type] : _fields) {
        validate_name("Field", name);
        if (type.empty()) {
            throw exceptions::invalid_request_exception(fmt::format("Field {} of type {}.{} has no type", name, _keyspace, _name));
        }
        if (!names.insert(name).second) {
            throw exceptions::invalid_request_exception(fmt::format("Duplicate field name {} in type {}", name, _name));
        }
    }
}

void user_type_metadata::validate_update_of(const user_type_metadata& old) const {
    if (_fields.size() < old._fields.size()
            || !std::equal(old._fields.begin(), old._fields.end(), _fields.begin())) {
        throw exceptions::invalid_change_exception(fmt::format("Cannot update type {}.{}: fields can only be added, existing fields must keep their name, position and type",
                _keyspace, _name));
    }
}

}

auto fmt::formatter<data_dictionary::keyspace_metadata>::format(const data_dictionary::keyspace_metadata& m, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "KSMetaData{{name={}, strategyClass={}, strategyOptions={}, durable_writes={}}}",
            m.name(), m.strategy_name(), m.strategy_options(), m.durable_writes());
}

auto fmt::formatter<data_dictionary::table_metadata>::format(const data_dictionary::table_metadata& t, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    auto out = fmt::format_to(ctx.out(), "table{{ks={}, cf={}, columns=[", t.ks_name(), t.cf_name());
    bool first = true;
    for (auto& c : t.all_columns()) {
        out = fmt::format_to(out, "{}{} {} {}", first ? "" : ", ", c.name, c.type, data_dictionary::to_string(c.kind));
        first = false;
    }
    return fmt::format_to(out, "], options={}}}", t.options());
}

auto fmt::formatter<data_dictionary::user_type_metadata>::format(const data_dictionary::user_type_metadata& t, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    auto out = fmt::format_to(ctx.out(), "type{{ks={}, name={}, fields=[", t.keyspace(), t.name());
    bool first = true;
    for (auto& [name, type] : t.fields()) {
        out = fmt::format_to(out, "{}{} {}", first ? "" : ", ", name, type);
        first = false;
    }
    return fmt::format_to(out, "]}}");
}
