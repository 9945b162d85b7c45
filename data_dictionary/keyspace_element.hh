/*
 * Copyright (C) 2022-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <map>
#include <string_view>
#include <seastar/core/sstring.hh>

namespace data_dictionary {

// The flat form in which a definition travels inside a schema mutation:
// field name -> value.
using field_map = std::map<seastar::sstring, seastar::sstring>;

// Identifiers are limited to this many characters.
constexpr size_t max_name_length = 48;

bool is_valid_name(std::string_view name) noexcept;

/**
 * `keyspace_element` is a common interface used to describe elements of keyspace.
 *
 * Currently the elements of keyspace are:
 * - the keyspace itself
 * - user-defined types
 * - tables
*/
class keyspace_element {
public:
    virtual ~keyspace_element() = default;

    virtual seastar::sstring keypace_name() const = 0;
    virtual seastar::sstring element_name() const = 0;
    virtual seastar::sstring element_type() const = 0;

    // Serialize the definition into its field form.
    virtual field_map to_fields() const = 0;

    // Throws exceptions::invalid_request_exception or
    // exceptions::configuration_exception if the definition is not
    // structurally valid.
    virtual void validate() const = 0;
};

}
