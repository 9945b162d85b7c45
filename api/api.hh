/*
 * Copyright 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/json/json_elements.hh>
#include <seastar/http/function_handlers.hh>
#include <seastar/http/exception.hh>
#include "api/api_init.hh"
#include "seastarx.hh"

namespace api {

template<class T>
std::vector<sstring> container_to_vec(const T& container) {
    std::vector<sstring> res;
    res.reserve(std::size(container));

    for (const auto& i : container) {
        res.push_back(fmt::to_string(i));
    }
    return res;
}

inline void set_route(httpd::routes& r, httpd::operation_type method, const sstring& path, httpd::future_json_function handler) {
    r.put(method, path, new httpd::function_handler(std::move(handler)));
}

inline void unset_route(httpd::routes& r, httpd::operation_type method, const sstring& path) {
    delete r.drop(method, path);
}

}
