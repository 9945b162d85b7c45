/*
 * Copyright (C) 2018-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <algorithm>
#include <chrono>

#include <seastar/core/sleep.hh>

template<typename EventuallySucceedingFunction>
void eventually(EventuallySucceedingFunction&& f, size_t max_attempts = 17) {
    size_t attempts = 0;
    while (true) {
        try {
            f();
            break;
        } catch (...) {
            if (++attempts < max_attempts) {
                seastar::sleep(std::chrono::milliseconds(1 << std::min<size_t>(attempts, 8))).get();
            } else {
                throw;
            }
        }
    }
}

template<typename EventuallySucceedingFunction>
bool eventually_true(EventuallySucceedingFunction&& f) {
    const unsigned max_attempts = 17;
    unsigned attempts = 0;
    while (true) {
        if (f()) {
            return true;
        }

        if (++attempts < max_attempts) {
            seastar::sleep(std::chrono::milliseconds(1 << std::min(attempts, 8u))).get();
        } else {
            return false;
        }
    }

    return false;
}

#define REQUIRE_EVENTUALLY_EQUAL(a, b) BOOST_REQUIRE(eventually_true([&] { return a == b; }))
