/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

// This class is the parts of java.util.UUID that we need

#include <stdint.h>
#include <cassert>
#include <functional>
#include <string_view>

#include <seastar/core/sstring.hh>
#include <fmt/format.h>

#include "seastarx.hh"

namespace utils {

class UUID {
private:
    int64_t most_sig_bits;
    int64_t least_sig_bits;
public:
    constexpr UUID() noexcept : most_sig_bits(0), least_sig_bits(0) {}
    constexpr UUID(int64_t most_sig_bits, int64_t least_sig_bits) noexcept
        : most_sig_bits(most_sig_bits), least_sig_bits(least_sig_bits) {}

    // May throw marshal_exception if string is malformed.
    explicit UUID(std::string_view uuid_string);

    int64_t get_most_significant_bits() const noexcept {
        return most_sig_bits;
    }
    int64_t get_least_significant_bits() const noexcept {
        return least_sig_bits;
    }
    int version() const noexcept {
        return (most_sig_bits >> 12) & 0xf;
    }

    bool is_null() const noexcept {
        return !most_sig_bits && !least_sig_bits;
    }

    sstring to_sstring() const;

    friend bool operator==(const UUID& v1, const UUID& v2) noexcept = default;

    friend bool operator<(const UUID& v1, const UUID& v2) noexcept {
        if (v1.most_sig_bits != v2.most_sig_bits) {
            return uint64_t(v1.most_sig_bits) < uint64_t(v2.most_sig_bits);
        }
        return uint64_t(v1.least_sig_bits) < uint64_t(v2.least_sig_bits);
    }
};

UUID make_random_uuid() noexcept;

}

template<>
struct std::hash<utils::UUID> {
    size_t operator()(const utils::UUID& id) const noexcept {
        auto hilo = id.get_most_significant_bits()
                ^ id.get_least_significant_bits();
        return size_t((hilo >> 32) ^ hilo);
    }
};

template <>
struct fmt::formatter<utils::UUID> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const utils::UUID& id, FormatContext& ctx) const {
        // This matches Java's UUID.toString() actual implementation. Note that
        // that method's documentation suggest something completely different!
        return fmt::format_to(ctx.out(),
                "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                ((uint64_t)id.get_most_significant_bits() >> 32),
                ((uint64_t)id.get_most_significant_bits() >> 16 & 0xffff),
                ((uint64_t)id.get_most_significant_bits() & 0xffff),
                ((uint64_t)id.get_least_significant_bits() >> 48 & 0xffff),
                ((uint64_t)id.get_least_significant_bits() & 0xffffffffffffLL));
    }
};
