/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "UUID.hh"

#include <random>
#include <charconv>

#include "marshal_exception.hh"

namespace utils {

UUID make_random_uuid() noexcept {
    static thread_local std::mt19937_64 engine(std::random_device().operator()());
    static thread_local std::uniform_int_distribution<int64_t> dist;
    int64_t msb, lsb;
    msb = dist(engine);
    lsb = dist(engine);
    msb &= ~uint64_t(0x0f << 12);
    msb |= 0x4 << 12; // version 4
    lsb &= ~(uint64_t(0x3) << 62);
    lsb |= uint64_t(0x2) << 62; // IETF variant
    return UUID(msb, lsb);
}

sstring UUID::to_sstring() const {
    return fmt::to_string(*this);
}

static uint64_t parse_hex_group(std::string_view s) {
    uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 16);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
        throw marshal_exception(fmt::format("invalid UUID group: '{}'", s));
    }
    return v;
}

UUID::UUID(std::string_view uuid) {
    // 8-4-4-4-12
    if (uuid.size() != 36 || uuid[8] != '-' || uuid[13] != '-' || uuid[18] != '-' || uuid[23] != '-') {
        throw marshal_exception(fmt::format("invalid UUID: '{}'", uuid));
    }
    most_sig_bits = (parse_hex_group(uuid.substr(0, 8)) << 32)
            | (parse_hex_group(uuid.substr(9, 4)) << 16)
            | parse_hex_group(uuid.substr(14, 4));
    least_sig_bits = (parse_hex_group(uuid.substr(19, 4)) << 48)
            | parse_hex_group(uuid.substr(24, 12));
}

}
