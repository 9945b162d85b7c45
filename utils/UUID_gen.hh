/*
 * Copyright (C) 2015-present ScyllaDB
 *
 * Modified by ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include "UUID.hh"
#include "md5_hasher.hh"

namespace utils {

class UUID_gen {
public:
    // Builds a version 3 (name based) UUID out of an MD5 digest that the
    // caller already computed.
    static UUID get_name_UUID(const std::array<uint8_t, md5_hasher::size>& digest) noexcept {
        auto d = digest;
        d[6] &= 0x0f; // clear version
        d[6] |= 0x30; // set to version 3
        d[8] &= 0x3f; // clear variant
        d[8] |= 0x80; // set to IETF variant
        uint64_t msb = 0;
        uint64_t lsb = 0;
        for (int i = 0; i < 8; ++i) {
            msb = (msb << 8) | d[i];
        }
        for (int i = 8; i < 16; ++i) {
            lsb = (lsb << 8) | d[i];
        }
        return UUID(int64_t(msb), int64_t(lsb));
    }

    static UUID get_name_UUID(std::string_view name) {
        md5_hasher h;
        h.update(name);
        return get_name_UUID(h.finalize_array());
    }
};

}
