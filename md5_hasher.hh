/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#define CRYPTOPP_ENABLE_NAMESPACE_WEAK 1

#include <array>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <cryptopp/md5.h>

class md5_hasher {
    CryptoPP::Weak::MD5 hash{};
public:
    static constexpr size_t size = CryptoPP::Weak::MD5::DIGESTSIZE;

    void update(const char* ptr, size_t length) {
        using namespace CryptoPP;
        static_assert(sizeof(char) == sizeof(byte), "Assuming lengths will be the same");
        hash.Update(reinterpret_cast<const byte*>(ptr), length * sizeof(byte));
    }

    void update(std::string_view v) {
        update(v.data(), v.size());
    }

    std::array<uint8_t, size> finalize_array() {
        std::array<uint8_t, size> array;
        hash.Final(reinterpret_cast<unsigned char*>(array.data()));
        return array;
    }
};

// Feeds integral values in a fixed byte order, so that digests do not
// depend on the host.
template <typename T>
requires std::is_integral_v<T>
inline void feed_hash(md5_hasher& h, T value) {
    uint8_t buf[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[i] = uint8_t(uint64_t(value) >> (8 * i));
    }
    h.update(reinterpret_cast<const char*>(buf), sizeof(T));
}

// Length-prefixed, so that ("ab", "c") and ("a", "bc") hash differently.
inline void feed_hash(md5_hasher& h, std::string_view v) {
    feed_hash(h, uint32_t(v.size()));
    h.update(v);
}
