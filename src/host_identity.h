// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_OID_HOST_IDENTITY_H_INCLUDED
#define HEADER_MODERN_OID_HOST_IDENTITY_H_INCLUDED

#include <cstdint>
#include <string>
#include <string_view>

namespace moid::impl {

    // Empty if the host name cannot be obtained
    std::string get_host_name();

    // Low 16 bits of the process id or 0 if it cannot be obtained
    uint16_t get_process_discriminator() noexcept;

    // 32-bit FNV-1a
    constexpr uint32_t hash_name(std::string_view name) noexcept {
        uint32_t ret = 0x811C9DC5;
        for (char c: name) {
            ret ^= uint8_t(c);
            ret *= 0x01000193;
        }
        return ret;
    }
}

#endif
