// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_OID_RANDOM_SEED_H_INCLUDED
#define HEADER_MODERN_OID_RANDOM_SEED_H_INCLUDED

#include <cstdint>

namespace moid::impl {

    // Pseudo-random starting value for a generator counter. Never fails.
    uint32_t get_random_seed() noexcept;
}

#endif
