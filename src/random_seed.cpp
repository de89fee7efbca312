// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "random_seed.h"

#include <random>
#include <chrono>
#include <exception>

uint32_t moid::impl::get_random_seed() noexcept {

    try {
        std::random_device rd;
        std::uniform_int_distribution<uint32_t> distrib;
        return distrib(rd);
    } catch (std::exception &) {
        //random_device is allowed to throw if no entropy source is available
    }

    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return uint32_t(now) ^ uint32_t(uint64_t(now) >> 32);
}
