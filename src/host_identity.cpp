// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "host_identity.h"

#if __has_include(<unistd.h>)
    #define HAVE_UNISTD_H 1
    #include <unistd.h>
    #include <limits.h>

#elif defined(_WIN32) || defined(_WIN64)
    #define WIN32_LEAN_AND_MEAN

    #include <Windows.h>
    #include <process.h>
#endif

#include <vector>
#include <iterator>

std::string moid::impl::get_host_name() {

#if defined(HAVE_UNISTD_H)

    #if defined(HOST_NAME_MAX)
        constexpr size_t max_len = HOST_NAME_MAX;
    #else
        constexpr size_t max_len = 255;
    #endif

    std::vector<char> buf(max_len + 1);
    if (gethostname(buf.data(), buf.size()) != 0)
        return {};
    //POSIX does not guarantee null termination on truncation
    buf.back() = 0;
    return std::string(buf.data());

#elif defined(_WIN32) || defined(_WIN64)

    char buf[MAX_COMPUTERNAME_LENGTH + 1];
    DWORD size = DWORD(std::size(buf));
    if (!GetComputerNameA(buf, &size))
        return {};
    return std::string(buf, size);

#else

    return {};

#endif
}

uint16_t moid::impl::get_process_discriminator() noexcept {

#if defined(HAVE_UNISTD_H)
    return uint16_t(getpid());
#elif defined(_WIN32) || defined(_WIN64)
    return uint16_t(_getpid());
#else
    return 0;
#endif
}
