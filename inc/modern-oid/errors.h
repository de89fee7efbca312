// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_OID_ERRORS_H_INCLUDED
#define HEADER_MODERN_OID_ERRORS_H_INCLUDED

#include <modern-oid/common.h>

#include <system_error>
#include <type_traits>

namespace moid {

    /// Error conditions reported by this library
    enum class errc {
        /// A required buffer or string was not supplied
        null_input = 1,
        /// A byte buffer is not exactly 12 bytes or a destination is too small
        invalid_length,
        /// A string is not 24 hex digits
        invalid_format,
        /// Machine or increment exceed 24 bits or a time point is outside of 32-bit seconds range
        out_of_range,
        /// The requested conversion is not supported for object_id
        invalid_conversion
    };

    /// Category for moid::errc error codes
    MOID_EXPORTED auto error_category() noexcept -> const std::error_category &;

    inline auto make_error_code(errc e) noexcept -> std::error_code {
        return std::error_code(static_cast<int>(e), error_category());
    }

    /**
     * Exception thrown by all throwing operations of this library
     *
     * The code() is always in moid::error_category()
     */
    class object_id_error : public std::system_error {
    public:
        object_id_error(errc e):
            std::system_error(make_error_code(e))
        {}
        object_id_error(errc e, const std::string & what):
            std::system_error(make_error_code(e), what)
        {}
        object_id_error(errc e, const char * what):
            std::system_error(make_error_code(e), what)
        {}
    };
}

template<>
struct std::is_error_code_enum<moid::errc> : std::true_type {};

#endif
