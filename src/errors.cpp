// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-oid/errors.h>

using namespace moid;

namespace {

    class moid_category : public std::error_category {
    public:
        auto name() const noexcept -> const char * override
            { return "moid"; }

        auto message(int code) const -> std::string override {
            switch (errc(code)) {
                case errc::null_input:          return "required input is missing";
                case errc::invalid_length:      return "invalid length";
                case errc::invalid_format:      return "invalid format";
                case errc::out_of_range:        return "value out of range";
                case errc::invalid_conversion:  return "invalid conversion";
            }
            return "unknown error";
        }
    };
}

auto moid::error_category() noexcept -> const std::error_category & {
    static const moid_category category;
    return category;
}
