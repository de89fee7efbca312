// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-oid/object_id.h>
#include <modern-oid/generator.h>

using namespace moid;

auto object_id::generate() -> object_id {
    return default_generator().generate();
}

auto object_id::generate(int32_t timestamp) -> object_id {
    return default_generator().generate(timestamp);
}

auto object_id::parse(std::string_view str) -> object_id {
    if (auto ret = object_id::from_chars(str))
        return *ret;

    std::string message;
    message.reserve(str.size() + 40);
    message += '\'';
    message += str;
    message += "' is not a valid 24 digit hex string";
    MOID_THROW(object_id_error(errc::invalid_format, message));
}
