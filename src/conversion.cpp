// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-oid/conversion.h>

using namespace moid;

auto moid::to_string(value_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case value_kind::boolean:   return "boolean";
        case value_kind::character: return "character";
        case value_kind::int8:      return "int8";
        case value_kind::uint8:     return "uint8";
        case value_kind::int16:     return "int16";
        case value_kind::uint16:    return "uint16";
        case value_kind::int32:     return "int32";
        case value_kind::uint32:    return "uint32";
        case value_kind::int64:     return "int64";
        case value_kind::uint64:    return "uint64";
        case value_kind::float32:   return "float32";
        case value_kind::float64:   return "float64";
        case value_kind::decimal:   return "decimal";
        case value_kind::date_time: return "date_time";
        case value_kind::string:    return "string";
        case value_kind::object_id: return "object_id";
    }
    return "unknown";
}

auto moid::convert(const object_id & id, value_kind kind) -> converted_value {
    switch (kind) {
        case value_kind::object_id:
            return id;
        case value_kind::string:
            return id.to_string();
        default:
            break;
    }

    std::string message = "Cannot convert object_id to ";
    message += to_string(kind);
    MOID_THROW(object_id_error(errc::invalid_conversion, message));
}
