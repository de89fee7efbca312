// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_OID_CONVERSION_H_INCLUDED
#define HEADER_MODERN_OID_CONVERSION_H_INCLUDED

#include <modern-oid/object_id.h>

#include <variant>

namespace moid {

    /**
     * Customization point for document value types that wrap an object_id
     *
     * Specialize to derive from std::true_type for a type constructible from object_id
     * to allow convert<T>() to produce it.
     */
    template<class T>
    struct is_object_id_wrapper : std::false_type {};

    template<class T>
    inline constexpr bool is_object_id_wrapper_v = is_object_id_wrapper<T>::value;

    namespace impl {
        template<class T>
        struct is_basic_string : std::false_type {};

        template<class C, class Traits, class Alloc>
        struct is_basic_string<std::basic_string<C, Traits, Alloc>> : std::true_type {};
    }

    /// Types object_id can be converted to
    template<class T>
    concept object_id_convertible = std::is_same_v<T, object_id> ||
        (impl::is_basic_string<T>::value && impl::char_like<typename T::value_type>) ||
        (is_object_id_wrapper_v<T> && std::is_constructible_v<T, object_id>);

    /**
     * Converts object_id to one of the supported types
     *
     * Strings receive the canonical hex form. Any other target type is rejected
     * at compile time.
     */
    template<object_id_convertible T>
    auto convert(const object_id & id) -> T {
        if constexpr (std::is_same_v<T, object_id>) {
            return id;
        } else if constexpr (impl::is_basic_string<T>::value) {
            return id.to_string<typename T::value_type>();
        } else {
            return T(id);
        }
    }

    /// Kinds of values a dynamically typed collaborator may request
    enum class value_kind {
        boolean,
        character,
        int8,
        uint8,
        int16,
        uint16,
        int32,
        uint32,
        int64,
        uint64,
        float32,
        float64,
        decimal,
        date_time,
        string,
        object_id
    };

    /// Result of a dynamic conversion
    using converted_value = std::variant<object_id, std::string>;

    /**
     * Converts object_id to a value of a runtime selected kind
     *
     * Only value_kind::object_id and value_kind::string are supported. All other
     * kinds throw object_id_error(errc::invalid_conversion).
     */
    MOID_EXPORTED auto convert(const object_id & id, value_kind kind) -> converted_value;

    /// Name of a value_kind for diagnostics
    MOID_EXPORTED auto to_string(value_kind kind) noexcept -> std::string_view;
}

#endif
