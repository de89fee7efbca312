// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_OID_BIT_PACKER_H_INCLUDED
#define HEADER_MODERN_OID_BIT_PACKER_H_INCLUDED

#include <modern-oid/common.h>
#include <modern-oid/errors.h>

#include <algorithm>

namespace moid {

    /// Logical fields of an object_id
    struct object_id_fields {
        /// Seconds since Unix epoch
        int32_t     timestamp;
        /// Machine discriminator, must fit in 24 bits
        uint32_t    machine;
        /// Process discriminator
        uint16_t    pid;
        /// Counter value, must fit in 24 bits
        uint32_t    increment;

        friend constexpr auto operator==(const object_id_fields & lhs, const object_id_fields & rhs) noexcept -> bool = default;
    };

    namespace impl {

        inline constexpr size_t packed_size = 12;
        inline constexpr size_t hex_length = 2 * packed_size;
        inline constexpr uint32_t max_24bit = 0x00FFFFFF;

        template<char_like C> struct hex_char_traits {
            static constexpr unsigned max = 128;

            static constexpr C l = C(u8'l');
            static constexpr C u = C(u8'u');
            static constexpr C cl_br = C(u8'}');
        };

        template<> struct hex_char_traits<char> {
            static constexpr unsigned max = ('a' == u8'a' ? 128 : 256);

            static constexpr char l = 'l';
            static constexpr char u = 'u';
            static constexpr char cl_br = '}';
        };

        template<> struct hex_char_traits<wchar_t> {
            static constexpr unsigned max = (L'a' == u8'a' ? 128 : 256);

            static constexpr wchar_t l = L'l';
            static constexpr wchar_t u = L'u';
            static constexpr wchar_t cl_br = L'}';
        };

        #define MOID_HEX_ALPHABET(...) \
                __VA_ARGS__##"0123456789abcdef" \
                __VA_ARGS__##"0123456789ABCDEF"

        template<class C, size_t N>
        static consteval auto make_reverse_hex_alphabet(const C (&chars)[N]) {
            using tr = hex_char_traits<C>;

            std::array<uint8_t, tr::max> ret;
            for (size_t i = 0; i < std::size(ret); ++i) {
                auto val = uint8_t(std::find(std::begin(chars), std::end(chars) - 1, C(i)) - std::begin(chars));
                if (val != N - 1) {
                    ret[i] = val % ((N - 1) / 2);
                } else {
                    ret[i] = (N - 1) / 2;
                }
            }
            return ret;
        }

        class hex_alphabet {
        private:
            static constexpr const char narrow[] = MOID_HEX_ALPHABET();
            static constexpr const wchar_t wide[] = MOID_HEX_ALPHABET(L);
            static constexpr const char8_t utf[] = MOID_HEX_ALPHABET(u8);

            static constexpr auto reverse_narrow = make_reverse_hex_alphabet(narrow);
            static constexpr auto reverse_wide = make_reverse_hex_alphabet(wide);
            static constexpr auto reverse_utf = make_reverse_hex_alphabet(utf);

            template<class C>
            static constexpr bool uses_utf = std::is_same_v<C, char32_t> ||
                                             std::is_same_v<C, char16_t> ||
                                             std::is_same_v<C, char8_t> ||
                                             (std::is_same_v<C, wchar_t> && L'a' == u8'a');

        public:
            static constexpr size_t size = (std::size(utf) - 1) / 2;

        public:
            template<impl::char_like C>
            static constexpr C encode(bool uppercase, uint8_t idx) noexcept {
                auto real_idx = idx + (uppercase ? size : 0);

                if constexpr (uses_utf<C>) {
                    return C(utf[real_idx]);
                } else if constexpr (std::is_same_v<C, wchar_t>) {
                    return wide[real_idx];
                } else {
                    return narrow[real_idx];
                }
            }

            /// Returns nibble value or `size` if c is not a hex digit
            template<impl::char_like C>
            static constexpr uint8_t decode(C c) noexcept {
                if constexpr (uses_utf<C>) {

                    if (unsigned(c) >= std::size(reverse_utf))
                        return size;
                    return reverse_utf[unsigned(c)];

                } else if constexpr (std::is_same_v<C, wchar_t>) {

                    if (unsigned(c) >= std::size(reverse_wide))
                        return size;
                    return reverse_wide[unsigned(c)];

                } else {

                    if ((unsigned char)(c) >= std::size(reverse_narrow))
                        return size;
                    return reverse_narrow[(unsigned char)(c)];
                }
            }
        };

        #undef MOID_HEX_ALPHABET

        template<impl::char_like T>
        constexpr bool read_hex(const T * str, uint8_t & val) noexcept {
            uint8_t ret = 0;
            for (int i = 0; i < 2; ++i) {
                T c = *str++;
                uint8_t nibble = hex_alphabet::decode(c);
                if (nibble >= hex_alphabet::size)
                    return false;
                ret = uint8_t(ret << 4) | nibble;
            }
            val = ret;
            return true;
        }

        template<impl::char_like T>
        constexpr void write_hex(uint8_t val, T * str, bool uppercase) noexcept {
            *str++ = hex_alphabet::encode<T>(uppercase, uint8_t(val >> 4));
            *str++ = hex_alphabet::encode<T>(uppercase, uint8_t(val & 0x0F));
        }

        /// Decodes exactly hex_length characters into packed_size bytes
        template<impl::char_like T>
        constexpr bool decode_hex(const T * str, std::span<uint8_t, packed_size> dest) noexcept {
            for (auto & b: dest) {
                if (!read_hex(str, b))
                    return false;
                str += 2;
            }
            return true;
        }

        template<impl::char_like T>
        constexpr void encode_hex(std::span<const uint8_t, packed_size> src, T * str, bool uppercase) noexcept {
            for (auto b: src) {
                write_hex(b, str, uppercase);
                str += 2;
            }
        }

        constexpr void check_fields(const object_id_fields & fields) {
            if ((fields.machine & ~max_24bit) != 0)
                MOID_THROW(object_id_error(errc::out_of_range, "The machine value must be between 0 and 16777215 (it must fit in 3 bytes)"));
            if ((fields.increment & ~max_24bit) != 0)
                MOID_THROW(object_id_error(errc::out_of_range, "The increment value must be between 0 and 16777215 (it must fit in 3 bytes)"));
        }

        // Big-endian read of sizeof(T) bytes
        template<impl::byte_like Byte, class T>
        constexpr const Byte * read_bytes(const Byte * bytes, T & val) noexcept {
            T tmp = uint8_t(*bytes++);
            for(unsigned i = 0; i < sizeof(T) - 1; ++i)
                tmp = T(tmp << 8) | uint8_t(*bytes++);
            val = tmp;
            return bytes;
        }

        // Big-endian write of sizeof(T) bytes
        template<impl::byte_like Byte, class T>
        constexpr Byte * write_bytes(T val, Byte * bytes) noexcept {
            bytes[sizeof(T) - 1] = Byte(static_cast<uint8_t>(val));
            if constexpr (sizeof(T) > 1) {
                for(unsigned i = 1; i != sizeof(T); ++i) {
                    val >>= 8;
                    bytes[sizeof(T) - i - 1] = Byte(static_cast<uint8_t>(val));
                }
            }
            return bytes + sizeof(T);
        }

        template<impl::byte_like Byte>
        constexpr Byte * write_u24(uint32_t val, Byte * bytes) noexcept {
            bytes[0] = Byte(uint8_t(val >> 16));
            bytes[1] = Byte(uint8_t(val >> 8));
            bytes[2] = Byte(uint8_t(val));
            return bytes + 3;
        }

        template<impl::byte_like Byte>
        constexpr const Byte * read_u24(const Byte * bytes, uint32_t & val) noexcept {
            val = (uint32_t(uint8_t(bytes[0])) << 16) | (uint32_t(uint8_t(bytes[1])) << 8) | uint8_t(bytes[2]);
            return bytes + 3;
        }

        /// Writes 12 bytes. Fields must have been validated already
        template<impl::byte_like Byte>
        constexpr void pack_unchecked(const object_id_fields & fields, Byte * dest) noexcept {
            dest = write_bytes(uint32_t(fields.timestamp), dest);
            dest = write_u24(fields.machine, dest);
            dest = write_bytes(fields.pid, dest);
            write_u24(fields.increment, dest);
        }

        template<impl::byte_like Byte>
        constexpr auto unpack_unchecked(const Byte * src) noexcept -> object_id_fields {
            object_id_fields ret;
            uint32_t timestamp;
            src = read_bytes(src, timestamp);
            ret.timestamp = int32_t(timestamp);
            src = read_u24(src, ret.machine);
            src = read_bytes(src, ret.pid);
            read_u24(src, ret.increment);
            return ret;
        }
    }

    /**
     * Packs fields into 12 big-endian bytes
     *
     * Throws object_id_error(errc::out_of_range) if machine or increment do not fit in 24 bits
     */
    constexpr auto pack(const object_id_fields & fields) -> std::array<uint8_t, impl::packed_size> {
        impl::check_fields(fields);
        std::array<uint8_t, impl::packed_size> ret;
        impl::pack_unchecked(fields, ret.data());
        return ret;
    }

    /**
     * Packs fields into the first 12 bytes of dest
     *
     * Throws object_id_error(errc::out_of_range) if machine or increment do not fit in 24 bits
     * and object_id_error(errc::invalid_length) if dest is shorter than 12 bytes
     */
    template<class Byte, size_t Extent>
    requires(impl::byte_like<Byte> && !std::is_const_v<Byte>)
    constexpr void pack(const object_id_fields & fields, std::span<Byte, Extent> dest) {
        if constexpr (Extent == std::dynamic_extent) {
            if (dest.size() < impl::packed_size)
                MOID_THROW(object_id_error(errc::invalid_length, "Destination must be at least 12 bytes long"));
        } else {
            static_assert(Extent >= impl::packed_size, "destination is too small");
        }
        impl::check_fields(fields);
        impl::pack_unchecked(fields, dest.data());
    }

    /// Packs fields into anything convertible to a span of bytes
    template<class T>
    requires( !impl::is_span<T> && requires(T & x) {
        std::span{x};
        requires impl::byte_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
    })
    constexpr void pack(const object_id_fields & fields, T & dest) {
        pack(fields, std::span{dest});
    }

    /**
     * Unpacks 12 big-endian bytes into fields
     *
     * For dynamic spans throws object_id_error(errc::invalid_length) unless the size is exactly 12
     */
    template<class Byte, size_t Extent>
    requires(impl::byte_like<std::remove_const_t<Byte>>)
    constexpr auto unpack(std::span<Byte, Extent> src) noexcept(Extent != std::dynamic_extent) -> object_id_fields {
        if constexpr (Extent == std::dynamic_extent) {
            if (src.size() != impl::packed_size)
                MOID_THROW(object_id_error(errc::invalid_length, "Byte array must be 12 bytes long"));
        } else {
            static_assert(Extent == impl::packed_size, "source must be 12 bytes");
        }
        return impl::unpack_unchecked(src.data());
    }

    /// Unpacks fields from anything convertible to a span of bytes
    template<class T>
    requires( !impl::is_span<T> && requires(const T & x) {
        std::span{x};
        requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
    })
    constexpr auto unpack(const T & src) -> object_id_fields {
        return unpack(std::span{src});
    }
}

#endif
