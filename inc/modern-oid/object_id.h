// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_OID_OBJECT_ID_H_INCLUDED
#define HEADER_MODERN_OID_OBJECT_ID_H_INCLUDED

#include <modern-oid/common.h>
#include <modern-oid/errors.h>
#include <modern-oid/bit_packer.h>

namespace moid {

    namespace impl {
        template<class Duration>
        constexpr auto to_timestamp(std::chrono::time_point<std::chrono::system_clock, Duration> when) -> int32_t {
            auto secs = std::chrono::floor<std::chrono::seconds>(when).time_since_epoch().count();
            if (secs < std::numeric_limits<int32_t>::min() || secs > std::numeric_limits<int32_t>::max())
                MOID_THROW(object_id_error(errc::out_of_range, "The time point must be representable as 32-bit seconds since Unix epoch"));
            return int32_t(secs);
        }
    }

    /**
     * A 12-byte identifier made of a timestamp, machine and process discriminators and a counter
     *
     * Binary layout is big-endian: 4 bytes of timestamp, 3 bytes of machine,
     * 2 bytes of pid and 3 bytes of increment.
     */
    class object_id {
    public:
        /// Whether to print object_id in lower or upper case
        enum format {
            lowercase,
            uppercase
        };

        /// Number of bytes in binary representation
        static constexpr size_t byte_length = impl::packed_size;
        /// Number of characters in string representation
        static constexpr size_t char_length = impl::hex_length;

        /// Creation time as reported by creation_time()
        using time_point_t = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

    private:
        constexpr void assign(const object_id_fields & fields) noexcept {
            this->m_a = uint32_t(fields.timestamp);
            this->m_b = (fields.machine << 8) | (uint32_t(fields.pid) >> 8);
            this->m_c = (uint32_t(fields.pid & 0xFF) << 24) | fields.increment;
        }

        template<impl::byte_like Byte>
        constexpr void assign(const Byte * src) noexcept {
            src = impl::read_bytes(src, this->m_a);
            src = impl::read_bytes(src, this->m_b);
            impl::read_bytes(src, this->m_c);
        }

        template<impl::byte_like Byte>
        constexpr void write(Byte * dest) const noexcept {
            dest = impl::write_bytes(this->m_a, dest);
            dest = impl::write_bytes(this->m_b, dest);
            impl::write_bytes(this->m_c, dest);
        }

    public:
        ///Constructs an empty object_id with all fields zero
        constexpr object_id() noexcept = default;

        ///Constructs object_id from a string literal
        template<impl::char_like T>
        consteval object_id(const T (&src)[object_id::char_length + 1]) noexcept {
            std::array<uint8_t, byte_length> buf{};
            if (!impl::decode_hex(src, buf) || src[object_id::char_length] != 0)
                impl::invalid_constexpr_call("invalid object_id string");
            this->assign(buf.data());
        }

        /// Constructs object_id from a span of 12 byte-like objects
        template<class Byte>
        requires(impl::byte_like<std::remove_const_t<Byte>>)
        constexpr object_id(std::span<Byte, object_id::byte_length> src) noexcept {
            this->assign(src.data());
        }

        /// Constructs object_id from anything convertible to a span of 12 byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
            requires decltype(std::span{x})::extent == object_id::byte_length;
        })
        constexpr object_id(const T & src) noexcept:
            object_id{std::span{src}}
        {}

        /**
         * Constructs object_id from its fields
         *
         * Throws object_id_error(errc::out_of_range) if machine or increment do not fit in 24 bits
         */
        constexpr object_id(int32_t timestamp, uint32_t machine, uint16_t pid, uint32_t increment):
            object_id(object_id_fields{timestamp, machine, pid, increment})
        {}

        /// Constructs object_id from a fields struct
        constexpr explicit object_id(const object_id_fields & fields) {
            impl::check_fields(fields);
            this->assign(fields);
        }

        /**
         * Constructs object_id from a time point and the rest of the fields
         *
         * The time point is rounded down to whole seconds. In addition to field
         * checks throws object_id_error(errc::out_of_range) if it is outside of
         * the 32-bit seconds range.
         */
        template<class Duration>
        constexpr object_id(std::chrono::time_point<std::chrono::system_clock, Duration> when,
                            uint32_t machine, uint16_t pid, uint32_t increment):
            object_id(impl::to_timestamp(when), machine, pid, increment)
        {}

        /// Returns the empty object_id
        static constexpr object_id empty() noexcept
            { return object_id(); }

        /**
         * Constructs object_id from a span of bytes
         *
         * Throws object_id_error(errc::invalid_length) unless the span is exactly 12 bytes
         */
        template<class Byte, size_t Extent>
        requires(impl::byte_like<std::remove_const_t<Byte>>)
        static constexpr auto from_bytes(std::span<Byte, Extent> src) -> object_id {
            if (src.size() != byte_length)
                MOID_THROW(object_id_error(errc::invalid_length, "Byte array must be 12 bytes long"));
            object_id ret;
            ret.assign(src.data());
            return ret;
        }

        /**
         * Constructs object_id from 12 bytes starting at offset in a span
         *
         * Throws object_id_error(errc::invalid_length) if fewer than 12 bytes are available
         */
        template<class Byte, size_t Extent>
        requires(impl::byte_like<std::remove_const_t<Byte>>)
        static constexpr auto from_bytes(std::span<Byte, Extent> src, size_t offset) -> object_id {
            if (offset > src.size() || src.size() - offset < byte_length)
                MOID_THROW(object_id_error(errc::invalid_length, "Not enough bytes in source buffer"));
            object_id ret;
            ret.assign(src.data() + offset);
            return ret;
        }

        /**
         * Constructs object_id from a pointer and size
         *
         * Throws object_id_error(errc::null_input) if data is nullptr
         */
        template<impl::byte_like Byte>
        static constexpr auto from_bytes(const Byte * data, size_t size) -> object_id {
            if (!data)
                MOID_THROW(object_id_error(errc::null_input, "bytes"));
            return from_bytes(std::span<const Byte>(data, size));
        }

        /// Constructs object_id from anything convertible to a span of bytes
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        static constexpr auto from_bytes(const T & src) -> object_id
            { return from_bytes(std::span{src}); }

        /// Constructs object_id from anything convertible to a span of bytes, starting at offset
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        static constexpr auto from_bytes(const T & src, size_t offset) -> object_id
            { return from_bytes(std::span{src}, offset); }

        /// Generates a new object_id using the current time and the default generator
        MOID_EXPORTED static auto generate() -> object_id;
        /// Generates a new object_id with a given timestamp using the default generator
        MOID_EXPORTED static auto generate(int32_t timestamp) -> object_id;
        /// Generates a new object_id with a given time using the default generator
        template<class Duration>
        static auto generate(std::chrono::time_point<std::chrono::system_clock, Duration> when) -> object_id
            { return generate(impl::to_timestamp(when)); }

        /// Seconds since Unix epoch
        constexpr auto timestamp() const noexcept -> int32_t
            { return int32_t(this->m_a); }

        /// Machine discriminator
        constexpr auto machine() const noexcept -> uint32_t
            { return (this->m_b >> 8) & impl::max_24bit; }

        /// Process discriminator
        constexpr auto pid() const noexcept -> uint16_t
            { return uint16_t(((this->m_b << 8) & 0xFF00) | ((this->m_c >> 24) & 0x00FF)); }

        /// Counter value
        constexpr auto increment() const noexcept -> uint32_t
            { return this->m_c & impl::max_24bit; }

        /// All fields at once
        constexpr auto fields() const noexcept -> object_id_fields
            { return {this->timestamp(), this->machine(), this->pid(), this->increment()}; }

        /// Unix epoch plus timestamp() seconds
        constexpr auto creation_time() const noexcept -> time_point_t
            { return time_point_t(std::chrono::seconds(this->timestamp())); }

        /// Three way comparison by timestamp, then machine and pid, then increment
        constexpr auto compare(const object_id & other) const noexcept -> std::strong_ordering
            { return *this <=> other; }

        constexpr friend auto operator==(const object_id & lhs, const object_id & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const object_id & lhs, const object_id & rhs) noexcept -> std::strong_ordering = default;

        /// Returns the 12 byte big-endian representation
        constexpr auto to_bytes() const noexcept -> std::array<uint8_t, object_id::byte_length> {
            std::array<uint8_t, byte_length> ret;
            this->write(ret.data());
            return ret;
        }

        /**
         * Writes the 12 byte representation into dest starting at offset
         *
         * Throws object_id_error(errc::invalid_length) if there is not enough room
         */
        template<class Byte, size_t Extent>
        requires(impl::byte_like<Byte> && !std::is_const_v<Byte>)
        constexpr void to_bytes(std::span<Byte, Extent> dest, size_t offset = 0) const {
            if (offset > dest.size() || dest.size() - offset < byte_length)
                MOID_THROW(object_id_error(errc::invalid_length, "Not enough room in destination buffer"));
            this->write(dest.data() + offset);
        }

        /// Writes the 12 byte representation into anything convertible to a span of bytes
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        })
        constexpr void to_bytes(T & dest, size_t offset = 0) const {
            this->to_bytes(std::span{dest}, offset);
        }

        /**
         * Writes the 12 byte representation into a buffer of a given size
         *
         * Throws object_id_error(errc::null_input) if dest is nullptr
         */
        template<impl::byte_like Byte>
        constexpr void to_bytes(Byte * dest, size_t size, size_t offset = 0) const {
            if (!dest)
                MOID_THROW(object_id_error(errc::null_input, "destination"));
            this->to_bytes(std::span<Byte>(dest, size), offset);
        }

        /**
         * Parses object_id from a span of characters
         *
         * The span must contain exactly 24 hex digits in any case.
         */
        template<impl::char_like T, size_t Extent>
        static constexpr std::optional<object_id> from_chars(std::span<const T, Extent> src) noexcept {
            if (src.size() != object_id::char_length)
                return std::nullopt;
            std::array<uint8_t, byte_length> buf{};
            if (!impl::decode_hex(src.data(), buf))
                return std::nullopt;
            return object_id(buf);
        }

        template<impl::char_like T, size_t Extent>
        static constexpr std::optional<object_id> from_chars(std::span<T, Extent> src) noexcept
            { return object_id::from_chars(std::span<const T, Extent>(src)); }

        /// Parses object_id from a null terminated character array
        template<impl::char_like T, size_t N>
        static constexpr std::optional<object_id> from_chars(const T (&src)[N]) noexcept {
            size_t len = (N > 0 && src[N - 1] == 0) ? N - 1 : N;
            return object_id::from_chars(std::span<const T>(src, len));
        }

        /// Parses object_id from anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && !std::is_array_v<T> && requires(const T & x) {
            std::span{x};
            requires impl::char_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        static constexpr auto from_chars(const T & src) noexcept
            { return object_id::from_chars(std::span{src}); }

        /**
         * Parses object_id from a string
         *
         * Throws object_id_error(errc::invalid_format) if the string is not 24 hex digits
         */
        MOID_EXPORTED static auto parse(std::string_view str) -> object_id;

        /**
         * Parses object_id from a null terminated string
         *
         * Throws object_id_error(errc::null_input) if str is nullptr
         */
        static auto parse(const char * str) -> object_id {
            if (!str)
                MOID_THROW(object_id_error(errc::null_input, "value"));
            return object_id::parse(std::string_view(str));
        }

        /// Formats object_id into a span of characters
        template<impl::char_like T, size_t Extent>
        [[nodiscard]]
        constexpr auto to_chars(std::span<T, Extent> dest, format fmt = lowercase) const noexcept ->
            std::conditional_t<Extent == std::dynamic_extent, bool, void> {

            if constexpr (Extent == std::dynamic_extent) {
                if (dest.size() < object_id::char_length)
                    return false;
            } else {
                static_assert(Extent >= object_id::char_length, "destination is too small");
            }

            auto bytes = this->to_bytes();
            impl::encode_hex(std::span<const uint8_t, byte_length>(bytes), dest.data(), fmt == uppercase);

            if constexpr (Extent == std::dynamic_extent)
                return true;
        }

        /// Formats object_id into anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        })
        [[nodiscard]]
        constexpr auto to_chars(T & dest, format fmt = lowercase) const noexcept {
            return this->to_chars(std::span{dest}, fmt);
        }

        /// Returns a character array with formatted object_id
        template<impl::char_like T = char>
        constexpr auto to_chars(format fmt = lowercase) const noexcept -> std::array<T, object_id::char_length> {
            std::array<T, object_id::char_length> ret;
            this->to_chars(ret, fmt);
            return ret;
        }

        template<impl::char_like T = char>
    #if __cpp_lib_constexpr_string >= 201907L
        constexpr
    #endif
        /// Returns a string with formatted object_id
        auto to_string(format fmt = lowercase) const -> std::basic_string<T>
        {
            std::basic_string<T> ret(object_id::char_length, T(0));
            (void)this->to_chars(ret, fmt);
            return ret;
        }

        /// Prints object_id into an ostream
        template<impl::char_like T>
        friend std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, const object_id val) {
            const auto flags = str.flags();
            const object_id::format fmt = (flags & std::ios_base::uppercase ? object_id::uppercase : object_id::lowercase);
            std::array<T, object_id::char_length> buf;
            val.to_chars(buf, fmt);
            std::copy(buf.begin(), buf.end(), std::ostreambuf_iterator<T>(str));
            return str;
        }

        /// Reads object_id from an istream
        template<impl::char_like T>
        friend std::basic_istream<T> & operator>>(std::basic_istream<T> & str, object_id & val) {
            std::array<T, object_id::char_length> buf;
            auto * strbuf = str.rdbuf();
            for(T & c: buf) {
                auto res = strbuf->sbumpc();
                if (res == std::char_traits<T>::eof()) {
                    str.setstate(std::ios_base::eofbit | std::ios_base::failbit);
                    return str;
                }
                c = T(res);
            }
            if (auto maybe_val = object_id::from_chars(buf))
                val = *maybe_val;
            else
                str.setstate(std::ios_base::failbit);
            return str;
        }

        /// Returns hash code for the object_id
        friend constexpr size_t hash_value(const object_id & val) noexcept {
            size_t ret = 17;
            ret = impl::hash_combine(ret, size_t(val.m_a));
            ret = impl::hash_combine(ret, size_t(val.m_b));
            ret = impl::hash_combine(ret, size_t(val.m_c));
            return ret;
        }

    private:
        // a = timestamp, b = machine << 8 | pid high byte, c = pid low byte << 24 | increment
        uint32_t m_a = 0;
        uint32_t m_b = 0;
        uint32_t m_c = 0;
    };

    static_assert(sizeof(object_id) == 12);

    namespace impl {
        template<class Derived, class CharT>
        struct object_id_formatter_base {
            object_id::format fmt = object_id::lowercase;

            template<class ParseContext>
            constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator {
                using tr = hex_char_traits<CharT>;

                auto it = ctx.begin();
                while(it != ctx.end()) {
                    if (*it == tr::l) {
                        this->fmt = object_id::lowercase; ++it;
                    } else if (*it == tr::u) {
                        this->fmt = object_id::uppercase; ++it;
                    } else if (*it == tr::cl_br) {
                        break;
                    } else {
                        static_cast<Derived *>(this)->raise_exception("Invalid format args");
                    }
                }
                return it;
            }

            template <typename FormatContext>
            auto format(object_id val, FormatContext & ctx) const -> decltype(ctx.out()) {
                std::array<CharT, object_id::char_length> buf;
                val.to_chars(buf, this->fmt);
                return std::copy(buf.begin(), buf.end(), ctx.out());
            }
        };
    }
}

/// std::hash specialization for object_id
template<>
struct std::hash<moid::object_id> {

    constexpr size_t operator()(const moid::object_id & val) const noexcept {
        return hash_value(val);
    }
};


#if MOID_SUPPORTS_STD_FORMAT

/// object_id formatter for std::format
template<class CharT>
struct std::formatter<::moid::object_id, CharT> :
    public ::moid::impl::object_id_formatter_base<std::formatter<::moid::object_id, CharT>, CharT>
{
    [[noreturn]] void raise_exception(const char * message) {
        MOID_THROW(std::format_error(message));
    }
};

#endif

#if MOID_SUPPORTS_FMT_FORMAT

/// object_id formatter for fmt::format
template<class CharT>
struct fmt::formatter<::moid::object_id, CharT> :
    public ::moid::impl::object_id_formatter_base<fmt::formatter<::moid::object_id, CharT>, CharT>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif

#endif
