#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstring>
#include <exception>
#include <functional>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "nbt_log.hpp"

#ifdef _MSC_VER
#include <intrin.h>
#define nbt_bswap16( v ) ( _byteswap_ushort( v ) )
#define nbt_bswap32( v ) ( _byteswap_ulong( v ) )
#define nbt_bswap64( v ) ( _byteswap_uint64( v ) )
#elif defined(__GNUC__) || defined(__clang__)
#define nbt_bswap16( v ) ( __builtin_bswap16( v ) )
#define nbt_bswap32( v ) ( __builtin_bswap32( v ) )
#define nbt_bswap64( v ) ( __builtin_bswap64( v ) )
#endif

/*
 * NBT is big-endian on the wire. Host values are converted on the way in and out of the stream.
 */
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
#define nbt_be16( v ) ( v )
#define nbt_be32( v ) ( v )
#define nbt_be64( v ) ( v )
#else
#define nbt_be16( v ) ( nbt_bswap16( v ) )
#define nbt_be32( v ) ( nbt_bswap32( v ) )
#define nbt_be64( v ) ( nbt_bswap64( v ) )
#endif

#ifndef NBT_WRITER_INITIAL_CAPACITY
#define NBT_WRITER_INITIAL_CAPACITY 1024
#endif

namespace nbt
{
    using nbt_u32 = unsigned int;
    using nbt_u64 = unsigned long long;

    using nbt_i32 = signed int;
    using nbt_i64 = signed long long;

    using nbt_u16 = unsigned short;
    using nbt_i16 = signed short;

    using nbt_u8 = unsigned char;
    using nbt_i8 = signed char;

    static_assert(
        sizeof( nbt_u32 ) == 4,
        "incorrectly sized `int` type."
    );

    static_assert(
        sizeof( nbt_u64 ) == 8,
        "incorrectly sized `unsigned long long` type."
    );

    static_assert(
        sizeof( nbt_u16 ) == 2,
        "incorrectly sized `unsigned short` type."
    );

    static_assert(
        sizeof( float ) == 4 && sizeof( double ) == 8,
        "IEEE-754 binary32/binary64 floating point types are required."
    );

    using Bytes = std::vector< nbt_u8 >;

    enum class ErrorKind : nbt_u32
    {
        InvalidArgument,
        Format,
        Truncated,
        StringTooLong,
        DecompressorUnavailable,
        Decompression
    };

    inline const char *error_kind_name( const ErrorKind kind )
    {
        switch ( kind )
        {
        case ErrorKind::InvalidArgument:
            return "invalid argument";
        case ErrorKind::Format:
            return "format violation";
        case ErrorKind::Truncated:
            return "truncated input";
        case ErrorKind::StringTooLong:
            return "string too long";
        case ErrorKind::DecompressorUnavailable:
            return "decompressor unavailable";
        case ErrorKind::Decompression:
            return "decompression failed";
        }

        return "unknown error";
    }

    /**
     * @brief Every failure raised by the codec. `kind( )` tells the caller which class of failure occurred.
     */
    class Error : public std::runtime_error
    {
    public:
        Error( const ErrorKind kind, const std::string &message )
            : std::runtime_error( message ), kind_( kind )
        {
        }

        ErrorKind kind( ) const noexcept
        {
            return kind_;
        }

    private:
        ErrorKind kind_;
    };
}

/*
 * Note: `StreamWriter` owns its buffer and grows it on demand, `StreamReader` never owns the memory it reads.
 * The caller must keep the source of a `StreamReader` alive for as long as the reader is in use.
 *
 * Usage:
 *  1) Write: construct a `StreamWriter`, write values, fetch the written region through `data( )`;
 *  2) Read: construct a `StreamReader` over a byte range, read values in the order they were written;
 *  3) Either cursor may be moved with `set_position( )` to reread, skip or overwrite.
 *
 *  Notes:
 *      1) Not thread safe. Each stream belongs to exactly one caller at a time;
 *      2) Reads past the end raise `nbt::Error` (`ErrorKind::Truncated`). Define `NBT_UNSAFE` to remove the check.
 */

namespace nbt::stream
{
    struct StreamWriter
    {
    private:
        Bytes buffer_;
        std::size_t position_ { 0 };

    public:
        explicit StreamWriter( const std::size_t initial_capacity = NBT_WRITER_INITIAL_CAPACITY )
            : buffer_( initial_capacity ? initial_capacity : 1, 0 )
        {
        }

        /* Disallow copies. */
        StreamWriter( const StreamWriter &other ) = delete;
        StreamWriter &operator=( const StreamWriter &other ) = delete;

        /**
         * @brief Current cursor position.
         * @return std::size_t
         */
        std::size_t position( ) const
        {
            return position_;
        }

        /**
         * @brief Move the cursor. Moving past the end is allowed, the gap is zero filled by the next write.
         * @param position New cursor position
         */
        void set_position( const std::size_t position )
        {
            position_ = position;
        }

        /**
         * @brief Allocated length of the buffer. Always at least `position( )` once something was written.
         * @return std::size_t
         */
        std::size_t capacity( ) const
        {
            return buffer_.size ( );
        }

        /**
         * @brief Make sure `count` bytes fit at the cursor. The buffer length is doubled until it does.
         * @remark Existing bytes are kept and everything past the old length, including a gap left by
         * `set_position( )`, is zero.
         * @param count Number of bytes about to be written
         */
        void accommodate( const std::size_t count )
        {
            const auto required = position_ + count;

            if ( buffer_.size ( ) >= required )
                return;

            auto length = buffer_.size ( );

            while ( length < required )
                length *= 2;

            buffer_.resize( length, nbt_u8 { 0 } );
        }

        /**
         * @brief Write a plain old data (POD) value to the byte stream and advance the internal cursor.
         * @tparam Ty Plain old data (POD) type. The value is copied in host byte order.
         * @param value Value to write to the stream.
         */
        template < typename Ty >
        void write_pod( const Ty value )
        {
            write( sizeof( Ty ), reinterpret_cast< const nbt_u8* >( &value ) );
        }

        StreamWriter &write_u8( const nbt_u8 value )
        {
            write_pod< nbt_u8 >( value );
            return *this;
        }

        StreamWriter &write_u16( const nbt_u16 value )
        {
            write_pod< nbt_u16 >( value );
            return *this;
        }

        StreamWriter &write_u32( const nbt_u32 value )
        {
            write_pod< nbt_u32 >( value );
            return *this;
        }

        StreamWriter &write_u64( const nbt_u64 value )
        {
            write_pod< nbt_u64 >( value );
            return *this;
        }

        /**
         * @brief Write `count` bytes from `src` and advance the internal cursor by the same amount.
         * @param count Size, in bytes, of the data pointed to by `src`.
         * @param src Buffer containing at least `count` bytes.
         * @return StreamWriter&
         */
        StreamWriter &write( const std::size_t count, const nbt_u8 *src )
        {
            accommodate( count );

            if ( count )
                std::memcpy( buffer_.data ( ) + position_, src, count );

            position_ += count;

            return *this;
        }

        /**
         * @brief Copy of the written region `[0, position( ))`. Never includes the unused capacity.
         * @return Bytes
         */
        Bytes data( )
        {
            /* make sure the cursor is inside the buffer */
            accommodate( 0 );

            return Bytes( buffer_.begin ( ), buffer_.begin ( ) + static_cast< std::ptrdiff_t >( position_ ) );
        }
    };

    struct StreamReader
    {
    private:
        const nbt_u8 *buffer_ { nullptr };
        std::size_t stream_size_ { 0 };
        std::size_t position_ { 0 };

    public:
        explicit StreamReader( const nbt_u8 *buffer = nullptr, const std::size_t stream_size = 0 )
            : buffer_( buffer ), stream_size_( stream_size )
        {
            if ( !buffer_ && stream_size_ )
                throw Error( ErrorKind::InvalidArgument, "stream reader: null buffer with non-zero size" );
        }

        /* Disallow copies. */
        StreamReader( const StreamReader &other ) = delete;
        StreamReader &operator=( const StreamReader &other ) = delete;

        std::size_t position( ) const
        {
            return position_;
        }

        void set_position( const std::size_t position )
        {
            position_ = position;
        }

        /**
         * @brief Total size of the stream. Does not take into account the current cursor position.
         * @return std::size_t
         */
        std::size_t stream_size( ) const
        {
            return stream_size_;
        }

        /**
         * @brief Bytes left between the cursor and the end of the stream. Zero once the cursor is past the end.
         * @return std::size_t
         */
        std::size_t remaining( ) const
        {
            return position_ < stream_size_ ? stream_size_ - position_ : 0;
        }

        /**
         * @brief Claim `count` bytes at the cursor and advance past them.
         * @remark Define `NBT_UNSAFE` to remove the overflow check.
         * @param count Number of bytes to claim
         * @return Pointer to the first claimed byte
         */
        const nbt_u8 *consume( const std::size_t count )
        {
#ifndef NBT_UNSAFE
            if ( count > remaining ( ) )
            {
                throw Error(
                    ErrorKind::Truncated,
                    "stream reader: " + std::to_string( count ) + " byte(s) requested at offset " +
                    std::to_string( position_ ) + " of a " + std::to_string( stream_size_ ) + " byte stream"
                );
            }
#endif

            const auto read_pos = buffer_ + position_;

            position_ += count;

            return read_pos;
        }

    private:
        /**
         * @brief Read a plain old data (POD) value from the byte stream in host byte order.
         * @param peek Read the data without advancing the cursor
         * @return Ty
         */
        template < typename Ty >
        Ty _read_pod( const bool peek = false )
        {
            Ty pod { };

            const auto saved = position_;

            std::memcpy( &pod, consume( sizeof( Ty ) ), sizeof( Ty ) );

            if ( peek )
                position_ = saved;

            return pod;
        }

    public:
        nbt_u8 read_u8( )
        {
            return _read_pod< nbt_u8 > ( );
        }

        nbt_u16 read_u16( )
        {
            return _read_pod< nbt_u16 > ( );
        }

        nbt_u32 read_u32( )
        {
            return _read_pod< nbt_u32 > ( );
        }

        nbt_u64 read_u64( )
        {
            return _read_pod< nbt_u64 > ( );
        }

        /**
         * @brief Read an unsigned byte from the stream without advancing the cursor.
         * @return nbt_u8
         */
        nbt_u8 peek_u8( )
        {
            return _read_pod< nbt_u8 >( true );
        }

        /**
         * @brief Copy `count` bytes from the stream into `dst` and advance the internal cursor by the same amount.
         * @param count Number of bytes to copy.
         * @param dst Buffer of at least `count` bytes.
         * @return StreamReader&
         */
        StreamReader &read( const std::size_t count, nbt_u8 *dst )
        {
            const auto src = consume( count );

            if ( count )
                std::memcpy( dst, src, count );

            return *this;
        }
    };
}

/*
 * Code points in, UTF-8 bytes out and back again. Decoding is lenient: a byte that does not start a complete
 * sequence is dropped and decoding resumes at the next byte.
 */

namespace nbt::utf8
{
    /**
     * @brief Encode code points as UTF-8. Values at or above 0x10000 use the 4 byte form.
     * @param text Code points to encode
     * @return std::string holding the encoded bytes
     */
    inline std::string encode( const std::u32string_view text )
    {
        std::string out;
        out.reserve( text.size ( ) );

        for ( const auto cp : text )
        {
            const auto c = static_cast< nbt_u32 >( cp );

            if ( c < 0x80 )
            {
                out.push_back( static_cast< char >( c ) );
            }
            else if ( c < 0x800 )
            {
                out.push_back( static_cast< char >( 0xC0 | c >> 6 ) );
                out.push_back( static_cast< char >( 0x80 | ( c & 0x3F ) ) );
            }
            else if ( c < 0x10000 )
            {
                out.push_back( static_cast< char >( 0xE0 | c >> 12 ) );
                out.push_back( static_cast< char >( 0x80 | ( ( c >> 6 ) & 0x3F ) ) );
                out.push_back( static_cast< char >( 0x80 | ( c & 0x3F ) ) );
            }
            else
            {
                out.push_back( static_cast< char >( 0xF0 | ( ( c >> 18 ) & 0x07 ) ) );
                out.push_back( static_cast< char >( 0x80 | ( ( c >> 12 ) & 0x3F ) ) );
                out.push_back( static_cast< char >( 0x80 | ( ( c >> 6 ) & 0x3F ) ) );
                out.push_back( static_cast< char >( 0x80 | ( c & 0x3F ) ) );
            }
        }

        return out;
    }

    /**
     * @brief Decode UTF-8 bytes into code points, skipping bytes that do not form a complete sequence.
     * @remark Surrogate code points encoded as 3 byte sequences are kept as they are.
     * @param data First byte of the input
     * @param size Number of bytes in `data`
     * @return std::u32string
     */
    inline std::u32string decode( const nbt_u8 *data, const std::size_t size )
    {
        std::u32string out;
        out.reserve( size );

        const auto continuation = [ & ]( const std::size_t index )
        {
            return ( data[ index ] & 0xC0 ) == 0x80;
        };

        std::size_t i = 0;

        while ( i < size )
        {
            const nbt_u32 lead = data[ i ];

            if ( ( lead & 0x80 ) == 0 )
            {
                out.push_back( static_cast< char32_t >( lead ) );
                i += 1;
            }
            else if ( i + 1 < size && ( lead & 0xE0 ) == 0xC0 && continuation( i + 1 ) )
            {
                out.push_back( static_cast< char32_t >(
                    ( ( lead & 0x1F ) << 6 ) |
                    ( data[ i + 1 ] & 0x3Fu )
                ) );
                i += 2;
            }
            else if ( i + 2 < size && ( lead & 0xF0 ) == 0xE0 && continuation( i + 1 ) && continuation( i + 2 ) )
            {
                out.push_back( static_cast< char32_t >(
                    ( ( lead & 0x0F ) << 12 ) |
                    ( ( data[ i + 1 ] & 0x3Fu ) << 6 ) |
                    ( data[ i + 2 ] & 0x3Fu )
                ) );
                i += 3;
            }
            else if ( i + 3 < size && ( lead & 0xF8 ) == 0xF0 && continuation( i + 1 ) && continuation( i + 2 ) && continuation( i + 3 ) )
            {
                out.push_back( static_cast< char32_t >(
                    ( ( lead & 0x07 ) << 18 ) |
                    ( ( data[ i + 1 ] & 0x3Fu ) << 12 ) |
                    ( ( data[ i + 2 ] & 0x3Fu ) << 6 ) |
                    ( data[ i + 3 ] & 0x3Fu )
                ) );
                i += 4;
            }
            else
            {
                i += 1;
            }
        }

        return out;
    }

    inline std::u32string decode( const std::string_view bytes )
    {
        return decode( reinterpret_cast< const nbt_u8* >( bytes.data ( ) ), bytes.size ( ) );
    }

    /**
     * @brief Decode then re-encode, dropping every byte that is not part of a well-formed sequence.
     * @return std::string
     */
    inline std::string sanitize( const nbt_u8 *data, const std::size_t size )
    {
        return encode( decode( data, size ) );
    }
}

namespace nbt
{
    namespace value_limits
    {
        //  ( 2^16 ) - 1
        constexpr std::size_t StringMax = 65535;

        //  ( 2^31 ) - 1
        constexpr std::size_t ArrayMax = 2147483647;
    }

    enum class TagKind : nbt_u8
    {
        End       = 0,
        Byte      = 1,
        Short     = 2,
        Int       = 3,
        Long      = 4,
        Float     = 5,
        Double    = 6,
        ByteArray = 7,
        String    = 8,
        List      = 9,
        Compound  = 10,
        IntArray  = 11,
        LongArray = 12
    };

    constexpr std::size_t tag_kind_count = 13;

    namespace detail
    {
        constexpr std::array< std::string_view, tag_kind_count > tag_kind_names { {
            "end",
            "byte",
            "short",
            "int",
            "long",
            "float",
            "double",
            "byteArray",
            "string",
            "list",
            "compound",
            "intArray",
            "longArray"
        } };

        /* Smallest payload each kind can occupy on the wire, used to reject impossible element counts early. */
        constexpr std::array< std::size_t, tag_kind_count > min_payload_size { {
            0, /* end */
            1, /* byte */
            2, /* short */
            4, /* int */
            8, /* long */
            4, /* float */
            8, /* double */
            4, /* byteArray: count */
            2, /* string: length */
            5, /* list: kind + count */
            1, /* compound: end marker */
            4, /* intArray: count */
            4  /* longArray: count */
        } };
    }

    /**
     * @brief Check whether a raw kind byte read from the wire names one of the 13 known kinds.
     * @param raw Kind byte
     * @return bool
     */
    constexpr bool is_valid_tag_kind( const nbt_u8 raw )
    {
        return raw < tag_kind_count;
    }

    constexpr nbt_u8 tag_kind_code( const TagKind kind )
    {
        return static_cast< nbt_u8 >( kind );
    }

    /**
     * @brief Name of a kind as used in tag listings, e.g. `byteArray` for `TagKind::ByteArray`.
     * @param kind Tag kind
     * @return std::string_view, `"unknown"` for out of range values
     */
    inline std::string_view tag_kind_name( const TagKind kind )
    {
        const auto code = tag_kind_code( kind );

        return is_valid_tag_kind( code ) ? detail::tag_kind_names[ code ] : std::string_view( "unknown" );
    }

    /**
     * @brief Reverse lookup of `tag_kind_name`.
     * @param name Kind name, case sensitive
     * @return The kind, or `std::nullopt` if `name` is not a kind name
     */
    inline std::optional< TagKind > tag_kind_from_name( const std::string_view name )
    {
        for ( std::size_t index = 0; index < tag_kind_count; index++ )
        {
            if ( detail::tag_kind_names[ index ] == name )
                return static_cast< TagKind >( index );
        }

        return std::nullopt;
    }

    class Tag;

    using ByteArray = std::vector< nbt_i8 >;
    using IntArray = std::vector< nbt_i32 >;
    using LongArray = std::vector< nbt_i64 >;

    /**
     * @brief Homogeneous sequence of tags. Every element must be of `kind`; an empty list conventionally uses `TagKind::End`.
     */
    struct List
    {
        TagKind kind { TagKind::End };
        std::vector< Tag > values;

        List( ) = default;
        explicit List( TagKind kind, std::vector< Tag > values = { } );

        bool operator==( const List &other ) const;
        bool operator!=( const List &other ) const;
    };

    /**
     * @brief Insertion ordered key to tag mapping.
     * @remark Assigning an existing key replaces the value but keeps the position of the first insertion.
     * Equality ignores order, encoding follows it.
     */
    class Compound
    {
    public:
        using Entry = std::pair< std::string, Tag >;
        using const_iterator = std::vector< Entry >::const_iterator;

        Compound( ) = default;
        Compound( std::initializer_list< Entry > entries );

        /**
         * @brief Insert `value` under `key`, replacing any previous value for the same key.
         * @return `true` if the key was new, `false` if an existing value was replaced
         */
        bool set( std::string key, Tag value );

        const Tag *find( std::string_view key ) const;
        Tag *find( std::string_view key );

        /**
         * @brief Value stored under `key`.
         * @remark Raises `nbt::Error` (`ErrorKind::InvalidArgument`) if there is no such key.
         */
        const Tag &at( std::string_view key ) const;
        Tag &at( std::string_view key );

        bool contains( std::string_view key ) const;
        bool erase( std::string_view key );

        std::size_t size( ) const;
        bool empty( ) const;

        const_iterator begin( ) const;
        const_iterator end( ) const;

        bool operator==( const Compound &other ) const;
        bool operator!=( const Compound &other ) const;

    private:
        std::vector< Entry > entries_;
        std::unordered_map< std::string, std::size_t > index_;
    };

    /**
     * @brief One typed value of the NBT type system.
     * @remark The alternative index of `Value` is the wire code of the kind, `std::monostate` standing in for `End`.
     */
    class Tag
    {
    public:
        using Value = std::variant<
            std::monostate,
            nbt_i8,
            nbt_i16,
            nbt_i32,
            nbt_i64,
            float,
            double,
            ByteArray,
            std::string,
            List,
            Compound,
            IntArray,
            LongArray
        >;

        static_assert(
            std::variant_size_v< Value > == tag_kind_count,
            "every tag kind needs exactly one alternative."
        );

        Tag( ) = default;

        explicit Tag( Value value )
            : value_( std::move( value ) )
        {
        }

        static Tag of_byte( const nbt_i8 value ) { return Tag( Value( std::in_place_index< 1 >, value ) ); }
        static Tag of_short( const nbt_i16 value ) { return Tag( Value( std::in_place_index< 2 >, value ) ); }
        static Tag of_int( const nbt_i32 value ) { return Tag( Value( std::in_place_index< 3 >, value ) ); }
        static Tag of_long( const nbt_i64 value ) { return Tag( Value( std::in_place_index< 4 >, value ) ); }
        static Tag of_float( const float value ) { return Tag( Value( std::in_place_index< 5 >, value ) ); }
        static Tag of_double( const double value ) { return Tag( Value( std::in_place_index< 6 >, value ) ); }
        static Tag of_byte_array( ByteArray value ) { return Tag( Value( std::in_place_index< 7 >, std::move( value ) ) ); }
        static Tag of_string( std::string value ) { return Tag( Value( std::in_place_index< 8 >, std::move( value ) ) ); }
        static Tag of_list( List value ) { return Tag( Value( std::in_place_index< 9 >, std::move( value ) ) ); }
        static Tag of_compound( Compound value ) { return Tag( Value( std::in_place_index< 10 >, std::move( value ) ) ); }
        static Tag of_int_array( IntArray value ) { return Tag( Value( std::in_place_index< 11 >, std::move( value ) ) ); }
        static Tag of_long_array( LongArray value ) { return Tag( Value( std::in_place_index< 12 >, std::move( value ) ) ); }

        TagKind kind( ) const
        {
            return static_cast< TagKind >( value_.index ( ) );
        }

        const Value &value( ) const
        {
            return value_;
        }

        nbt_i8 as_byte( ) const { return get< nbt_i8 >( TagKind::Byte ); }
        nbt_i16 as_short( ) const { return get< nbt_i16 >( TagKind::Short ); }
        nbt_i32 as_int( ) const { return get< nbt_i32 >( TagKind::Int ); }
        nbt_i64 as_long( ) const { return get< nbt_i64 >( TagKind::Long ); }
        float as_float( ) const { return get< float >( TagKind::Float ); }
        double as_double( ) const { return get< double >( TagKind::Double ); }

        const ByteArray &as_byte_array( ) const { return get< ByteArray >( TagKind::ByteArray ); }
        const std::string &as_string( ) const { return get< std::string >( TagKind::String ); }
        const List &as_list( ) const { return get< List >( TagKind::List ); }
        const Compound &as_compound( ) const { return get< Compound >( TagKind::Compound ); }
        const IntArray &as_int_array( ) const { return get< IntArray >( TagKind::IntArray ); }
        const LongArray &as_long_array( ) const { return get< LongArray >( TagKind::LongArray ); }

        ByteArray &as_byte_array( ) { return get< ByteArray >( TagKind::ByteArray ); }
        std::string &as_string( ) { return get< std::string >( TagKind::String ); }
        List &as_list( ) { return get< List >( TagKind::List ); }
        Compound &as_compound( ) { return get< Compound >( TagKind::Compound ); }
        IntArray &as_int_array( ) { return get< IntArray >( TagKind::IntArray ); }
        LongArray &as_long_array( ) { return get< LongArray >( TagKind::LongArray ); }

        bool operator==( const Tag &other ) const
        {
            return value_ == other.value_;
        }

        bool operator!=( const Tag &other ) const
        {
            return !( *this == other );
        }

    private:
        template < typename Ty >
        const Ty &get( const TagKind expected ) const
        {
            if ( kind ( ) != expected )
                throw_kind_mismatch( expected );

            return std::get< Ty >( value_ );
        }

        template < typename Ty >
        Ty &get( const TagKind expected )
        {
            if ( kind ( ) != expected )
                throw_kind_mismatch( expected );

            return std::get< Ty >( value_ );
        }

        [[noreturn]] void throw_kind_mismatch( const TagKind expected ) const
        {
            throw Error(
                ErrorKind::InvalidArgument,
                "tag: expected " + std::string( tag_kind_name( expected ) ) +
                ", holds " + std::string( tag_kind_name( kind ( ) ) )
            );
        }

        Value value_;
    };

    inline List::List( const TagKind kind, std::vector< Tag > values )
        : kind( kind ), values( std::move( values ) )
    {
    }

    inline bool List::operator==( const List &other ) const
    {
        /* an empty list compares equal whatever kind it declares */
        if ( values.empty ( ) && other.values.empty ( ) )
            return true;

        return kind == other.kind && values == other.values;
    }

    inline bool List::operator!=( const List &other ) const
    {
        return !( *this == other );
    }

    inline Compound::Compound( const std::initializer_list< Entry > entries )
    {
        for ( const auto &entry : entries )
            set( entry.first, entry.second );
    }

    inline bool Compound::set( std::string key, Tag value )
    {
        const auto it = index_.find( key );

        if ( it != index_.end ( ) )
        {
            entries_[ it->second ].second = std::move( value );
            return false;
        }

        index_.emplace( key, entries_.size ( ) );
        entries_.emplace_back( std::move( key ), std::move( value ) );

        return true;
    }

    inline const Tag *Compound::find( const std::string_view key ) const
    {
        const auto it = index_.find( std::string( key ) );

        return it == index_.end ( ) ? nullptr : &entries_[ it->second ].second;
    }

    inline Tag *Compound::find( const std::string_view key )
    {
        const auto it = index_.find( std::string( key ) );

        return it == index_.end ( ) ? nullptr : &entries_[ it->second ].second;
    }

    inline const Tag &Compound::at( const std::string_view key ) const
    {
        const auto tag = find( key );

        if ( !tag )
            throw Error( ErrorKind::InvalidArgument, "compound: no key \"" + std::string( key ) + "\"" );

        return *tag;
    }

    inline Tag &Compound::at( const std::string_view key )
    {
        const auto tag = find( key );

        if ( !tag )
            throw Error( ErrorKind::InvalidArgument, "compound: no key \"" + std::string( key ) + "\"" );

        return *tag;
    }

    inline bool Compound::contains( const std::string_view key ) const
    {
        return find( key ) != nullptr;
    }

    inline std::size_t Compound::size( ) const
    {
        return entries_.size ( );
    }

    inline bool Compound::empty( ) const
    {
        return entries_.empty ( );
    }

    inline Compound::const_iterator Compound::begin( ) const
    {
        return entries_.begin ( );
    }

    inline Compound::const_iterator Compound::end( ) const
    {
        return entries_.end ( );
    }

    inline bool Compound::erase( const std::string_view key )
    {
        const auto it = index_.find( std::string( key ) );

        if ( it == index_.end ( ) )
            return false;

        entries_.erase( entries_.begin ( ) + static_cast< std::ptrdiff_t >( it->second ) );
        index_.erase( it );

        /* positions behind the erased entry moved down by one */
        for ( std::size_t position = 0; position < entries_.size ( ); position++ )
            index_[ entries_[ position ].first ] = position;

        return true;
    }

    inline bool Compound::operator==( const Compound &other ) const
    {
        if ( size ( ) != other.size ( ) )
            return false;

        for ( const auto &entry : entries_ )
        {
            const auto theirs = other.find( entry.first );

            if ( !theirs || *theirs != entry.second )
                return false;
        }

        return true;
    }

    inline bool Compound::operator!=( const Compound &other ) const
    {
        return !( *this == other );
    }

    /**
     * @brief The named compound that opens every archive.
     */
    struct RootTag
    {
        std::string name;
        Compound value;

        bool operator==( const RootTag &other ) const
        {
            return name == other.name && value == other.value;
        }

        bool operator!=( const RootTag &other ) const
        {
            return !( *this == other );
        }
    };

    /**
     * @brief Appends the NBT encoding of tags to an internally owned, growing buffer.
     *
     * @example
     *  nbt::Writer writer;
     *  writer.write_int( 42 ).write_string( "hi" );
     *  writer.set_position( 0 );
     *  writer.write_int( 999 ); // overwrite the int
     *  const auto bytes = writer.data( );
     */
    struct Writer
    {
    private:
        /**
         * @brief Internal object used for writing to the byte stream.
         */
        stream::StreamWriter wr_;

        using Encoder = void ( Writer::* )( const Tag &tag );

        /**
         * @brief Payload encoders indexed by kind code.
         */
        static const std::array< Encoder, tag_kind_count > &encoders( );

        void encode_end( const Tag & )
        {
            /* End carries no payload */
        }

        void encode_byte( const Tag &tag ) { write_byte( tag.as_byte ( ) ); }
        void encode_short( const Tag &tag ) { write_short( tag.as_short ( ) ); }
        void encode_int( const Tag &tag ) { write_int( tag.as_int ( ) ); }
        void encode_long( const Tag &tag ) { write_long( tag.as_long ( ) ); }
        void encode_float( const Tag &tag ) { write_float( tag.as_float ( ) ); }
        void encode_double( const Tag &tag ) { write_double( tag.as_double ( ) ); }
        void encode_byte_array( const Tag &tag ) { write_byte_array( tag.as_byte_array ( ) ); }
        void encode_string( const Tag &tag ) { write_string( tag.as_string ( ) ); }
        void encode_list( const Tag &tag ) { write_list( tag.as_list ( ) ); }
        void encode_compound( const Tag &tag ) { write_compound( tag.as_compound ( ) ); }
        void encode_int_array( const Tag &tag ) { write_int_array( tag.as_int_array ( ) ); }
        void encode_long_array( const Tag &tag ) { write_long_array( tag.as_long_array ( ) ); }

        void write_count( const std::size_t count, const char *what )
        {
            if ( count > value_limits::ArrayMax )
            {
                throw Error(
                    ErrorKind::InvalidArgument,
                    std::string( "writer: " ) + what + " of " + std::to_string( count ) + " elements does not fit a 32-bit count"
                );
            }

            write_int( static_cast< nbt_i32 >( count ) );
        }

    public:
        explicit Writer( const std::size_t initial_capacity = NBT_WRITER_INITIAL_CAPACITY )
            : wr_( initial_capacity )
        {
        }

        /* Disallow copies. */
        Writer( const Writer &other ) = delete;
        Writer &operator=( const Writer &other ) = delete;

        /**
         * @brief Position of the write cursor.
         * @return std::size_t
         */
        std::size_t position( ) const
        {
            return wr_.position ( );
        }

        /**
         * @brief Move the write cursor, e.g. to overwrite a value written earlier.
         * @param position New cursor position, may lie past the end of the written data
         */
        void set_position( const std::size_t position )
        {
            wr_.set_position( position );
        }

        std::size_t capacity( ) const
        {
            return wr_.capacity ( );
        }

        /**
         * @brief The written bytes `[0, position( ))`.
         * @return Bytes
         */
        Bytes data( )
        {
            return wr_.data ( );
        }

        /**
         * @brief Write the one byte wire code of `kind`.
         * @param kind Tag kind
         * @return Writer&
         */
        Writer &write_kind( const TagKind kind )
        {
            return write_ubyte( tag_kind_code( kind ) );
        }

        /**
         * @brief Write a signed byte and advance the cursor by 1.
         * @param value Signed byte
         * @return Writer&
         */
        Writer &write_byte( const nbt_i8 value )
        {
            wr_.write_u8( static_cast< nbt_u8 >( value ) );
            return *this;
        }

        /**
         * @brief Write an unsigned byte and advance the cursor by 1. Same wire form as `write_byte`.
         * @param value Unsigned byte
         * @return Writer&
         */
        Writer &write_ubyte( const nbt_u8 value )
        {
            wr_.write_u8( value );
            return *this;
        }

        /**
         * @brief Write a big-endian signed 2 byte value and advance the cursor by 2.
         * @param value Signed 2 byte value
         * @return Writer&
         */
        Writer &write_short( const nbt_i16 value )
        {
            wr_.write_u16( nbt_be16( static_cast< nbt_u16 >( value ) ) );
            return *this;
        }

        /**
         * @brief Write a big-endian signed 4 byte value and advance the cursor by 4.
         * @param value Signed 4 byte value
         * @return Writer&
         */
        Writer &write_int( const nbt_i32 value )
        {
            wr_.write_u32( nbt_be32( static_cast< nbt_u32 >( value ) ) );
            return *this;
        }

        /**
         * @brief Write a signed 8 byte value as two 4 byte halves, high half first.
         * @param value Signed 8 byte value
         * @return Writer&
         */
        Writer &write_long( const nbt_i64 value )
        {
            const auto bits = static_cast< nbt_u64 >( value );

            write_int( static_cast< nbt_i32 >( static_cast< nbt_u32 >( bits >> 32 ) ) );
            write_int( static_cast< nbt_i32 >( static_cast< nbt_u32 >( bits & 0xffffffff ) ) );

            return *this;
        }

        /**
         * @brief Write a long given as its `[high, low]` 32-bit halves.
         * @return Writer&
         */
        Writer &write_long( const nbt_i32 high, const nbt_i32 low )
        {
            write_int( high );
            write_int( low );

            return *this;
        }

        Writer &write_float( const float value )
        {
            nbt_u32 bits;
            std::memcpy( &bits, &value, sizeof( bits ) );

            wr_.write_u32( nbt_be32( bits ) );
            return *this;
        }

        Writer &write_double( const double value )
        {
            nbt_u64 bits;
            std::memcpy( &bits, &value, sizeof( bits ) );

            wr_.write_u64( nbt_be64( bits ) );
            return *this;
        }

        /**
         * @brief Write a 4 byte element count followed by the raw bytes.
         * @return Writer&
         */
        Writer &write_byte_array( const ByteArray &value )
        {
            write_count( value.size ( ), "byte array" );
            wr_.write( value.size ( ), reinterpret_cast< const nbt_u8* >( value.data ( ) ) );

            return *this;
        }

        Writer &write_int_array( const IntArray &value )
        {
            write_count( value.size ( ), "int array" );

            for ( const auto element : value )
                write_int( element );

            return *this;
        }

        Writer &write_long_array( const LongArray &value )
        {
            write_count( value.size ( ), "long array" );

            for ( const auto element : value )
                write_long( element );

            return *this;
        }

        /**
         * @brief Write UTF-8 text preceded by its unsigned 2 byte length in bytes.
         * @remark Raises `nbt::Error` (`ErrorKind::StringTooLong`) before writing anything if the text is longer than 65535 bytes.
         * @param value UTF-8 encoded text
         * @return Writer&
         */
        Writer &write_string( const std::string_view value )
        {
            if ( value.size ( ) > value_limits::StringMax )
            {
                throw Error(
                    ErrorKind::StringTooLong,
                    "writer: string of " + std::to_string( value.size ( ) ) + " bytes exceeds the 65535 byte limit"
                );
            }

            write_short( static_cast< nbt_i16 >( static_cast< nbt_u16 >( value.size ( ) ) ) );
            wr_.write( value.size ( ), reinterpret_cast< const nbt_u8* >( value.data ( ) ) );

            return *this;
        }

        /**
         * @brief Encode code points as UTF-8 and write them like `write_string( std::string_view )`.
         * @return Writer&
         */
        Writer &write_string( const std::u32string_view value )
        {
            return write_string( std::string_view( utf8::encode( value ) ) );
        }

        Writer &write_string( const char *value )
        {
            return write_string( std::string_view( value ) );
        }

        Writer &write_string( const std::string &value )
        {
            return write_string( std::string_view( value ) );
        }

        /**
         * @brief Write the element kind, a 4 byte count and every element's payload.
         * @remark Every element must be of the declared kind, otherwise `nbt::Error` (`ErrorKind::InvalidArgument`) is raised.
         * @return Writer&
         */
        Writer &write_list( const TagKind kind, const std::vector< Tag > &values )
        {
            if ( kind == TagKind::End && !values.empty ( ) )
                throw Error( ErrorKind::InvalidArgument, "writer: list of end tags cannot hold elements" );

            for ( const auto &value : values )
            {
                if ( value.kind ( ) != kind )
                {
                    throw Error(
                        ErrorKind::InvalidArgument,
                        "writer: " + std::string( tag_kind_name( value.kind ( ) ) ) +
                        " element in a list of " + std::string( tag_kind_name( kind ) )
                    );
                }
            }

            write_kind( kind );
            write_count( values.size ( ), "list" );

            const auto encoder = encoders ( )[ tag_kind_code( kind ) ];

            for ( const auto &value : values )
                ( this->*encoder )( value );

            return *this;
        }

        Writer &write_list( const List &value )
        {
            return write_list( value.kind, value.values );
        }

        /**
         * @brief Write every entry as `kind, key, payload` in insertion order, then the End marker.
         * @return Writer&
         */
        Writer &write_compound( const Compound &value )
        {
            for ( const auto &entry : value )
            {
                const auto kind = entry.second.kind ( );

                if ( kind == TagKind::End )
                    throw Error( ErrorKind::InvalidArgument, "writer: compound key \"" + entry.first + "\" holds an end tag" );

                write_kind( kind );
                write_string( entry.first );
                write_tag( entry.second );
            }

            write_kind( TagKind::End );

            return *this;
        }

        /**
         * @brief Write the payload of any tag, selecting the encoder by its kind. The kind itself is not written.
         * @return Writer&
         */
        Writer &write_tag( const Tag &tag )
        {
            ( this->*encoders ( )[ tag_kind_code( tag.kind ( ) ) ] )( tag );
            return *this;
        }
    };

    inline const std::array< Writer::Encoder, tag_kind_count > &Writer::encoders( )
    {
        static const std::array< Encoder, tag_kind_count > table { {
            &Writer::encode_end,
            &Writer::encode_byte,
            &Writer::encode_short,
            &Writer::encode_int,
            &Writer::encode_long,
            &Writer::encode_float,
            &Writer::encode_double,
            &Writer::encode_byte_array,
            &Writer::encode_string,
            &Writer::encode_list,
            &Writer::encode_compound,
            &Writer::encode_int_array,
            &Writer::encode_long_array
        } };

        return table;
    }

    /**
     * @brief Decodes tags from a caller supplied byte range. The range is never copied or resized and must outlive the reader.
     *
     * @example
     *  nbt::Reader reader( bytes );
     *  const auto x = reader.read_int( );
     *  const auto tag = reader.read_tag( nbt::TagKind::Int );
     */
    struct Reader
    {
    private:
        /**
         * @brief Internal object used for reading from the byte stream.
         */
        stream::StreamReader sr_;

        using Decoder = Tag ( Reader::* )( );

        /**
         * @brief Payload decoders indexed by kind code.
         */
        static const std::array< Decoder, tag_kind_count > &decoders( );

        Tag decode_end( )
        {
            return Tag ( );
        }

        Tag decode_byte( ) { return Tag::of_byte( read_byte ( ) ); }
        Tag decode_short( ) { return Tag::of_short( read_short ( ) ); }
        Tag decode_int( ) { return Tag::of_int( read_int ( ) ); }
        Tag decode_long( ) { return Tag::of_long( read_long ( ) ); }
        Tag decode_float( ) { return Tag::of_float( read_float ( ) ); }
        Tag decode_double( ) { return Tag::of_double( read_double ( ) ); }
        Tag decode_byte_array( ) { return Tag::of_byte_array( read_byte_array ( ) ); }
        Tag decode_string( ) { return Tag::of_string( read_string ( ) ); }
        Tag decode_list( ) { return Tag::of_list( read_list ( ) ); }
        Tag decode_compound( ) { return Tag::of_compound( read_compound ( ) ); }
        Tag decode_int_array( ) { return Tag::of_int_array( read_int_array ( ) ); }
        Tag decode_long_array( ) { return Tag::of_long_array( read_long_array ( ) ); }

        /**
         * @brief Read a 4 byte element count and make sure `count * element_size` bytes can still follow.
         * @remark A negative count reads as zero elements.
         * @param element_size Smallest wire size of one element
         * @param what Name used in the error message
         * @return std::size_t
         */
        std::size_t read_count( const std::size_t element_size, const char *what )
        {
            const auto at = sr_.position ( );
            const auto count = read_int ( );

            if ( count <= 0 )
                return 0;

            const auto elements = static_cast< std::size_t >( count );

#ifndef NBT_UNSAFE
            if ( element_size && elements > sr_.remaining ( ) / element_size )
            {
                throw Error(
                    ErrorKind::Truncated,
                    std::string( "reader: " ) + what + " at offset " + std::to_string( at ) + " declares " +
                    std::to_string( elements ) + " elements, only " + std::to_string( sr_.remaining ( ) ) + " byte(s) left"
                );
            }
#else
            ( void )at;
            ( void )what;
            ( void )element_size;
#endif

            return elements;
        }

    public:
        /**
         * @param data First byte of the source, may be null only when `size` is 0
         * @param size Size, in bytes, of the source
         */
        Reader( const nbt_u8 *data, const std::size_t size )
            : sr_( data, size )
        {
        }

        explicit Reader( const Bytes &data )
            : sr_( data.data ( ), data.size ( ) )
        {
        }

        /* A reader must not outlive its source. */
        explicit Reader( Bytes &&data ) = delete;

        /* Disallow copies. */
        Reader( const Reader &other ) = delete;
        Reader &operator=( const Reader &other ) = delete;

        std::size_t position( ) const
        {
            return sr_.position ( );
        }

        /**
         * @brief Move the read cursor, e.g. to reread or skip a value.
         * @param position New cursor position
         */
        void set_position( const std::size_t position )
        {
            sr_.set_position( position );
        }

        std::size_t size( ) const
        {
            return sr_.stream_size ( );
        }

        std::size_t remaining( ) const
        {
            return sr_.remaining ( );
        }

        /**
         * @brief Read one kind byte.
         * @remark Raises `nbt::Error` (`ErrorKind::Format`) if the byte is not a kind code.
         * @return TagKind
         */
        TagKind read_kind( )
        {
            const auto at = sr_.position ( );
            const auto raw = sr_.read_u8 ( );

            if ( !is_valid_tag_kind( raw ) )
            {
                throw Error(
                    ErrorKind::Format,
                    "reader: unknown tag kind " + std::to_string( raw ) + " at offset " + std::to_string( at )
                );
            }

            return static_cast< TagKind >( raw );
        }

        nbt_i8 read_byte( )
        {
            return static_cast< nbt_i8 >( sr_.read_u8 ( ) );
        }

        nbt_u8 read_ubyte( )
        {
            return sr_.read_u8 ( );
        }

        /**
         * @brief Read a big-endian signed 2 byte value and advance the cursor by 2.
         * @return nbt_i16
         */
        nbt_i16 read_short( )
        {
            return static_cast< nbt_i16 >( nbt_be16( sr_.read_u16 ( ) ) );
        }

        /**
         * @brief Read a big-endian signed 4 byte value and advance the cursor by 4.
         * @return nbt_i32
         */
        nbt_i32 read_int( )
        {
            return static_cast< nbt_i32 >( nbt_be32( sr_.read_u32 ( ) ) );
        }

        /**
         * @brief Read two 4 byte halves, high half first, and join them.
         * @return nbt_i64
         */
        nbt_i64 read_long( )
        {
            const auto high = static_cast< nbt_u32 >( read_int ( ) );
            const auto low = static_cast< nbt_u32 >( read_int ( ) );

            return static_cast< nbt_i64 >( ( static_cast< nbt_u64 >( high ) << 32 ) | low );
        }

        float read_float( )
        {
            const nbt_u32 bits = nbt_be32( sr_.read_u32 ( ) );

            float value;
            std::memcpy( &value, &bits, sizeof( value ) );

            return value;
        }

        double read_double( )
        {
            const nbt_u64 bits = nbt_be64( sr_.read_u64 ( ) );

            double value;
            std::memcpy( &value, &bits, sizeof( value ) );

            return value;
        }

        ByteArray read_byte_array( )
        {
            const auto count = read_count( 1, "byte array" );

            ByteArray bytes( count );
            sr_.read( count, reinterpret_cast< nbt_u8* >( bytes.data ( ) ) );

            return bytes;
        }

        IntArray read_int_array( )
        {
            const auto count = read_count( 4, "int array" );

            IntArray ints;
            ints.reserve( count );

            for ( std::size_t index = 0; index < count; index++ )
                ints.push_back( read_int ( ) );

            return ints;
        }

        LongArray read_long_array( )
        {
            const auto count = read_count( 8, "long array" );

            LongArray longs;
            longs.reserve( count );

            for ( std::size_t index = 0; index < count; index++ )
                longs.push_back( read_long ( ) );

            return longs;
        }

        /**
         * @brief Read an unsigned 2 byte length and that many bytes of UTF-8 text.
         * @remark The cursor advances by the byte length. Malformed sequences are dropped from the result.
         * @return std::string
         */
        std::string read_string( )
        {
            const auto length = nbt_be16( sr_.read_u16 ( ) );

            return utf8::sanitize( sr_.consume( length ), length );
        }

        /**
         * @brief Read the element kind, a 4 byte count and that many payloads.
         * @return List
         */
        List read_list( )
        {
            const auto at = sr_.position ( );
            const auto kind = read_kind ( );
            const auto code = tag_kind_code( kind );
            const auto count = read_count( detail::min_payload_size[ code ], "list" );

            if ( kind == TagKind::End && count )
            {
                throw Error(
                    ErrorKind::Format,
                    "reader: list of end tags at offset " + std::to_string( at ) + " declares " + std::to_string( count ) + " elements"
                );
            }

            List list( kind );
            list.values.reserve( count );

            const auto decoder = decoders ( )[ code ];

            for ( std::size_t index = 0; index < count; index++ )
                list.values.push_back( ( this->*decoder )( ) );

            return list;
        }

        /**
         * @brief Read `kind, key, payload` entries until the End marker.
         * @remark A key that repeats replaces the earlier value.
         * @return Compound
         */
        Compound read_compound( )
        {
            Compound compound;

            while ( true )
            {
                const auto kind = read_kind ( );

                if ( kind == TagKind::End )
                    break;

                auto key = read_string ( );
                auto value = read_tag( kind );

                if ( !compound.set( key, std::move( value ) ) )
                    NBT_LOG_DEBUG( "reader", "duplicate compound key \"{}\" replaced", key );
            }

            return compound;
        }

        /**
         * @brief Read the payload of a tag of `kind`, selecting the decoder by kind.
         * @return Tag
         */
        Tag read_tag( const TagKind kind )
        {
            const auto code = tag_kind_code( kind );

            if ( !is_valid_tag_kind( code ) )
                throw Error( ErrorKind::InvalidArgument, "reader: unknown tag kind " + std::to_string( code ) );

            return ( this->*decoders ( )[ code ] )( );
        }
    };

    inline const std::array< Reader::Decoder, tag_kind_count > &Reader::decoders( )
    {
        static const std::array< Decoder, tag_kind_count > table { {
            &Reader::decode_end,
            &Reader::decode_byte,
            &Reader::decode_short,
            &Reader::decode_int,
            &Reader::decode_long,
            &Reader::decode_float,
            &Reader::decode_double,
            &Reader::decode_byte_array,
            &Reader::decode_string,
            &Reader::decode_list,
            &Reader::decode_compound,
            &Reader::decode_int_array,
            &Reader::decode_long_array
        } };

        return table;
    }

    /**
     * @brief Check for the 2 byte gzip magic `1F 8B`.
     * @return bool
     */
    inline bool has_gzip_header( const nbt_u8 *data, const std::size_t size )
    {
        return data && size >= 2 && data[ 0 ] == 0x1f && data[ 1 ] == 0x8b;
    }

    inline bool has_gzip_header( const Bytes &data )
    {
        return has_gzip_header( data.data ( ), data.size ( ) );
    }

    /**
     * @brief Encode a named root compound.
     * @return Bytes starting with the Compound kind byte
     */
    inline Bytes write_uncompressed( const RootTag &root )
    {
        Writer writer;

        writer.write_kind( TagKind::Compound );
        writer.write_string( root.name );
        writer.write_compound( root.value );

        return writer.data ( );
    }

    /**
     * @brief Decode an uncompressed archive.
     * @remark Raises `nbt::Error`: `InvalidArgument` for empty input, `Format` if the first byte is not the Compound kind,
     * `Truncated` if the input ends early.
     * @return RootTag
     */
    inline RootTag parse_uncompressed( const nbt_u8 *data, const std::size_t size )
    {
        if ( !data || !size )
            throw Error( ErrorKind::InvalidArgument, "parse: no input data" );

        Reader reader( data, size );

        const auto kind = reader.read_ubyte ( );

        if ( kind != tag_kind_code( TagKind::Compound ) )
        {
            throw Error(
                ErrorKind::Format,
                "parse: top tag should be a compound, found kind " + std::to_string( kind )
            );
        }

        RootTag root;
        root.name = reader.read_string ( );
        root.value = reader.read_compound ( );

        return root;
    }

    inline RootTag parse_uncompressed( const Bytes &data )
    {
        return parse_uncompressed( data.data ( ), data.size ( ) );
    }

    /**
     * @brief Completion of a parse. Exactly one of `error` and `root` is meaningful: `root` is empty when `error` is set.
     */
    using ParseCallback = std::function< void( std::exception_ptr error, RootTag root ) >;

    /**
     * @brief Completion of a decompression, either with an error or with the inflated bytes.
     */
    using DecompressCallback = std::function< void( std::exception_ptr error, Bytes decompressed ) >;

    /**
     * @brief Decompression capability. Must invoke `done` exactly once, on any thread, at any later time.
     * The compressed bytes are only valid for the duration of the call.
     */
    using Decompressor = std::function< void( const Bytes &compressed, DecompressCallback done ) >;

    namespace detail
    {
        inline void parse_and_complete( const Bytes &data, const ParseCallback &callback )
        {
            RootTag root;
            std::exception_ptr error;

            try
            {
                root = parse_uncompressed( data );
            }
            catch ( const std::exception &e )
            {
                NBT_LOG_DEBUG( "parse", "decoding failed: {}", e.what ( ) );
                error = std::current_exception ( );
            }

            callback( error, std::move( root ) );
        }
    }

    /**
     * @brief Parse a gzip wrapped or uncompressed archive.
     * @remark Uncompressed input completes before this function returns. Gzip input is handed to `decompressor`
     * and completes whenever it does; without a decompressor the callback receives `ErrorKind::DecompressorUnavailable`.
     * Empty input or an empty callback raise `nbt::Error` (`ErrorKind::InvalidArgument`) directly.
     * @param data Gzip wrapped or uncompressed archive
     * @param callback Receives the error or the root compound
     * @param decompressor Inflates gzip input, may be empty
     */
    inline void parse( const Bytes &data, const ParseCallback &callback, const Decompressor &decompressor )
    {
        if ( data.empty ( ) )
            throw Error( ErrorKind::InvalidArgument, "parse: no input data" );

        if ( !callback )
            throw Error( ErrorKind::InvalidArgument, "parse: no callback" );

        if ( !has_gzip_header( data ) )
        {
            NBT_LOG_DEBUG( "parse", "uncompressed archive, {} bytes", data.size ( ) );
            detail::parse_and_complete( data, callback );
            return;
        }

        if ( !decompressor )
        {
            NBT_LOG_WARN( "parse", "archive is gzip compressed but no decompressor is available" );

            callback(
                std::make_exception_ptr( Error(
                    ErrorKind::DecompressorUnavailable,
                    "parse: archive is compressed but no decompressor is available"
                ) ),
                RootTag { }
            );

            return;
        }

        NBT_LOG_DEBUG( "parse", "gzip archive, {} bytes, delegating to decompressor", data.size ( ) );

        decompressor(
            data,
            [ callback ]( std::exception_ptr error, Bytes decompressed )
            {
                if ( error )
                {
                    callback( error, RootTag { } );
                    return;
                }

                detail::parse_and_complete( decompressed, callback );
            }
        );
    }
}
