#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <string>
#include <utility>

#include <zlib.h>

#include "nbt.hpp"

namespace nbt
{
    namespace value_limits
    {
        /* zlib window bits: 15 bit window, +16 selects the gzip wrapper. */
        constexpr int GzipWindowBits = 15 + 16;
    }

    namespace detail
    {
        /**
         * @brief Owns a `z_stream` initialized for inflation and ends it on scope exit.
         */
        struct Inflater
        {
            z_stream zs { };

            explicit Inflater( const int window_bits )
            {
                const auto rc = inflateInit2( &zs, window_bits );

                if ( rc != Z_OK )
                    throw Error( ErrorKind::Decompression, "gunzip: inflateInit2 failed with code " + std::to_string( rc ) );
            }

            ~Inflater( )
            {
                inflateEnd( &zs );
            }

            Inflater( const Inflater & ) = delete;
            Inflater &operator=( const Inflater & ) = delete;
        };
    }

    /**
     * @brief Inflate a gzip stream. Concatenated gzip members are inflated back to back and zero padding
     * after the last member is ignored.
     * @remark Raises `nbt::Error` (`ErrorKind::Decompression`) with zlib's message if the stream is damaged or ends early.
     * @param data First byte of the gzip stream
     * @param size Size, in bytes, of the gzip stream
     * @return Bytes
     */
    inline Bytes gunzip( const nbt_u8 *data, const std::size_t size )
    {
        if ( !data || !size )
            throw Error( ErrorKind::InvalidArgument, "gunzip: no input data" );

        detail::Inflater inflater( value_limits::GzipWindowBits );
        auto &zs = inflater.zs;

        Bytes out;
        nbt_u8 chunk[ 16384 ];

        std::size_t consumed = 0;
        int rc = Z_OK;
        bool finished = false;

        while ( consumed < size && !finished )
        {
            /* feed at most uInt worth of input at a time */
            const auto avail = std::min< std::size_t >( size - consumed, 0x40000000 );

            zs.next_in = const_cast< Bytef* >( reinterpret_cast< const Bytef* >( data + consumed ) );
            zs.avail_in = static_cast< uInt >( avail );

            do
            {
                zs.next_out = chunk;
                zs.avail_out = sizeof( chunk );

                rc = inflate( &zs, Z_NO_FLUSH );

                if ( rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR )
                {
                    throw Error(
                        ErrorKind::Decompression,
                        std::string( "gunzip: inflate failed: " ) + ( zs.msg ? zs.msg : "code " + std::to_string( rc ) )
                    );
                }

                out.insert( out.end ( ), chunk, chunk + ( sizeof( chunk ) - zs.avail_out ) );

                if ( rc == Z_STREAM_END )
                {
                    const auto offset = consumed + ( avail - zs.avail_in );

                    if ( offset == size )
                        break;

                    const auto trailing = data + offset;
                    const auto trailing_size = size - offset;

                    /* zero padding after the last member */
                    if ( std::all_of( trailing, data + size, []( const nbt_u8 byte ) { return byte == 0; } ) )
                    {
                        finished = true;
                        break;
                    }

                    if ( !has_gzip_header( trailing, trailing_size ) )
                    {
                        throw Error(
                            ErrorKind::Decompression,
                            "gunzip: " + std::to_string( trailing_size ) + " trailing byte(s) after gzip member at offset " + std::to_string( offset )
                        );
                    }

                    const auto reset = inflateReset( &zs );

                    if ( reset != Z_OK )
                        throw Error( ErrorKind::Decompression, "gunzip: inflateReset failed with code " + std::to_string( reset ) );

                    rc = Z_OK;
                }
            } while ( zs.avail_in > 0 || zs.avail_out == 0 );

            if ( finished )
                break;

            if ( rc == Z_BUF_ERROR && zs.avail_in == avail )
                break;

            consumed += avail - zs.avail_in;
        }

        if ( rc != Z_STREAM_END )
            throw Error( ErrorKind::Decompression, "gunzip: unexpected end of compressed stream" );

        NBT_LOG_DEBUG( "gzip", "inflated {} bytes into {}", size, out.size ( ) );

        return out;
    }

    inline Bytes gunzip( const Bytes &data )
    {
        return gunzip( data.data ( ), data.size ( ) );
    }

    /**
     * @brief Decompression capability backed by zlib. Completes on the calling thread before returning.
     * @return Decompressor
     */
    inline Decompressor zlib_decompressor( )
    {
        return []( const Bytes &compressed, DecompressCallback done )
        {
            Bytes inflated;
            std::exception_ptr error;

            try
            {
                inflated = gunzip( compressed );
            }
            catch ( const std::exception &e )
            {
                NBT_LOG_ERROR( "gzip", "{}", e.what ( ) );
                error = std::current_exception ( );
            }

            done( error, std::move( inflated ) );
        };
    }

    /**
     * @brief `parse` with the zlib decompressor.
     */
    inline void parse( const Bytes &data, const ParseCallback &callback )
    {
        parse( data, callback, zlib_decompressor ( ) );
    }
}
