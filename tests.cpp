#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <zlib.h>

#include "nbt_gzip.hpp"
#include "gtest/gtest.h"

namespace
{
    nbt::Bytes bytes_of( const std::string &raw )
    {
        return nbt::Bytes( raw.begin ( ), raw.end ( ) );
    }

    /**
     * @brief Compress `raw` into a single gzip member.
     */
    nbt::Bytes gzip_bytes( const nbt::Bytes &raw )
    {
        z_stream zs { };

        EXPECT_EQ( Z_OK, deflateInit2( &zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY ) );

        nbt::Bytes out( deflateBound( &zs, static_cast< uLong >( raw.size ( ) ) ) + 64 );

        zs.next_in = const_cast< Bytef* >( raw.data ( ) );
        zs.avail_in = static_cast< uInt >( raw.size ( ) );
        zs.next_out = out.data ( );
        zs.avail_out = static_cast< uInt >( out.size ( ) );

        EXPECT_EQ( Z_STREAM_END, deflate( &zs, Z_FINISH ) );

        out.resize( zs.total_out );
        deflateEnd( &zs );

        return out;
    }

    nbt::ErrorKind kind_of( const std::exception_ptr &error )
    {
        try
        {
            std::rethrow_exception( error );
        }
        catch ( const nbt::Error &e )
        {
            return e.kind ( );
        }
        catch ( const std::exception &e )
        {
            ADD_FAILURE ( ) << "unexpected exception type: " << e.what ( );
        }

        return nbt::ErrorKind::InvalidArgument;
    }

    /**
     * @brief A root compound touching every tag kind.
     */
    nbt::RootTag every_kind( )
    {
        nbt::Compound nested {
            { "inner", nbt::Tag::of_string( "value" ) }
        };

        return nbt::RootTag {
            "Level",
            nbt::Compound {
                { "byte", nbt::Tag::of_byte( -128 ) },
                { "short", nbt::Tag::of_short( 32767 ) },
                { "int", nbt::Tag::of_int( std::numeric_limits< nbt::nbt_i32 >::min ( ) ) },
                { "long", nbt::Tag::of_long( std::numeric_limits< nbt::nbt_i64 >::max ( ) ) },
                { "float", nbt::Tag::of_float( 0.5f ) },
                { "double", nbt::Tag::of_double( -1234.5678 ) },
                { "byteArray", nbt::Tag::of_byte_array( { -1, 0, 1, 127 } ) },
                { "string", nbt::Tag::of_string( "h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\x98\x80" ) },
                { "list", nbt::Tag::of_list( nbt::List( nbt::TagKind::Short, { nbt::Tag::of_short( 1 ), nbt::Tag::of_short( -1 ) } ) ) },
                { "compound", nbt::Tag::of_compound( nested ) },
                { "intArray", nbt::Tag::of_int_array( { 1, -1, 0x7fffffff } ) },
                { "longArray", nbt::Tag::of_long_array( { 1, -1, std::numeric_limits< nbt::nbt_i64 >::min ( ) } ) }
            }
        };
    }
}

namespace type_table
{
    TEST( TypeTable, StableCodes )
    {
        EXPECT_EQ( 0, nbt::tag_kind_code( nbt::TagKind::End ) );
        EXPECT_EQ( 4, nbt::tag_kind_code( nbt::TagKind::Long ) );
        EXPECT_EQ( 8, nbt::tag_kind_code( nbt::TagKind::String ) );
        EXPECT_EQ( 10, nbt::tag_kind_code( nbt::TagKind::Compound ) );
        EXPECT_EQ( 12, nbt::tag_kind_code( nbt::TagKind::LongArray ) );

        EXPECT_TRUE( nbt::is_valid_tag_kind( 12 ) );
        EXPECT_FALSE( nbt::is_valid_tag_kind( 13 ) );
        EXPECT_FALSE( nbt::is_valid_tag_kind( 0xff ) );
    }

    TEST( TypeTable, NamesBothWays )
    {
        EXPECT_EQ( "byteArray", nbt::tag_kind_name( nbt::TagKind::ByteArray ) );
        EXPECT_EQ( "compound", nbt::tag_kind_name( nbt::TagKind::Compound ) );
        EXPECT_EQ( "unknown", nbt::tag_kind_name( static_cast< nbt::TagKind >( 42 ) ) );

        for ( nbt::nbt_u8 code = 0; code < nbt::tag_kind_count; code++ )
        {
            const auto kind = static_cast< nbt::TagKind >( code );
            const auto back = nbt::tag_kind_from_name( nbt::tag_kind_name( kind ) );

            ASSERT_TRUE( back.has_value ( ) );
            EXPECT_EQ( kind, *back );
        }

        EXPECT_FALSE( nbt::tag_kind_from_name( "ByteArray" ).has_value ( ) );
        EXPECT_FALSE( nbt::tag_kind_from_name( "" ).has_value ( ) );
    }

    TEST( TypeTable, TagKindFollowsValue )
    {
        EXPECT_EQ( nbt::TagKind::End, nbt::Tag ( ).kind ( ) );
        EXPECT_EQ( nbt::TagKind::Byte, nbt::Tag::of_byte( 1 ).kind ( ) );
        EXPECT_EQ( nbt::TagKind::LongArray, nbt::Tag::of_long_array( { } ).kind ( ) );

        try
        {
            nbt::Tag::of_int( 1 ).as_string ( );
            FAIL ( ) << "kind mismatch not reported";
        }
        catch ( const nbt::Error &e )
        {
            EXPECT_EQ( nbt::ErrorKind::InvalidArgument, e.kind ( ) );
        }
    }
}

namespace text_codec
{
    TEST( TextCodec, EncodeWidths )
    {
        EXPECT_EQ( "A", nbt::utf8::encode( U"A" ) );
        EXPECT_EQ( "\xC3\xA9", nbt::utf8::encode( U"é" ) );
        EXPECT_EQ( "\xE2\x82\xAC", nbt::utf8::encode( U"€" ) );
        EXPECT_EQ( "\xF0\x9F\x98\x80", nbt::utf8::encode( U"\U0001F600" ) );
        EXPECT_EQ( "", nbt::utf8::encode( U"" ) );
    }

    TEST( TextCodec, DecodeInverse )
    {
        const std::u32string text = U"hé € \U0001F600 end";

        EXPECT_EQ( text, nbt::utf8::decode( nbt::utf8::encode( text ) ) );
    }

    TEST( TextCodec, LenientDecoding )
    {
        /* lone continuation byte, invalid lead byte and a sequence cut short at the end */
        EXPECT_EQ( U"ab", nbt::utf8::decode( std::string( "a\x80\xFF" "b" ) ) );
        EXPECT_EQ( U"x", nbt::utf8::decode( std::string( "x\xE2\x82" ) ) );
        EXPECT_EQ( U"é", nbt::utf8::decode( std::string( "\xE0\xC3\xA9" ) ) );
    }

    TEST( TextCodec, SurrogatesSurvive )
    {
        const std::string wire = "\xED\xA0\x80";
        const auto decoded = nbt::utf8::decode( wire );

        ASSERT_EQ( 1u, decoded.size ( ) );
        EXPECT_EQ( static_cast< char32_t >( 0xD800 ), decoded[ 0 ] );
        EXPECT_EQ( wire, nbt::utf8::encode( decoded ) );
    }
}

/**
 * @brief Test `nbt::stream::Stream(Reader|Writer)` behaviour.
 */
namespace streams
{
    TEST( StreamWriter, GrowthKeepsBytes )
    {
        nbt::stream::StreamWriter wr( 4 );

        for ( auto index = 0u; index < 100; index++ )
            wr.write_u8( static_cast< nbt::nbt_u8 >( index ) );

        EXPECT_EQ( 128u, wr.capacity ( ) );

        const auto data = wr.data ( );

        ASSERT_EQ( 100u, data.size ( ) );

        for ( auto index = 0u; index < 100; index++ )
            EXPECT_EQ( index, data[ index ] );
    }

    TEST( StreamWriter, DoublesUntilFit )
    {
        nbt::stream::StreamWriter wr( 16 );
        const nbt::nbt_u8 block[ 40 ] = { };

        wr.write_u8( 1 );
        EXPECT_EQ( 16u, wr.capacity ( ) );

        wr.write( sizeof( block ), block );
        EXPECT_EQ( 64u, wr.capacity ( ) );
        EXPECT_EQ( 41u, wr.position ( ) );
    }

    TEST( StreamWriter, GapIsZeroFilled )
    {
        nbt::stream::StreamWriter wr( 8 );

        wr.write_u8( 0xaa );
        wr.set_position( 20 );
        wr.write_u8( 0xbb );

        const auto data = wr.data ( );

        ASSERT_EQ( 21u, data.size ( ) );
        EXPECT_EQ( 0xaa, data.front ( ) );
        EXPECT_EQ( 0xbb, data.back ( ) );

        for ( auto index = 1u; index < 20; index++ )
            EXPECT_EQ( 0, data[ index ] );

        nbt::stream::StreamWriter past_end( 4 );
        past_end.set_position( 10 );

        EXPECT_EQ( nbt::Bytes( 10, 0 ), past_end.data ( ) );
    }

    TEST( StreamWriter, DataEndsAtCursor )
    {
        nbt::stream::StreamWriter wr;

        wr.write_u32( 0xffffffff );
        EXPECT_EQ( 4u, wr.data ( ).size ( ) );
        EXPECT_EQ( static_cast< std::size_t >( NBT_WRITER_INITIAL_CAPACITY ), wr.capacity ( ) );

        wr.set_position( 1 );
        wr.write_u8( 0 );

        const auto data = wr.data ( );

        ASSERT_EQ( 2u, data.size ( ) );
        EXPECT_EQ( 0xff, data[ 0 ] );
        EXPECT_EQ( 0x00, data[ 1 ] );
    }

    TEST( StreamReader, ReadOOB )
    {
        const nbt::nbt_u8 buf[ ] = { 'a', 'b', 'c' };

        nbt::stream::StreamReader sr( buf, sizeof( buf ) );

        EXPECT_EQ( 'a', sr.peek_u8 ( ) );
        EXPECT_EQ( 0u, sr.position ( ) );

        EXPECT_EQ( 'a', sr.read_u8 ( ) );
        EXPECT_EQ( 2u, sr.remaining ( ) );

        try
        {
            sr.read_u32 ( );
            FAIL ( ) << "read past the end not reported";
        }
        catch ( const nbt::Error &e )
        {
            EXPECT_EQ( nbt::ErrorKind::Truncated, e.kind ( ) );
        }

        /* a failed read leaves the cursor where it was */
        EXPECT_EQ( 1u, sr.position ( ) );
        EXPECT_EQ( 'b', sr.read_u8 ( ) );

        sr.set_position( 10 );
        EXPECT_EQ( 0u, sr.remaining ( ) );
        EXPECT_THROW( sr.read_u8 ( ), nbt::Error );
    }

    TEST( StreamReader, NullBuffer )
    {
        EXPECT_THROW( nbt::stream::StreamReader( nullptr, 4 ), nbt::Error );

        nbt::stream::StreamReader empty( nullptr, 0 );
        EXPECT_EQ( 0u, empty.remaining ( ) );
        EXPECT_THROW( empty.read_u8 ( ), nbt::Error );
    }
}

namespace primitives
{
    class PrimitiveFixture : public testing::Test
    {
    protected:
        nbt::Writer writer { };
    };

    TEST_F( PrimitiveFixture, BigEndianLayout )
    {
        writer.write_byte( -1 )
              .write_short( 0x0102 )
              .write_int( 0x01020304 )
              .write_long( 0x0102030405060708ll )
              .write_float( 1.0f )
              .write_double( 1.0 );

        const nbt::Bytes expected = {
            0xff,
            0x01, 0x02,
            0x01, 0x02, 0x03, 0x04,
            0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
            0x3f, 0x80, 0x00, 0x00,
            0x3f, 0xf0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00
        };

        EXPECT_EQ( expected, writer.data ( ) );
        EXPECT_EQ( expected.size ( ), writer.position ( ) );
    }

    TEST_F( PrimitiveFixture, LongPairMatchesNative )
    {
        writer.write_long( -2 );
        const auto native = writer.data ( );

        nbt::Writer pair;
        pair.write_long( -1, -2 );

        EXPECT_EQ( native, pair.data ( ) );
        EXPECT_EQ( nbt::Bytes( { 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xfe } ), native );
    }

    TEST_F( PrimitiveFixture, RoundTrip )
    {
        writer.write_byte( -125 )
              .write_ubyte( 250 )
              .write_short( -2 )
              .write_int( std::numeric_limits< nbt::nbt_i32 >::min ( ) )
              .write_long( std::numeric_limits< nbt::nbt_i64 >::min ( ) )
              .write_float( 3.5f )
              .write_double( -0.1 );

        const auto data = writer.data ( );
        nbt::Reader reader( data );

        EXPECT_EQ( -125, reader.read_byte ( ) );
        EXPECT_EQ( 250, reader.read_ubyte ( ) );
        EXPECT_EQ( -2, reader.read_short ( ) );
        EXPECT_EQ( std::numeric_limits< nbt::nbt_i32 >::min ( ), reader.read_int ( ) );
        EXPECT_EQ( std::numeric_limits< nbt::nbt_i64 >::min ( ), reader.read_long ( ) );
        EXPECT_EQ( 3.5f, reader.read_float ( ) );
        EXPECT_EQ( -0.1, reader.read_double ( ) );
        EXPECT_EQ( 0u, reader.remaining ( ) );
    }

    TEST_F( PrimitiveFixture, ArraysArePrefixedByCount )
    {
        writer.write_byte_array( { -1, 0, 127 } );

        EXPECT_EQ( nbt::Bytes( { 0x00, 0x00, 0x00, 0x03, 0xff, 0x00, 0x7f } ), writer.data ( ) );

        writer.write_int_array( { 1, -1 } ).write_long_array( { 5, -5 } );

        const auto data = writer.data ( );
        nbt::Reader reader( data );

        EXPECT_EQ( nbt::ByteArray( { -1, 0, 127 } ), reader.read_byte_array ( ) );
        EXPECT_EQ( nbt::IntArray( { 1, -1 } ), reader.read_int_array ( ) );
        EXPECT_EQ( nbt::LongArray( { 5, -5 } ), reader.read_long_array ( ) );
    }

    TEST_F( PrimitiveFixture, StringLengthIsBytes )
    {
        writer.write_string( "h\xC3\xA9" );
        writer.write_string( U"hé" );

        const nbt::Bytes once = { 0x00, 0x03, 'h', 0xc3, 0xa9 };
        nbt::Bytes twice = once;
        twice.insert( twice.end ( ), once.begin ( ), once.end ( ) );

        EXPECT_EQ( twice, writer.data ( ) );

        nbt::Reader reader( twice );

        EXPECT_EQ( "h\xC3\xA9", reader.read_string ( ) );
        EXPECT_EQ( 5u, reader.position ( ) );
    }

    TEST_F( PrimitiveFixture, StringLimit )
    {
        writer.write_string( std::string( 65535, 'a' ) );
        EXPECT_EQ( 65537u, writer.position ( ) );

        writer.set_position( 0 );

        try
        {
            writer.write_string( std::string( 65536, 'a' ) );
            FAIL ( ) << "oversized string accepted";
        }
        catch ( const nbt::Error &e )
        {
            EXPECT_EQ( nbt::ErrorKind::StringTooLong, e.kind ( ) );
        }

        EXPECT_EQ( 0u, writer.position ( ) );
    }

    TEST_F( PrimitiveFixture, MalformedStringBytesAreDropped )
    {
        const nbt::Bytes data = { 0x00, 0x03, 'a', 0xff, 'b', 0x7f };
        nbt::Reader reader( data );

        EXPECT_EQ( "ab", reader.read_string ( ) );
        EXPECT_EQ( 5u, reader.position ( ) );
        EXPECT_EQ( 0x7f, reader.read_byte ( ) );
    }

    TEST_F( PrimitiveFixture, CursorsCanMove )
    {
        writer.write_int( 1 ).write_int( 2 );

        writer.set_position( 0 );
        writer.write_int( 999 );
        writer.set_position( 8 );

        const auto data = writer.data ( );
        nbt::Reader reader( data );

        reader.set_position( 4 );
        EXPECT_EQ( 2, reader.read_int ( ) );

        reader.set_position( 0 );
        EXPECT_EQ( 999, reader.read_int ( ) );
    }
}

namespace containers
{
    TEST( Containers, ListLayout )
    {
        nbt::Writer writer;
        writer.write_list( nbt::List( nbt::TagKind::Int, { nbt::Tag::of_int( 1 ), nbt::Tag::of_int( 2 ) } ) );

        const nbt::Bytes expected = {
            0x03,
            0x00, 0x00, 0x00, 0x02,
            0x00, 0x00, 0x00, 0x01,
            0x00, 0x00, 0x00, 0x02
        };

        EXPECT_EQ( expected, writer.data ( ) );

        nbt::Reader reader( expected );
        const auto list = reader.read_list ( );

        EXPECT_EQ( nbt::TagKind::Int, list.kind );
        ASSERT_EQ( 2u, list.values.size ( ) );
        EXPECT_EQ( 2, list.values[ 1 ].as_int ( ) );
    }

    TEST( Containers, EmptyListCarriesKind )
    {
        nbt::Writer writer;
        writer.write_list( nbt::List ( ) );

        const auto data = writer.data ( );

        EXPECT_EQ( nbt::Bytes( { 0x00, 0x00, 0x00, 0x00, 0x00 } ), data );

        nbt::Reader reader( data );
        const auto list = reader.read_list ( );

        EXPECT_EQ( nbt::TagKind::End, list.kind );
        EXPECT_TRUE( list.values.empty ( ) );
    }

    TEST( Containers, ListKindMismatch )
    {
        nbt::Writer writer;

        try
        {
            writer.write_list( nbt::TagKind::Int, { nbt::Tag::of_int( 1 ), nbt::Tag::of_short( 2 ) } );
            FAIL ( ) << "mixed list accepted";
        }
        catch ( const nbt::Error &e )
        {
            EXPECT_EQ( nbt::ErrorKind::InvalidArgument, e.kind ( ) );
        }

        EXPECT_EQ( 0u, writer.position ( ) );
        EXPECT_THROW( writer.write_list( nbt::TagKind::End, { nbt::Tag ( ) } ), nbt::Error );
    }

    TEST( Containers, CompoundLayout )
    {
        nbt::Writer writer;
        writer.write_compound( nbt::Compound { { "z", nbt::Tag::of_byte( 1 ) }, { "a", nbt::Tag::of_short( 2 ) } } );

        const nbt::Bytes expected = {
            0x01, 0x00, 0x01, 'z', 0x01,
            0x02, 0x00, 0x01, 'a', 0x00, 0x02,
            0x00
        };

        EXPECT_EQ( expected, writer.data ( ) );

        nbt::Reader reader( expected );
        const auto compound = reader.read_compound ( );

        ASSERT_EQ( 2u, compound.size ( ) );
        EXPECT_EQ( "z", compound.begin ( )->first );
        EXPECT_EQ( 2, compound.at( "a" ).as_short ( ) );
    }

    TEST( Containers, DuplicateKeysCollapse )
    {
        const nbt::Bytes data = {
            0x03, 0x00, 0x01, 'k', 0x00, 0x00, 0x00, 0x01,
            0x08, 0x00, 0x01, 'j', 0x00, 0x00,
            0x03, 0x00, 0x01, 'k', 0x00, 0x00, 0x00, 0x02,
            0x00
        };

        nbt::Reader reader( data );
        const auto compound = reader.read_compound ( );

        ASSERT_EQ( 2u, compound.size ( ) );
        EXPECT_EQ( 2, compound.at( "k" ).as_int ( ) );
        EXPECT_EQ( "k", compound.begin ( )->first );
        EXPECT_EQ( "", compound.at( "j" ).as_string ( ) );
    }

    TEST( Containers, CompoundSemantics )
    {
        nbt::Compound compound;

        EXPECT_TRUE( compound.set( "a", nbt::Tag::of_int( 1 ) ) );
        EXPECT_TRUE( compound.set( "b", nbt::Tag::of_int( 2 ) ) );
        EXPECT_FALSE( compound.set( "a", nbt::Tag::of_int( 3 ) ) );

        ASSERT_EQ( 2u, compound.size ( ) );
        EXPECT_EQ( "a", compound.begin ( )->first );
        EXPECT_EQ( 3, compound.at( "a" ).as_int ( ) );
        EXPECT_EQ( nullptr, compound.find( "c" ) );
        EXPECT_THROW( compound.at( "c" ), nbt::Error );

        const nbt::Compound reordered { { "b", nbt::Tag::of_int( 2 ) }, { "a", nbt::Tag::of_int( 3 ) } };
        EXPECT_EQ( compound, reordered );

        EXPECT_TRUE( compound.erase( "a" ) );
        EXPECT_FALSE( compound.erase( "a" ) );
        EXPECT_EQ( 2, compound.at( "b" ).as_int ( ) );
        EXPECT_NE( compound, reordered );

        compound.at( "b" ) = nbt::Tag::of_string( "two" );
        EXPECT_EQ( "two", compound.at( "b" ).as_string ( ) );
    }

    TEST( Containers, EndTagInCompoundRejected )
    {
        nbt::Writer writer;

        EXPECT_THROW( writer.write_compound( nbt::Compound { { "end", nbt::Tag ( ) } } ), nbt::Error );
    }

    TEST( Containers, NestedDepth )
    {
        /* compound -> list of compound -> compound -> list of list of int */
        nbt::List ints( nbt::TagKind::Int, { nbt::Tag::of_int( 7 ), nbt::Tag::of_int( 8 ) } );
        nbt::List lists( nbt::TagKind::List, { nbt::Tag::of_list( ints ), nbt::Tag::of_list( nbt::List( nbt::TagKind::Int ) ) } );

        nbt::Compound leaf { { "lists", nbt::Tag::of_list( lists ) } };
        nbt::Compound middle { { "leaf", nbt::Tag::of_compound( leaf ) }, { "name", nbt::Tag::of_string( "middle" ) } };

        nbt::List compounds( nbt::TagKind::Compound, { nbt::Tag::of_compound( middle ), nbt::Tag::of_compound( { } ) } );

        const nbt::RootTag root { "nested", nbt::Compound { { "items", nbt::Tag::of_list( compounds ) } } };
        const auto parsed = nbt::parse_uncompressed( nbt::write_uncompressed( root ) );

        EXPECT_EQ( root, parsed );

        const auto &items = parsed.value.at( "items" ).as_list ( );

        ASSERT_EQ( nbt::TagKind::Compound, items.kind );
        EXPECT_EQ( 8, items.values[ 0 ].as_compound ( ).at( "leaf" ).as_compound ( ).at( "lists" ).as_list ( ).values[ 0 ].as_list ( ).values[ 1 ].as_int ( ) );
    }

    TEST( Containers, DeepRecursion )
    {
        nbt::Tag tag = nbt::Tag::of_compound( { { "leaf", nbt::Tag::of_int( 1 ) } } );

        for ( auto depth = 0; depth < 500; depth++ )
            tag = nbt::Tag::of_compound( { { "n", tag } } );

        const nbt::RootTag root { "deep", tag.as_compound ( ) };
        const auto parsed = nbt::parse_uncompressed( nbt::write_uncompressed( root ) );

        EXPECT_EQ( root, parsed );
    }

    TEST( Containers, TagDispatch )
    {
        const auto root = every_kind ( );

        for ( const auto &entry : root.value )
        {
            nbt::Writer writer;
            writer.write_tag( entry.second );

            const auto data = writer.data ( );
            nbt::Reader reader( data );

            EXPECT_EQ( entry.second, reader.read_tag( entry.second.kind ( ) ) ) << entry.first;
            EXPECT_EQ( 0u, reader.remaining ( ) ) << entry.first;
        }
    }
}

namespace root_codec
{
    TEST( RootCodec, NamedCompoundRoundTrip )
    {
        const nbt::RootTag root { "test", nbt::Compound { { "a", nbt::Tag::of_int( 42 ) } } };
        const auto data = nbt::write_uncompressed( root );

        const nbt::Bytes expected = {
            0x0a, 0x00, 0x04, 't', 'e', 's', 't',
            0x03, 0x00, 0x01, 'a', 0x00, 0x00, 0x00, 0x2a,
            0x00
        };

        EXPECT_EQ( expected, data );

        const auto parsed = nbt::parse_uncompressed( data );

        EXPECT_EQ( "test", parsed.name );
        EXPECT_EQ( 42, parsed.value.at( "a" ).as_int ( ) );
        EXPECT_EQ( root, parsed );
    }

    TEST( RootCodec, EveryKindRoundTrip )
    {
        const auto root = every_kind ( );
        const auto data = nbt::write_uncompressed( root );

        EXPECT_EQ( root, nbt::parse_uncompressed( data ) );

        /* re-encoding the decoded root reproduces the same bytes */
        EXPECT_EQ( data, nbt::write_uncompressed( nbt::parse_uncompressed( data ) ) );
    }

    TEST( RootCodec, EmptyCompound )
    {
        EXPECT_EQ( nbt::Bytes( { 0x0a, 0x00, 0x00, 0x00 } ), nbt::write_uncompressed( nbt::RootTag { } ) );

        const auto parsed = nbt::parse_uncompressed( nbt::Bytes( { 0x0a, 0x00, 0x00, 0x00 } ) );

        EXPECT_EQ( "", parsed.name );
        EXPECT_TRUE( parsed.value.empty ( ) );
    }

    TEST( RootCodec, TopTagMustBeCompound )
    {
        /* a lone Byte kind: reading any further would report truncation instead */
        try
        {
            nbt::parse_uncompressed( nbt::Bytes( { 0x01 } ) );
            FAIL ( ) << "byte root accepted";
        }
        catch ( const nbt::Error &e )
        {
            EXPECT_EQ( nbt::ErrorKind::Format, e.kind ( ) );
        }
    }

    TEST( RootCodec, EmptyInput )
    {
        try
        {
            nbt::parse_uncompressed( nbt::Bytes ( ) );
            FAIL ( ) << "empty input accepted";
        }
        catch ( const nbt::Error &e )
        {
            EXPECT_EQ( nbt::ErrorKind::InvalidArgument, e.kind ( ) );
        }
    }
}

namespace malformed
{
    class MalformedFixture : public testing::Test
    {
    protected:
        static nbt::ErrorKind failure( const nbt::Bytes &data )
        {
            try
            {
                nbt::parse_uncompressed( data );
            }
            catch ( const nbt::Error &e )
            {
                return e.kind ( );
            }

            ADD_FAILURE ( ) << "malformed input accepted";
            return nbt::ErrorKind::InvalidArgument;
        }
    };

    TEST_F( MalformedFixture, MissingEnd )
    {
        auto data = nbt::write_uncompressed( nbt::RootTag { "x", nbt::Compound { { "a", nbt::Tag::of_int( 1 ) } } } );
        data.pop_back ( );

        EXPECT_EQ( nbt::ErrorKind::Truncated, failure( data ) );
    }

    TEST_F( MalformedFixture, TruncatedEverywhere )
    {
        const auto data = nbt::write_uncompressed( every_kind ( ) );

        for ( std::size_t length = 1; length < data.size ( ); length++ )
        {
            const nbt::Bytes cut( data.begin ( ), data.begin ( ) + static_cast< std::ptrdiff_t >( length ) );

            EXPECT_EQ( nbt::ErrorKind::Truncated, failure( cut ) ) << "cut at " << length;
        }
    }

    TEST_F( MalformedFixture, UnknownKind )
    {
        EXPECT_EQ( nbt::ErrorKind::Format, failure( { 0x0a, 0x00, 0x00, 0x0d, 0x00, 0x00, 0x00 } ) );
        EXPECT_EQ( nbt::ErrorKind::Format, failure( { 0x0a, 0x00, 0x00, 0x09, 0x00, 0x01, 'l', 0x20, 0x00, 0x00, 0x00, 0x00, 0x00 } ) );
    }

    TEST_F( MalformedFixture, EndListWithElements )
    {
        EXPECT_EQ( nbt::ErrorKind::Format, failure( { 0x0a, 0x00, 0x00, 0x09, 0x00, 0x01, 'l', 0x00, 0x00, 0x00, 0x00, 0x02, 0x00 } ) );
    }

    TEST_F( MalformedFixture, ImpossibleCount )
    {
        /* a byte array claiming 2^31 - 1 elements with two bytes behind it */
        EXPECT_EQ( nbt::ErrorKind::Truncated, failure( { 0x0a, 0x00, 0x00, 0x07, 0x00, 0x01, 'b', 0x7f, 0xff, 0xff, 0xff, 0x01, 0x00 } ) );

        /* a list of longs claiming more elements than bytes left */
        EXPECT_EQ( nbt::ErrorKind::Truncated, failure( { 0x0a, 0x00, 0x00, 0x09, 0x00, 0x01, 'l', 0x04, 0x00, 0x00, 0x00, 0x02, 0, 0, 0, 0, 0, 0, 0, 1, 0x00 } ) );
    }

    TEST( Malformed, NegativeCountIsEmpty )
    {
        const nbt::Bytes data = { 0x0a, 0x00, 0x00, 0x0b, 0x00, 0x01, 'i', 0xff, 0xff, 0xff, 0xfb, 0x00 };
        const auto root = nbt::parse_uncompressed( data );

        EXPECT_TRUE( root.value.at( "i" ).as_int_array ( ).empty ( ) );
    }
}

namespace envelope
{
    class EnvelopeFixture : public testing::Test
    {
    protected:
        nbt::RootTag root { "env", nbt::Compound { { "a", nbt::Tag::of_int( 42 ) } } };
        nbt::Bytes raw { nbt::write_uncompressed( root ) };

        void SetUp( ) override
        {
            nbt::Logger::instance ( ).clear_sinks ( );
        }

        void TearDown( ) override
        {
            nbt::Logger::instance ( ).clear_sinks ( );
            nbt::Logger::instance ( ).add_sink( nbt::sinks::console_sink ( ) );
        }
    };

    TEST( Envelope, MagicDetection )
    {
        EXPECT_TRUE( nbt::has_gzip_header( nbt::Bytes( { 0x1f, 0x8b } ) ) );
        EXPECT_TRUE( nbt::has_gzip_header( nbt::Bytes( { 0x1f, 0x8b, 0x08, 0x00 } ) ) );
        EXPECT_FALSE( nbt::has_gzip_header( nbt::Bytes( { 0x1f } ) ) );
        EXPECT_FALSE( nbt::has_gzip_header( nbt::Bytes( { 0x1f, 0x8c } ) ) );
        EXPECT_FALSE( nbt::has_gzip_header( nbt::Bytes( { 0x8b, 0x1f } ) ) );
        EXPECT_FALSE( nbt::has_gzip_header( nbt::Bytes( { 0x0a, 0x00, 0x00, 0x00 } ) ) );
        EXPECT_FALSE( nbt::has_gzip_header( nbt::Bytes ( ) ) );
    }

    TEST_F( EnvelopeFixture, UncompressedCompletesSynchronously )
    {
        auto called = false;
        auto decompressor_used = false;

        nbt::parse(
            raw,
            [ & ]( std::exception_ptr error, nbt::RootTag parsed )
            {
                called = true;
                EXPECT_FALSE( error );
                EXPECT_EQ( root, parsed );
            },
            [ & ]( const nbt::Bytes &, nbt::DecompressCallback )
            {
                decompressor_used = true;
            }
        );

        EXPECT_TRUE( called );
        EXPECT_FALSE( decompressor_used );
    }

    TEST_F( EnvelopeFixture, DecodeErrorsReachCallback )
    {
        auto called = false;

        nbt::parse(
            nbt::Bytes( { 0x01, 0x00 } ),
            [ & ]( std::exception_ptr error, nbt::RootTag )
            {
                called = true;
                ASSERT_TRUE( error );
                EXPECT_EQ( nbt::ErrorKind::Format, kind_of( error ) );
            }
        );

        EXPECT_TRUE( called );
    }

    TEST_F( EnvelopeFixture, GzipIsDelegated )
    {
        nbt::DecompressCallback pending;
        nbt::Bytes seen;
        auto called = false;

        const nbt::Bytes compressed = { 0x1f, 0x8b, 0x00, 0x01, 0x02 };

        nbt::parse(
            compressed,
            [ & ]( std::exception_ptr error, nbt::RootTag parsed )
            {
                called = true;
                EXPECT_FALSE( error );
                EXPECT_EQ( root, parsed );
            },
            [ & ]( const nbt::Bytes &input, nbt::DecompressCallback done )
            {
                seen = input;
                pending = std::move( done );
            }
        );

        /* nothing happens until the decompressor completes */
        EXPECT_FALSE( called );
        EXPECT_EQ( compressed, seen );

        ASSERT_TRUE( pending );
        pending( nullptr, raw );

        EXPECT_TRUE( called );
    }

    TEST_F( EnvelopeFixture, NoDecompressor )
    {
        auto called = false;

        nbt::parse(
            gzip_bytes( raw ),
            [ & ]( std::exception_ptr error, nbt::RootTag parsed )
            {
                called = true;
                ASSERT_TRUE( error );
                EXPECT_EQ( nbt::ErrorKind::DecompressorUnavailable, kind_of( error ) );
                EXPECT_TRUE( parsed.value.empty ( ) );
            },
            nbt::Decompressor ( )
        );

        EXPECT_TRUE( called );
    }

    TEST_F( EnvelopeFixture, DecompressorErrorIsVerbatim )
    {
        auto called = false;

        nbt::parse(
            gzip_bytes( raw ),
            [ & ]( std::exception_ptr error, nbt::RootTag )
            {
                called = true;
                ASSERT_TRUE( error );

                try
                {
                    std::rethrow_exception( error );
                }
                catch ( const std::runtime_error &e )
                {
                    EXPECT_STREQ( "boom", e.what ( ) );
                }
            },
            []( const nbt::Bytes &, nbt::DecompressCallback done )
            {
                done( std::make_exception_ptr( std::runtime_error( "boom" ) ), nbt::Bytes ( ) );
            }
        );

        EXPECT_TRUE( called );
    }

    TEST_F( EnvelopeFixture, ZlibRoundTrip )
    {
        const auto full = every_kind ( );
        const auto compressed = gzip_bytes( nbt::write_uncompressed( full ) );

        ASSERT_TRUE( nbt::has_gzip_header( compressed ) );

        auto called = false;

        nbt::parse(
            compressed,
            [ & ]( std::exception_ptr error, nbt::RootTag parsed )
            {
                called = true;
                EXPECT_FALSE( error );
                EXPECT_EQ( full, parsed );
            }
        );

        EXPECT_TRUE( called );
    }

    TEST_F( EnvelopeFixture, DamagedGzip )
    {
        auto compressed = gzip_bytes( raw );
        compressed.resize( compressed.size ( ) / 2 );

        try
        {
            nbt::gunzip( compressed );
            FAIL ( ) << "truncated gzip accepted";
        }
        catch ( const nbt::Error &e )
        {
            EXPECT_EQ( nbt::ErrorKind::Decompression, e.kind ( ) );
        }

        auto called = false;

        nbt::parse(
            compressed,
            [ & ]( std::exception_ptr error, nbt::RootTag )
            {
                called = true;
                ASSERT_TRUE( error );
                EXPECT_EQ( nbt::ErrorKind::Decompression, kind_of( error ) );
            }
        );

        EXPECT_TRUE( called );
    }

    TEST_F( EnvelopeFixture, ConcatenatedMembers )
    {
        const auto first = bytes_of( "first " );
        const auto second = bytes_of( "second" );

        auto joined = gzip_bytes( first );
        const auto tail = gzip_bytes( second );
        joined.insert( joined.end ( ), tail.begin ( ), tail.end ( ) );

        EXPECT_EQ( bytes_of( "first second" ), nbt::gunzip( joined ) );
    }

    TEST_F( EnvelopeFixture, ZeroPaddingAfterMember )
    {
        auto padded = gzip_bytes( raw );
        padded.insert( padded.end ( ), 8, 0x00 );

        EXPECT_EQ( raw, nbt::gunzip( padded ) );

        auto called = false;

        nbt::parse(
            padded,
            [ & ]( std::exception_ptr error, nbt::RootTag parsed )
            {
                called = true;
                EXPECT_FALSE( error );
                EXPECT_EQ( root, parsed );
            }
        );

        EXPECT_TRUE( called );
    }

    TEST_F( EnvelopeFixture, PaddingBetweenMembersIsTrailing )
    {
        const auto tail = gzip_bytes( bytes_of( "tail" ) );

        auto padded = gzip_bytes( bytes_of( "head" ) );
        padded.insert( padded.end ( ), 4, 0x00 );
        padded.insert( padded.end ( ), tail.begin ( ), tail.end ( ) );

        EXPECT_THROW( nbt::gunzip( padded ), nbt::Error );
    }

    TEST_F( EnvelopeFixture, TrailingGarbage )
    {
        auto damaged = gzip_bytes( raw );
        damaged.push_back( 0x0a );
        damaged.push_back( 0x00 );

        try
        {
            nbt::gunzip( damaged );
            FAIL ( ) << "trailing bytes accepted";
        }
        catch ( const nbt::Error &e )
        {
            EXPECT_EQ( nbt::ErrorKind::Decompression, e.kind ( ) );
        }
    }

    TEST_F( EnvelopeFixture, ZlibFailuresReachCallback )
    {
        auto called = false;

        /* gunzip rejects empty input; the decompressor reports it instead of throwing */
        nbt::zlib_decompressor ( )(
            nbt::Bytes ( ),
            [ & ]( std::exception_ptr error, nbt::Bytes inflated )
            {
                called = true;
                ASSERT_TRUE( error );
                EXPECT_EQ( nbt::ErrorKind::InvalidArgument, kind_of( error ) );
                EXPECT_TRUE( inflated.empty ( ) );
            }
        );

        EXPECT_TRUE( called );
    }

    TEST_F( EnvelopeFixture, Preconditions )
    {
        const nbt::ParseCallback ignore = []( std::exception_ptr, nbt::RootTag ) { };

        EXPECT_THROW( nbt::parse( nbt::Bytes ( ), ignore ), nbt::Error );
        EXPECT_THROW( nbt::parse( raw, nbt::ParseCallback ( ) ), nbt::Error );
        EXPECT_THROW( nbt::gunzip( nbt::Bytes ( ) ), nbt::Error );
    }
}

namespace logging
{
    class LoggerFixture : public testing::Test
    {
    protected:
        std::vector< nbt::Logger::LogEntry > entries;

        void SetUp( ) override
        {
            auto &logger = nbt::Logger::instance ( );

            logger.clear_sinks ( );
            logger.add_sink( [ this ]( const nbt::Logger::LogEntry &entry ) { entries.push_back( entry ); } );
        }

        void TearDown( ) override
        {
            auto &logger = nbt::Logger::instance ( );

            logger.set_level( nbt::LogLevel::Warning );
            logger.clear_sinks ( );
            logger.add_sink( nbt::sinks::console_sink ( ) );
        }
    };

    TEST_F( LoggerFixture, Placeholders )
    {
        nbt::Logger::instance ( ).log_formatted( nbt::LogLevel::Error, "test", "{} + {} = {} {}", 1, 2, 3, std::string( "{}" ) );

        ASSERT_EQ( 1u, entries.size ( ) );
        EXPECT_EQ( "1 + 2 = 3 {}", entries[ 0 ].message );
        EXPECT_EQ( "test", entries[ 0 ].category );
        EXPECT_EQ( nbt::LogLevel::Error, entries[ 0 ].level );
    }

    TEST_F( LoggerFixture, LevelFilter )
    {
        NBT_LOG_DEBUG( "test", "hidden" );
        NBT_LOG_WARN( "test", "shown" );

        ASSERT_EQ( 1u, entries.size ( ) );
        EXPECT_EQ( "shown", entries[ 0 ].message );
        EXPECT_EQ( "WARN", nbt::Logger::level_to_string( entries[ 0 ].level ) );
    }

    TEST_F( LoggerFixture, DuplicateKeyIsReported )
    {
        nbt::Logger::instance ( ).set_level( nbt::LogLevel::Debug );

        const nbt::Bytes data = {
            0x0a, 0x00, 0x00,
            0x01, 0x00, 0x01, 'k', 0x01,
            0x01, 0x00, 0x01, 'k', 0x02,
            0x00
        };

        EXPECT_EQ( 2, nbt::parse_uncompressed( data ).value.at( "k" ).as_byte ( ) );

        auto reported = false;

        for ( const auto &entry : entries )
            reported |= entry.category == "reader" && entry.message == "duplicate compound key \"k\" replaced";

        EXPECT_TRUE( reported );
    }
}
