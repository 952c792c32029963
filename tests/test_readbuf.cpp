/*  $Id$
* ===========================================================================
*
*                            PUBLIC DOMAIN NOTICE
*               National Center for Biotechnology Information
*
*  This software/database is a "United States Government Work" under the
*  terms of the United States Copyright Act.  It was written as part of
*  the author's official duties as a United States Government employee and
*  thus cannot be copyrighted.  This software/database is freely available
*  to the public for use. The National Library of Medicine and the U.S.
*  Government have not placed any restriction on its use or reproduction.
*
*  Although all reasonable efforts have been taken to ensure the accuracy
*  and reliability of the software and data, the NLM and the U.S.
*  Government do not and cannot warrant the performance or results that
*  may be obtained by using this software or data. The NLM and the U.S.
*  Government disclaim all warranties, express or implied, including
*  warranties of performance, merchantability or fitness for any particular
*  purpose.
*
*  Please cite the author in any work or product based on this material.
*
* ===========================================================================
*
* Authors:  Aleksandr Morgulis
*
*/
/** \file tests/test_readbuf.cpp
    \brief Tests of the streaming read buffer and the parse driver.
*/

#include <sstream>

#include <libtools/parse.hpp>
#include <libtools/readbuf.hpp>

#include "test_util.hpp"

using namespace TOOLS_NS;

static CReadBuffer::Stream MkStream( std::string const & data )
{
    return CReadBuffer::Stream( new std::istringstream( data ) );
}

static void test_refill_and_consume() {
    CReadBuffer buf( MkStream( "abcdefghij" ), 4 );
    CHECK( buf.IsEmpty() );
    CHECK( !buf.IsEof() );

    CHECK_EQ( buf.Refill(), 4u );
    CHECK_STR_EQ( std::string( buf.GetData(), buf.GetSize() ), "abcd" );

    auto s( buf.Consume( 2 ) );
    CHECK_STR_EQ( s.ToString(), "ab" );
    CHECK_EQ( buf.GetOffset(), 2u );
    CHECK_EQ( buf.GetSize(), 2u );

    // the window holds 2 bytes, so the chunk size wins
    CHECK_EQ( buf.Refill(), 4u );
    CHECK_STR_EQ( std::string( buf.GetData(), buf.GetSize() ), "cdefgh" );
    CHECK( !s.IsValid() );
    CHECK_THROWS( s.GetData(), std::runtime_error );

    // the window is larger than the chunk now
    CHECK_EQ( buf.Refill(), 2u );
    CHECK( buf.IsEof() );
    CHECK_EQ( buf.Refill(), 0u );
    CHECK_STR_EQ( std::string( buf.GetData(), buf.GetSize() ), "cdefghij" );

    CHECK_THROWS( buf.Consume( 9 ), std::runtime_error );
    buf.Consume( 8 );
    CHECK( buf.IsEmpty() );
    CHECK_EQ( buf.GetOffset(), 10u );
}

static void test_slice_survives_consume() {
    CReadBuffer buf( MkStream( "0123456789" ), 16 );
    buf.Refill();
    auto a( buf.Consume( 3 ) );
    auto b( buf.Consume( 3 ) );
    CHECK( a.IsValid() );
    CHECK_STR_EQ( a.ToString(), "012" );
    CHECK_STR_EQ( b.ToString(), "345" );
    CHECK( CBufSlice().IsValid() );
}

static void test_reserve() {
    CReadBuffer buf( MkStream( "0123456789" ), 1 );
    CHECK( buf.Reserve( 5 ) );
    CHECK( buf.GetSize() >= 5u );
    CHECK( buf.Reserve( 10 ) );
    CHECK( !buf.Reserve( 11 ) );
    CHECK( buf.IsEof() );
    CHECK_EQ( buf.GetSize(), 10u );
}

static void test_seek_pattern() {
    // pattern straddles the refill boundary
    CReadBuffer buf( MkStream( "xxxxxxxHapsyyy" ), 5 );
    CHECK( buf.SeekPattern( std::string( "Haps" ) ) );
    CHECK_EQ( buf.GetOffset(), 7u );
    CHECK( buf.Reserve( 4 ) );
    CHECK_STR_EQ( std::string( buf.GetData(), 4 ), "Haps" );

    CReadBuffer miss( MkStream( "no marker here" ), 3 );
    CHECK( !miss.SeekPattern( std::string( "Haps" ) ) );
    CHECK( miss.IsEmpty() );
    CHECK( miss.IsEof() );
    CHECK_EQ( miss.GetOffset(), 14u );
}

static void test_in_memory() {
    CReadBuffer buf( std::string( "abc" ) );
    CHECK( buf.IsEof() );
    CHECK_EQ( buf.GetSize(), 3u );
    CHECK_EQ( buf.Refill(), 0u );

    CReadBuffer::Stream none;
    CHECK_THROWS( CReadBuffer b( none ), std::runtime_error );
}

static void test_setup_helpers() {
    std::string data( "\x01\x02\x03\x04" "abcdef", 10 );
    CReadBuffer buf( MkStream( data ), 1 );
    CHECK_EQ( ReadLE< uint32_t >( buf, "word" ), 0x04030201u );
    CHECK_STR_EQ( ReadBytes( buf, 2, "bytes" ), "ab" );
    SkipBytes( buf, 3, "skip" );
    CHECK_STR_EQ( ReadBytes( buf, 1, "bytes" ), "f" );

    try
    {
        SkipBytes( buf, 1, "trailer" );
        CHECK( false );
    }
    catch( CFormatError const & e )
    {
        CHECK_STR_EQ( e.what(), "record ended prematurely in trailer" );
        CHECK( !e.HasPosition() );
    }
}

//------------------------------------------------------------------------------
// Decoder of 2-byte big endian length prefixed strings.
struct CTestDecoder
{
    typedef std::string Record;
    static bool const POSITIONAL = true;

    void Init( CReadBuffer & ) {}

    EParseStatus Parse( char const * data, size_t len, bool eof,
                        size_t & consumed )
    {
        if( len == 0 && eof ) return END_OF_STREAM;
        if( len < 2 ) return NeedMore( eof, "length" );
        size_t n( (uint8_t)data[0]*256 + (uint8_t)data[1] );
        if( n == 0xFFFF ) M_THROW_FORMAT( "bad length" );
        if( len < n + 2 ) return NeedMore( eof, "payload" );
        consumed = n + 2;
        return RECORD;
    }

    void Get( char const * data, Record & rec )
    {
        size_t n( (uint8_t)data[0]*256 + (uint8_t)data[1] );
        rec.assign( data + 2, n );
    }
};

static void test_record_reader() {
    std::string data( "\x00\x03" "abc" "\x00\x00" "\x00\x02" "de", 11 );
    CRecordReader< CTestDecoder > r(
            std::make_shared< CReadBuffer >( MkStream( data ), 1 ) );
    std::string rec;
    CHECK( r.Next( rec ) );
    CHECK_STR_EQ( rec, "abc" );
    CHECK( r.Next( rec ) );
    CHECK_STR_EQ( rec, "" );
    CHECK( r.Next( rec ) );
    CHECK_STR_EQ( rec, "de" );
    CHECK( !r.Next( rec ) );
    CHECK( r.IsDone() );
    CHECK( !r.Next( rec ) );
    CHECK_EQ( r.GetBuffer().GetRecordNo(), 3u );
}

static void test_record_reader_errors() {
    std::string data( "\x00\x01" "a" "\xFF\xFF", 5 );
    CRecordReader< CTestDecoder > r(
            std::make_shared< CReadBuffer >( MkStream( data ), 2 ) );
    std::string rec;
    CHECK( r.Next( rec ) );

    try
    {
        r.Next( rec );
        CHECK( false );
    }
    catch( CFormatError const & e )
    {
        CHECK( e.HasPosition() );
        CHECK_EQ( e.GetOffset(), 3u );
        CHECK_EQ( e.GetRecordNo(), 2u );
        CHECK_STR_EQ( e.what(), "bad length (byte 3, record 2)" );
    }

    CHECK( r.IsFailed() );
    CHECK_THROWS( r.Next( rec ), CFormatError );

    // truncated payload at end of input
    std::string cut( "\x00\x05" "ab", 4 );
    CRecordReader< CTestDecoder > t(
            std::make_shared< CReadBuffer >( cut ) );

    try
    {
        t.Next( rec );
        CHECK( false );
    }
    catch( CFormatError const & e )
    {
        CHECK_STR_EQ( e.GetMessage(), "record ended prematurely in payload" );
        CHECK_EQ( e.GetRecordNo(), 1u );
    }
}

int main() {
    test_refill_and_consume();
    test_slice_survives_consume();
    test_reserve();
    test_seek_pattern();
    test_in_memory();
    test_setup_helpers();
    test_record_reader();
    test_record_reader_errors();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}

