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
/** \file tests/test_inficon.cpp
    \brief Tests of the Inficon Hapsite decoder.
*/

#include <cstring>
#include <sstream>

#include <librectab/inficon.hpp>

#include "test_util.hpp"

using namespace RECTAB_NS;

namespace {

//------------------------------------------------------------------------------
// Little endian byte string builder.
struct CBytes
{
    std::string s;

    CBytes & U8( uint8_t v ) { s += (char)v; return *this; }
    CBytes & U16( uint16_t v ) { return U8( v & 0xFF ).U8( v >> 8 ); }

    CBytes & U32( uint32_t v )
    {
        return U16( v & 0xFFFF ).U16( v >> 16 );
    }

    CBytes & Zeros( size_t n ) { s.append( n, '\0' ); return *this; }
    CBytes & Str( std::string const & v ) { s += v; return *this; }

    CBytes & F32( float v )
    {
        uint32_t u;
        memcpy( &u, &v, sizeof( u ) );
        return U32( u );
    }

    CBytes & Scan( uint32_t idx, int32_t ms, uint16_t n_mzs, uint16_t seg )
    {
        return U32( idx ).U32( (uint32_t)ms ).U16( 1 ).U16( n_mzs )
                         .U16( 0xFFFF ).U16( (seg << 4) | 0x0F );
    }
};

//------------------------------------------------------------------------------
// Two segments: one single m/z (50) and one range 100..102.
std::string MkHeader( uint32_t data_len )
{
    CBytes b;
    b.Str( std::string( "\x04\x03\x02\x01SPAH", 8 ) ).Zeros( 8 );
    b.U32( 0xFFFFFFFF ).Zeros( 32 ).U32( 0xFFFFFFF6 ).Zeros( 4 );
    b.Zeros( 104 );
    b.U32( 2 );
    b.Zeros( 96 ).U32( 1 ).U32( 5000 ).U32( 5000 ).Zeros( 16 ).U32( 0 )
     .Zeros( 4 );
    b.Zeros( 96 ).U32( 1 ).U32( 10000 ).U32( 10200 ).Zeros( 16 ).U32( 1 )
     .Zeros( 4 );
    b.Zeros( 10 );
    b.Str( "\xFF\xFF\xFF\xFFHapsGPIR" ).Zeros( 168 ).U32( data_len ).Zeros( 8 );
    b.Str( "HapsScan" ).Zeros( 56 );
    return b.s;
}

std::string MkScans()
{
    CBytes b;
    b.Scan( 1, 60000, 1, 0 ).F32( 10.5f );
    b.Scan( 2, 120000, 3, 1 ).F32( 1.0f ).F32( 2.0f ).F32( 3.0f );
    return b.s;
}

std::shared_ptr< CReadBuffer > MkBuf( std::string const & data, size_t chunk )
{
    if( chunk == 0 )
    {
        return std::make_shared< CReadBuffer >( data );
    }

    return std::make_shared< CReadBuffer >(
            CReadBuffer::Stream( new std::istringstream( data ) ), chunk );
}

std::vector< InficonRecord > ReadAll( std::string const & data,
                                      size_t chunk = 0 )
{
    CRecordReader< CInficonDecoder > r( MkBuf( data, chunk ) );
    std::vector< InficonRecord > result;
    InficonRecord rec;
    while( r.Next( rec ) ) result.push_back( rec );
    return result;
}

std::string ErrorOf( std::string const & data )
{
    try
    {
        ReadAll( data );
    }
    catch( CFormatError const & e )
    {
        return e.what();
    }

    return "";
}

}

//------------------------------------------------------------------------------
static void test_header() {
    CRecordReader< CInficonDecoder > r( MkBuf( MkHeader( 48 ) + MkScans(), 0 ) );
    auto const & segs( r.GetDecoder().GetSegments() );
    CHECK_EQ( segs.size(), 2u );
    CHECK_EQ( segs[0].size(), 1u );
    CHECK_EQ( segs[1].size(), 3u );
    if( segs.size() != 2 || segs[1].size() != 3 ) return;
    CHECK_NEAR( segs[0][0], 50.0, 1e-9 );
    CHECK_NEAR( segs[1][0], 100.0, 1e-9 );
    CHECK_NEAR( segs[1][2], 102.0, 1e-9 );
}

static void test_records() {
    auto recs( ReadAll( MkHeader( 48 ) + MkScans() ) );
    CHECK_EQ( recs.size(), 4u );
    if( recs.size() != 4 ) return;

    double const expected[4][3] = {
        { 1.0, 50.0, 10.5 },
        { 2.0, 100.0, 1.0 },
        { 2.0, 101.0, 2.0 },
        { 2.0, 102.0, 3.0 },
    };

    for( size_t i( 0 ); i < 4; ++i )
    {
        CHECK_NEAR( recs[i].time, expected[i][0], 1e-9 );
        CHECK_NEAR( recs[i].mz, expected[i][1], 1e-9 );
        CHECK_NEAR( recs[i].intensity, expected[i][2], 1e-9 );
    }

    // refills of any size give the same records
    for( size_t chunk : { 1, 5, 64 } )
    {
        auto r( ReadAll( MkHeader( 48 ) + MkScans(), chunk ) );
        CHECK_EQ( r.size(), 4u );

        for( size_t i( 0 ); i < 4 && i < r.size(); ++i )
        {
            CHECK_NEAR( r[i].mz, expected[i][1], 1e-9 );
            CHECK_NEAR( r[i].intensity, expected[i][2], 1e-9 );
        }
    }
}

static void test_data_length() {
    // only the first scan lies within the declared data length
    auto recs( ReadAll( MkHeader( 20 ) + MkScans() ) );
    CHECK_EQ( recs.size(), 1u );

    CHECK_EQ( ReadAll( MkHeader( 0 ) + MkScans() ).size(), 0u );

    // truncated scan data
    std::string cut( MkHeader( 48 ) + MkScans() );
    cut.resize( cut.size() - 2 );
    CHECK_STR_EQ( ErrorOf( cut ),
              std::string( "record ended prematurely in scan (byte " ) +
              std::to_string( cut.size() - 2 ) + ", record 4)" );
}

static void test_scan_errors() {
    std::string hdr( MkHeader( 48 ) );

    CHECK_STR_EQ( ErrorOf( hdr + CBytes().Scan( 1, 0, 2, 0 ).s ),
                  "number of intensities (2) doesn't match number of mzs (1)"
                  " (byte " + std::to_string( hdr.size() ) + ", record 1)" );
    CHECK_STR_EQ( ErrorOf( hdr + CBytes().Scan( 1, 0, 1, 5 ).s ),
                  "invalid segment number (5) specified (byte " +
                  std::to_string( hdr.size() ) + ", record 1)" );
}

static void test_header_errors() {
    std::string hdr( MkHeader( 48 ) );

    std::string bad_magic( hdr );
    bad_magic[0] = 5;
    CHECK_STR_EQ( ErrorOf( bad_magic ), "inficon file has bad magic bytes" );

    std::string no_list( hdr.substr( 0, 40 ) );
    CHECK_STR_EQ( ErrorOf( no_list ), "could not find m/z header list" );

    std::string no_scans( hdr.substr( 0, 440 ) );
    CHECK_STR_EQ( ErrorOf( no_scans ), "could not find start of scan data" );

    std::string bad_scan_hdr( hdr );
    bad_scan_hdr[bad_scan_hdr.size() - 60] = 'X';
    CHECK_STR_EQ( ErrorOf( bad_scan_hdr ), "data header was malformed" );
}

#include "inficon_fuzz.inc"

static void test_fuzz() {
    for( auto const & f : INFICON_FUZZ )
    {
        std::string data( (char const *)f.first, f.second );
        CHECK_THROWS( ReadAll( data ), CFormatError );
    }

    for( auto const & f : INFICON_CLEAN )
    {
        std::string data( (char const *)f.first, f.second );
        CHECK_EQ( ReadAll( data ).size(), 0u );
    }
}

int main() {
    test_header();
    test_records();
    test_data_length();
    test_scan_errors();
    test_header_errors();
    test_fuzz();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}

