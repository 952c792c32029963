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
/** \file tests/test_decompress.cpp
    \brief Tests of input type detection through a compression layer.
*/

#include <sstream>

#include <boost/iostreams/filtering_stream.hpp>

#include <config.h>

#ifdef USE_COMPRESSION
#   include <boost/iostreams/filter/bzip2.hpp>
#   include <boost/iostreams/filter/gzip.hpp>
#endif

#include <librectab/decompress.hpp>

#include "test_util.hpp"

using namespace RECTAB_NS;

namespace io = boost::iostreams;

namespace {

std::string const FASTQ_TEXT( "@r1\nACGT\n+\nIIII\n@r2\nGG\n+\n!!\n" );

CReadBuffer::Stream MkStream( std::string const & data )
{
    return CReadBuffer::Stream( new std::istringstream( data ) );
}

std::string Drain( CReadBuffer & b )
{
    while( b.Refill() > 0 ) {}
    return std::string( b.GetData(), b.GetSize() );
}

#ifdef USE_COMPRESSION
template< typename T_Filter >
std::string Compress( std::string const & data, T_Filter const & f )
{
    std::ostringstream out;

    {
        io::filtering_ostream os;
        os.push( f );
        os.push( out );
        os << data;
    }

    return out.str();
}
#endif

}

//------------------------------------------------------------------------------
static void test_pass_through() {
    for( size_t chunk : { 1, 7, 4096 } )
    {
        auto d( Decompress( MkStream( FASTQ_TEXT ), chunk ) );
        CHECK( d.file_type == CFileType( CFileType::FASTQ ) );
        CHECK( d.compression == CFileType() );
        CHECK_STR_EQ( Drain( *d.buf ), FASTQ_TEXT );
    }

    // inputs shorter than the sniffed prefix
    auto d( Decompress( MkStream( ">" ) ) );
    CHECK( d.file_type == CFileType( CFileType::FASTA ) );
    CHECK_STR_EQ( Drain( *d.buf ), ">" );

    auto e( Decompress( MkStream( "" ) ) );
    CHECK( e.file_type == CFileType() );
    CHECK_STR_EQ( Drain( *e.buf ), "" );

    CHECK_THROWS( Decompress( CReadBuffer::Stream() ), std::runtime_error );
}

static void test_long_input() {
    std::string data( ">long\n" );
    for( size_t i( 0 ); i < 5000; ++i ) data += "ACGTACGTAC\n";
    auto d( Decompress( MkStream( data ), 100 ) );
    CHECK( d.file_type == CFileType( CFileType::FASTA ) );
    CHECK_STR_EQ( Drain( *d.buf ), data );
}

#ifdef USE_COMPRESSION
static void test_gzip() {
    CHECK( HasCompressionSupport() );

    std::string packed( Compress( FASTQ_TEXT, io::gzip_compressor() ) );
    CHECK( CFileType::FromMagic( packed ) == CFileType( CFileType::GZIP ) );

    for( size_t chunk : { 1, 16, 4096 } )
    {
        auto d( Decompress( MkStream( packed ), chunk ) );
        CHECK( d.compression == CFileType( CFileType::GZIP ) );
        CHECK( d.file_type == CFileType( CFileType::FASTQ ) );
        CHECK_STR_EQ( Drain( *d.buf ), FASTQ_TEXT );
    }
}

static void test_gzip_members() {
    // block gzip files are concatenated gzip members
    std::string packed( Compress( FASTQ_TEXT, io::gzip_compressor() ) +
                        Compress( FASTQ_TEXT, io::gzip_compressor() ) );
    auto d( Decompress( MkStream( packed ) ) );
    CHECK( d.compression == CFileType( CFileType::GZIP ) );
    CHECK_STR_EQ( Drain( *d.buf ), FASTQ_TEXT + FASTQ_TEXT );
}

static void test_bzip2() {
    std::string packed( Compress( FASTQ_TEXT, io::bzip2_compressor() ) );
    auto d( Decompress( MkStream( packed ), 8 ) );
    CHECK( d.compression == CFileType( CFileType::BZIP ) );
    CHECK( d.file_type == CFileType( CFileType::FASTQ ) );
    CHECK_STR_EQ( Drain( *d.buf ), FASTQ_TEXT );
}

static void test_corrupt() {
    std::string packed( Compress( FASTQ_TEXT, io::gzip_compressor() ) );
    packed[2] = 7;     // unknown compression method
    CHECK_THROWS(
            {
                auto d( Decompress( MkStream( packed ) ) );
                Drain( *d.buf );
            },
            std::runtime_error );
}
#else
static void test_no_support() {
    std::string packed( "\x1F\x8B\x08\x00" "abcdef", 10 );
    auto d( Decompress( MkStream( packed ) ) );
    CHECK( !HasCompressionSupport() );
    CHECK( d.file_type == CFileType( CFileType::GZIP ) );
    CHECK( d.compression == CFileType() );
    CHECK_STR_EQ( Drain( *d.buf ), packed );
}
#endif

int main() {
    test_pass_through();
    test_long_input();
#ifdef USE_COMPRESSION
    test_gzip();
    test_gzip_members();
    test_bzip2();
    test_corrupt();
#else
    test_no_support();
#endif
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}

