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
/** \file tests/test_fasta.cpp
    \brief Tests of the FASTA decoder.
*/

#include <sstream>

#include <libtools/parse.hpp>

#include <libseq/fasta.hpp>

#include "test_util.hpp"

using namespace TOOLS_NS;
using namespace SEQ_NS;

typedef CRecordReader< CFastaDecoder > TReader;

static std::vector< FastaRecord > ReadAll( std::string const & data,
                                           size_t chunk = 0 )
{
    std::shared_ptr< CReadBuffer > buf(
            chunk == 0 ? new CReadBuffer( data )
                       : new CReadBuffer( CReadBuffer::Stream(
                                new std::istringstream( data ) ), chunk ) );
    TReader r( buf );
    std::vector< FastaRecord > result;
    FastaRecord rec;
    while( r.Next( rec ) ) result.push_back( rec );
    return result;
}

static void test_two_records() {
    auto recs( ReadAll( ">id\nACGT\n>id2\nTGCA" ) );
    CHECK_EQ( recs.size(), 2u );
    CHECK_STR_EQ( recs[0].id, "id" );
    CHECK_STR_EQ( recs[0].sequence, "ACGT" );
    CHECK_STR_EQ( recs[1].id, "id2" );
    CHECK_STR_EQ( recs[1].sequence, "TGCA" );
}

static void test_multiline() {
    auto recs( ReadAll( ">id\nACGT\nAAAA\n>id2\nTGCA" ) );
    CHECK_EQ( recs.size(), 2u );
    CHECK_STR_EQ( recs[0].sequence, "ACGTAAAA" );
    CHECK_STR_EQ( recs[1].sequence, "TGCA" );
}

static void test_crlf() {
    auto recs( ReadAll( ">id\r\nACGT\r\nAAAA\r\n>id2\r\nTGCA\r\n" ) );
    CHECK_EQ( recs.size(), 2u );
    CHECK_STR_EQ( recs[0].id, "id" );
    CHECK_STR_EQ( recs[0].sequence, "ACGTAAAA" );
    CHECK_STR_EQ( recs[1].id, "id2" );
    CHECK_STR_EQ( recs[1].sequence, "TGCA" );
}

static void test_empty_fields() {
    auto recs( ReadAll( ">hd\n\n>\n\n" ) );
    CHECK_EQ( recs.size(), 2u );
    CHECK_STR_EQ( recs[0].id, "hd" );
    CHECK_STR_EQ( recs[0].sequence, "" );
    CHECK_STR_EQ( recs[1].id, "" );
    CHECK_STR_EQ( recs[1].sequence, "" );

    // no blank line between the header and the next record
    recs = ReadAll( ">a\n>b\nAC\n" );
    CHECK_EQ( recs.size(), 2u );
    CHECK_STR_EQ( recs[0].sequence, "" );
    CHECK_STR_EQ( recs[1].sequence, "AC" );
}

static void test_empty_input() {
    CHECK_EQ( ReadAll( "" ).size(), 0u );
    CHECK_EQ( ReadAll( "\n\n" ).size(), 0u );
}

static void test_errors() {
    CHECK_THROWS( ReadAll( "ACGT\n" ), CFormatError );
    CHECK_THROWS( ReadAll( ">id_without_newline" ), CFormatError );

    try
    {
        ReadAll( ">id" );
        CHECK( false );
    }
    catch( CFormatError const & e )
    {
        CHECK_STR_EQ( e.what(), "record ended prematurely in header" );
    }
}

static void test_small_chunks() {
    std::string const data(
            ">seq1 first\nACGTACGT\nAC\n>seq2\r\nGG\r\nTT\r\n>seq3\n\n" );
    auto expected( ReadAll( data ) );
    CHECK_EQ( expected.size(), 3u );
    CHECK_STR_EQ( expected[0].id, "seq1 first" );
    CHECK_STR_EQ( expected[0].sequence, "ACGTACGTAC" );
    CHECK_STR_EQ( expected[1].sequence, "GGTT" );
    CHECK_STR_EQ( expected[2].sequence, "" );

    for( size_t chunk : { 1, 2, 3, 7 } )
    {
        auto recs( ReadAll( data, chunk ) );
        CHECK_EQ( recs.size(), expected.size() );

        for( size_t i( 0 ); i < recs.size() && i < expected.size(); ++i )
        {
            CHECK_STR_EQ( recs[i].id, expected[i].id );
            CHECK_STR_EQ( recs[i].sequence, expected[i].sequence );
        }
    }
}

int main() {
    test_two_records();
    test_multiline();
    test_crlf();
    test_empty_fields();
    test_empty_input();
    test_errors();
    test_small_chunks();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}

