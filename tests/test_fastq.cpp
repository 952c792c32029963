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
/** \file tests/test_fastq.cpp
    \brief Tests of the FASTQ decoder.
*/

#include <sstream>

#include <libtools/parse.hpp>

#include <libseq/fastq.hpp>

#include "test_util.hpp"

using namespace TOOLS_NS;
using namespace SEQ_NS;

typedef CRecordReader< CFastqDecoder > TReader;

static std::vector< FastqRecord > ReadAll( std::string const & data,
                                           size_t chunk = 0 )
{
    std::shared_ptr< CReadBuffer > buf(
            chunk == 0 ? new CReadBuffer( data )
                       : new CReadBuffer( CReadBuffer::Stream(
                                new std::istringstream( data ) ), chunk ) );
    TReader r( buf );
    std::vector< FastqRecord > result;
    FastqRecord rec;
    while( r.Next( rec ) ) result.push_back( rec );
    return result;
}

static std::string ErrorOf( std::string const & data )
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

static void test_two_records() {
    auto recs( ReadAll( "@id\nACGT\n+\n!!!!\n@id2\nTGCA\n+\n!!!!" ) );
    CHECK_EQ( recs.size(), 2u );
    CHECK_STR_EQ( recs[0].id, "id" );
    CHECK_STR_EQ( recs[0].sequence, "ACGT" );
    CHECK_STR_EQ( recs[0].quality, "!!!!" );
    CHECK_STR_EQ( recs[1].id, "id2" );
    CHECK_STR_EQ( recs[1].sequence, "TGCA" );
    CHECK_STR_EQ( recs[1].quality, "!!!!" );
}

static void test_crlf() {
    auto recs( ReadAll(
            "@id\r\nACGT\r\n+\r\n!!!!\r\n@id2\r\nTGCA\r\n+\r\n!!!!\r\n" ) );
    CHECK_EQ( recs.size(), 2u );
    CHECK_STR_EQ( recs[0].id, "id" );
    CHECK_STR_EQ( recs[0].sequence, "ACGT" );
    CHECK_STR_EQ( recs[0].quality, "!!!!" );
    CHECK_STR_EQ( recs[1].id, "id2" );
    CHECK_STR_EQ( recs[1].sequence, "TGCA" );
    CHECK_STR_EQ( recs[1].quality, "!!!!" );
}

static void test_quality_may_contain_markers() {
    // '@' and '+' are valid quality characters
    auto recs( ReadAll( "@r1 desc\nACG\n+r1 desc\n@+I\n@r2\nT\n+\n@\n" ) );
    CHECK_EQ( recs.size(), 2u );
    CHECK_STR_EQ( recs[0].id, "r1 desc" );
    CHECK_STR_EQ( recs[0].quality, "@+I" );
    CHECK_STR_EQ( recs[1].sequence, "T" );
    CHECK_STR_EQ( recs[1].quality, "@" );

    for( auto const & r : recs )
    {
        CHECK_EQ( r.quality.size(), r.sequence.size() );
    }
}

static void test_empty_input() {
    CHECK_EQ( ReadAll( "" ).size(), 0u );
    CHECK_EQ( ReadAll( "@id\nA\n+\nI\n\n" ).size(), 1u );
}

static void test_errors() {
    CHECK_STR_EQ( ErrorOf( "@DF\n+\n+\n!" ),
                  "unexpected + found in sequence" );
    CHECK_STR_EQ( ErrorOf( "@\n" ), "record ended prematurely in sequence" );
    CHECK_STR_EQ( ErrorOf( "@id" ), "record ended prematurely in header" );
    CHECK_STR_EQ( ErrorOf( "@id\nAC\n+" ),
                  "record ended prematurely in second header" );
    CHECK_STR_EQ( ErrorOf( "@id\nACGT\n+\nII" ),
                  "record ended prematurely in quality" );
    CHECK_STR_EQ( ErrorOf( ">id\nACGT\n" ),
                  "valid FASTQ records start with '@'" );
    CHECK_STR_EQ( ErrorOf( "@id\nACGT\n+\nIIIIII\n" ),
                  "quality length does not match sequence length" );
}

static void test_small_chunks() {
    std::string const data(
            "@a\nACGTN\n+\nIIIII\n@b\r\nGG\r\n+\r\n##\r\n@c\nT\n+\nI" );
    auto expected( ReadAll( data ) );
    CHECK_EQ( expected.size(), 3u );

    for( size_t chunk : { 1, 2, 5 } )
    {
        auto recs( ReadAll( data, chunk ) );
        CHECK_EQ( recs.size(), expected.size() );

        for( size_t i( 0 ); i < recs.size() && i < expected.size(); ++i )
        {
            CHECK_STR_EQ( recs[i].id, expected[i].id );
            CHECK_STR_EQ( recs[i].sequence, expected[i].sequence );
            CHECK_STR_EQ( recs[i].quality, expected[i].quality );
        }
    }
}

int main() {
    test_two_records();
    test_crlf();
    test_quality_may_contain_markers();
    test_empty_input();
    test_errors();
    test_small_chunks();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}

