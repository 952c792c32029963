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
/** \file libseq/sam.cpp
    \brief SAM alignment record and text SAM decoder.
*/

#include <limits>
#include <type_traits>

#include <boost/lexical_cast/try_lexical_convert.hpp>

#include <libseq/sam.hpp>

SEQ_NS_BEGIN

using namespace TOOLS_NS;

namespace {

//------------------------------------------------------------------------------
/** Convert a decimal field to an integer of the given type.

    \throws CFormatError naming the field if the text is not a number
                         representable by T_Int.
*/
template< typename T_Int >
T_Int ParseInt( char const * b, char const * e, char const * field )
{
    typedef typename std::conditional<
        std::is_signed< T_Int >::value, int64_t, uint64_t >::type TWide;
    TWide v( 0 );

    if( b == e || (!std::is_signed< T_Int >::value && *b == '-') ||
        !boost::conversion::try_lexical_convert( b, (size_t)(e - b), v ) ||
        v < (TWide)std::numeric_limits< T_Int >::min() ||
        v > (TWide)std::numeric_limits< T_Int >::max() )
    {
        M_THROW_FORMAT( "invalid " << field << " value '"
                        << std::string( b, e ) << '\'' );
    }

    return (T_Int)v;
}

//------------------------------------------------------------------------------
inline bool IsStar( char const * b, char const * e )
{
    return e - b == 1 && *b == '*';
}

//------------------------------------------------------------------------------
/** 1-based SAM position to 0-based; 0 means absent. */
inline boost::optional< uint64_t > ParsePos(
        char const * b, char const * e, char const * field )
{
    auto v( ParseInt< uint64_t >( b, e, field ) );
    if( v == 0 ) return boost::none;
    return v - 1;
}

}

//------------------------------------------------------------------------------
TFieldNames const & GetAlignmentFieldNames()
{
    static TFieldNames const names = {
        "query_name", "flag", "ref_name", "pos", "mapq", "cigar",
        "rnext", "pnext", "tlen", "seq", "qual", "extra"
    };

    return names;
}

//------------------------------------------------------------------------------
/** Length of the blank lines starting at pos.

    \return NPOS if the window ends before the blank lines do.
*/
size_t CSamDecoder::BlankLines(
        char const * data, size_t pos, size_t len, bool eof )
{
    size_t const start( pos );

    while( pos < len )
    {
        if( data[pos] == '\n' )
        {
            ++pos;
        }
        else if( data[pos] == '\r' && pos + 1 < len && data[pos + 1] == '\n' )
        {
            pos += 2;
        }
        else if( data[pos] == '\r' && pos + 1 == len )
        {
            if( !eof ) return NPOS;
            ++pos;
        }
        else
        {
            return pos - start;
        }
    }

    return eof ? pos - start : NPOS;
}

//------------------------------------------------------------------------------
void CSamDecoder::Init( CReadBuffer & buf )
{
    // header lines and blank lines before the first alignment
    while( buf.Reserve( 2 ) || !buf.IsEmpty() )
    {
        char const * data( buf.GetData() );

        if( data[0] == '@' )
        {
            if( !buf.SeekPattern( "\n", 1 ) ) break;
            buf.Consume( 1 );
        }
        else if( data[0] == '\n' || (data[0] == '\r' && buf.GetSize() == 1) )
        {
            buf.Consume( 1 );
        }
        else if( data[0] == '\r' && data[1] == '\n' )
        {
            buf.Consume( 2 );
        }
        else
        {
            break;
        }
    }
}

//------------------------------------------------------------------------------
EParseStatus CSamDecoder::Parse(
        char const * data, size_t len, bool eof, size_t & consumed )
{
    if( len == 0 )
    {
        return eof ? END_OF_STREAM : NEED_MORE;
    }

    size_t const start( 0 );
    size_t end( 0 ),
           rec_end( 0 ),
           nl( FindByte( data, start, len, '\n' ) );

    if( nl == NPOS )
    {
        if( !eof ) return NEED_MORE;
        end = rec_end = len;
        if( data[end - 1] == '\r' ) --end;
    }
    else
    {
        end = StripCR( data, start, nl );
        rec_end = nl + 1;
    }

    // blank lines after the record go with it, so the next record
    // starts at its own first byte
    size_t blank( BlankLines( data, rec_end, len, eof ) );
    if( blank == NPOS ) return NEED_MORE;

    fields_.clear();

    for( size_t b( start ); ; )
    {
        size_t tab( FindByte( data, b, end, '\t' ) );

        if( tab == NPOS )
        {
            fields_.push_back( TSpan( b, end ) );
            break;
        }

        fields_.push_back( TSpan( b, tab ) );
        b = tab + 1;
    }

    if( fields_.size() < N_MANDATORY )
    {
        M_THROW_FORMAT( "sam record too short" );
    }

    auto field_b( [&]( size_t i ) { return data + fields_[i].first; } );
    auto field_e( [&]( size_t i ) { return data + fields_[i].second; } );

    flag_ = ParseInt< uint16_t >( field_b( 1 ), field_e( 1 ), "flag" );
    pos_ = ParsePos( field_b( 3 ), field_e( 3 ), "pos" );

    if( std::string( field_b( 4 ), field_e( 4 ) ) == "255" )
    {
        mapq_ = boost::none;
    }
    else
    {
        mapq_ = ParseInt< uint8_t >( field_b( 4 ), field_e( 4 ), "mapq" );
    }

    pnext_ = ParsePos( field_b( 7 ), field_e( 7 ), "pnext" );
    tlen_ = ParseInt< int32_t >( field_b( 8 ), field_e( 8 ), "tlen" );
    consumed = rec_end + blank;
    return RECORD;
}

//------------------------------------------------------------------------------
void CSamDecoder::Get( char const * data, Record & rec )
{
    auto assign( [&]( std::string & dst, size_t i, bool star_empty )
    {
        char const * b( data + fields_[i].first ),
                   * e( data + fields_[i].second );

        if( star_empty && IsStar( b, e ) )
        {
            dst.clear();
        }
        else
        {
            dst.assign( b, e );
        }
    } );

    assign( rec.query_name, 0, false );
    rec.flag = flag_;
    assign( rec.ref_name, 2, true );
    rec.pos = pos_;
    rec.mapq = mapq_;
    assign( rec.cigar, 5, true );
    assign( rec.rnext, 6, true );
    rec.pnext = pnext_;
    rec.tlen = tlen_;
    assign( rec.seq, 9, true );
    assign( rec.qual, 10, true );
    rec.extra.clear();

    for( size_t i( N_MANDATORY ); i < fields_.size(); ++i )
    {
        if( i > N_MANDATORY ) rec.extra += '|';
        rec.extra.append( data + fields_[i].first, data + fields_[i].second );
    }
}

SEQ_NS_END

