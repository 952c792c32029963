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
/** \file libseq/fastq.cpp
    \brief FASTQ record decoder.
*/

#include <libseq/fastq.hpp>

SEQ_NS_BEGIN

using namespace TOOLS_NS;

//------------------------------------------------------------------------------
TFieldNames const & CFastqDecoder::GetFieldNames()
{
    static TFieldNames const names = { "id", "sequence", "quality" };
    return names;
}

//------------------------------------------------------------------------------
EParseStatus CFastqDecoder::Parse(
        char const * data, size_t len, bool eof, size_t & consumed )
{
    if( IsBlank( data, len ) )
    {
        return eof ? END_OF_STREAM : NEED_MORE;
    }

    if( data[0] != '@' )
    {
        M_THROW_FORMAT( "valid FASTQ records start with '@'" );
    }

    size_t nl( FindByte( data, 0, len, '\n' ) );

    if( nl == NPOS )
    {
        return NeedMore( eof, "header" );
    }

    hdr_end_ = StripCR( data, 0, nl );
    seq_start_ = nl + 1;
    size_t plus( FindByte( data, seq_start_, len, '+' ) );

    if( plus == NPOS )
    {
        return NeedMore( eof, "sequence" );
    }

    if( plus == seq_start_ || data[plus - 1] != '\n' )
    {
        M_THROW_FORMAT( "unexpected + found in sequence" );
    }

    seq_end_ = StripCR( data, seq_start_, plus - 1 );
    nl = FindByte( data, plus, len, '\n' );

    if( nl == NPOS )
    {
        return NeedMore( eof, "second header" );
    }

    qual_start_ = nl + 1;

    // the quality line ends the same way the sequence line does
    size_t qual_end( qual_start_ + (seq_end_ - seq_start_) ),
           nl_width( plus - seq_end_ ),
           rec_end( qual_end + nl_width );

    if( rec_end > len && eof )
    {
        rec_end = Max( qual_end, len );
    }

    if( rec_end > len )
    {
        return NeedMore( eof, "quality" );
    }

    for( size_t i( qual_end ); i < rec_end; ++i )
    {
        if( data[i] != '\n' && data[i] != '\r' )
        {
            M_THROW_FORMAT( "quality length does not match sequence length" );
        }
    }

    consumed = rec_end;
    return RECORD;
}

//------------------------------------------------------------------------------
void CFastqDecoder::Get( char const * data, Record & rec )
{
    size_t seq_len( seq_end_ - seq_start_ );
    rec.id.assign( data + 1, hdr_end_ - 1 );
    rec.sequence.assign( data + seq_start_, seq_len );
    rec.quality.assign( data + qual_start_, seq_len );
}

SEQ_NS_END

