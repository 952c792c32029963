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
/** \file libseq/fasta.cpp
    \brief FASTA record decoder.
*/

#include <libseq/fasta.hpp>

SEQ_NS_BEGIN

using namespace TOOLS_NS;

//------------------------------------------------------------------------------
TFieldNames const & CFastaDecoder::GetFieldNames()
{
    static TFieldNames const names = { "id", "sequence" };
    return names;
}

//------------------------------------------------------------------------------
void CFastaDecoder::Reset()
{
    hdr_end_ = seq_start_ = seq_end_ = scan_pos_ = 0;
    newlines_.clear();
}

//------------------------------------------------------------------------------
EParseStatus CFastaDecoder::Parse(
        char const * data, size_t len, bool eof, size_t & consumed )
{
    if( IsBlank( data, len ) )
    {
        return eof ? END_OF_STREAM : NEED_MORE;
    }

    if( data[0] != '>' )
    {
        M_THROW_FORMAT( "valid FASTA records start with '>'" );
    }

    size_t nl( FindByte( data, 1, len, '\n' ) );

    if( nl == NPOS )
    {
        return NeedMore( eof, "header" );
    }

    hdr_end_ = StripCR( data, 1, nl );
    seq_start_ = nl + 1;

    // the scan resumes where the previous attempt on this record stopped;
    // the header newline is a candidate end too (empty sequence)
    if( scan_pos_ == 0 )
    {
        scan_pos_ = nl;
        newlines_.clear();
    }

    size_t rec_end( NPOS );

    while( rec_end == NPOS )
    {
        size_t p( FindByte( data, scan_pos_, len, '\n' ) );

        if( p == NPOS )
        {
            if( !eof )
            {
                scan_pos_ = len;
                return NEED_MORE;
            }

            seq_end_ = rec_end = len;
        }
        else if( p + 1 == len && !eof )
        {
            // can not tell yet whether the next line is a header
            scan_pos_ = p;
            return NEED_MORE;
        }
        else if( p + 1 < len && data[p + 1] == '>' )
        {
            seq_end_ = Max( p, seq_start_ );
            rec_end = p + 1;
        }
        else
        {
            if( p != nl )
            {
                if( p > seq_start_ && data[p - 1] == '\r' )
                {
                    newlines_.push_back( p - 1 );
                }

                newlines_.push_back( p );
            }

            scan_pos_ = p + 1;
        }
    }

    while( seq_end_ > seq_start_ &&
           (data[seq_end_ - 1] == '\n' || data[seq_end_ - 1] == '\r') )
    {
        --seq_end_;
    }

    while( !newlines_.empty() && newlines_.back() >= seq_end_ )
    {
        newlines_.pop_back();
    }

    consumed = rec_end;
    return RECORD;
}

//------------------------------------------------------------------------------
void CFastaDecoder::Get( char const * data, Record & rec )
{
    rec.id.assign( data + 1, hdr_end_ - 1 );
    rec.sequence.clear();
    rec.sequence.reserve( seq_end_ - seq_start_ - newlines_.size() );
    size_t start( seq_start_ );

    for( auto p : newlines_ )
    {
        rec.sequence.append( data + start, p - start );
        start = p + 1;
    }

    rec.sequence.append( data + start, seq_end_ - start );
    Reset();
}

SEQ_NS_END

