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
/** \file libseq/bam.cpp
    \brief Binary (BAM) alignment decoder.
*/

#include <libtools/byteorder.hpp>

#include <libseq/bam.hpp>

SEQ_NS_BEGIN

using namespace TOOLS_NS;

namespace {

char const BAM_MAGIC[] = "BAM\x01";
char const CIGAR_OPS[] = "MIDNSHP=X";
char const BASES[] = "=ACMGRSVTWYHKDBN";

uint32_t const N_CIGAR_OPS = 9;
uint8_t const NO_MAPQ = 255;
uint8_t const NO_QUAL = 0xFF;
int32_t const NO_POS = -1;

}

//------------------------------------------------------------------------------
void CBamDecoder::Init( CReadBuffer & buf )
{
    if( ReadBytes( buf, 4, "magic" ) != std::string( BAM_MAGIC, 4 ) )
    {
        M_THROW_FORMAT( "not a valid BAM file" );
    }

    SkipBytes( buf, ReadLE< uint32_t >( buf, "header" ), "header" );
    auto n_refs( ReadLE< uint32_t >( buf, "reference list" ) );

    // the count is not trusted for preallocation
    refs_.clear();
    refs_.reserve( Min( n_refs, 1024 ) );

    for( ; n_refs > 0; --n_refs )
    {
        auto name_len( ReadLE< uint32_t >( buf, "reference name length" ) );
        BamReference ref;
        ref.name = ReadBytes( buf, name_len, "reference name" );

        if( !ref.name.empty() && ref.name.back() == '\0' )
        {
            ref.name.pop_back();
        }

        ref.length = ReadLE< uint32_t >( buf, "reference length" );
        refs_.push_back( ref );
    }
}

//------------------------------------------------------------------------------
std::string const & CBamDecoder::RefName( int32_t id, char const * what ) const
{
    static std::string const NONE;

    if( id < 0 )
    {
        return NONE;
    }

    if( (size_t)id >= refs_.size() )
    {
        M_THROW_FORMAT( "invalid " << what << " id " << id );
    }

    return refs_[id].name;
}

//------------------------------------------------------------------------------
EParseStatus CBamDecoder::Parse(
        char const * data, size_t len, bool eof, size_t & consumed )
{
    if( len == 0 )
    {
        return eof ? END_OF_STREAM : NEED_MORE;
    }

    if( len < LEN_BYTES )
    {
        return NeedMore( eof, "record length" );
    }

    uint32_t block( GetLE< uint32_t >( data ) );

    if( block < FIXED_BYTES )
    {
        M_THROW_FORMAT( "record is unexpectedly short" );
    }

    size_t rec_end( LEN_BYTES + (size_t)block );

    if( len < rec_end )
    {
        return NeedMore( eof, "record" );
    }

    CByteCursor c( data, rec_end, LEN_BYTES );
    ref_id_ = c.Get< int32_t >();
    RefName( ref_id_, "reference sequence" );
    pos_ = c.Get< int32_t >();

    if( pos_ < NO_POS )
    {
        M_THROW_FORMAT( "invalid alignment position " << pos_ );
    }

    name_len_ = c.Get< uint8_t >();
    mapq_ = c.Get< uint8_t >();
    c.Skip( 2 );    // bin
    n_cigar_ = c.Get< uint16_t >();
    flag_ = c.Get< uint16_t >();
    seq_len_ = c.Get< uint32_t >();
    next_ref_id_ = c.Get< int32_t >();
    RefName( next_ref_id_, "next reference sequence" );
    next_pos_ = c.Get< int32_t >();

    if( next_pos_ < NO_POS )
    {
        M_THROW_FORMAT( "invalid next alignment position " << next_pos_ );
    }

    tlen_ = c.Get< int32_t >();

    // variable length data must fit in the block
    name_off_ = c.GetPos();

    if( !c.Have( name_len_ ) )
    {
        M_THROW_FORMAT( "invalid query name length" );
    }

    c.Skip( name_len_ );
    cigar_off_ = c.GetPos();

    if( !c.Have( 4*(size_t)n_cigar_ ) )
    {
        M_THROW_FORMAT( "record ended abruptly while reading cigar" );
    }

    for( uint16_t i( 0 ); i < n_cigar_; ++i )
    {
        uint32_t op( GetField( c.Get< uint32_t >(), 0, 4 ) );

        if( op >= N_CIGAR_OPS )
        {
            M_THROW_FORMAT( "invalid cigar operation " << op );
        }
    }

    seq_off_ = c.GetPos();

    if( !c.Have( ((size_t)seq_len_ + 1)/2 ) )
    {
        M_THROW_FORMAT( "record ended abruptly while reading sequence" );
    }

    c.Skip( ((size_t)seq_len_ + 1)/2 );
    qual_off_ = c.GetPos();

    if( !c.Have( seq_len_ ) )
    {
        M_THROW_FORMAT( "record ended abruptly while reading quality" );
    }

    consumed = rec_end;
    return RECORD;
}

//------------------------------------------------------------------------------
void CBamDecoder::Get( char const * data, Record & rec )
{
    rec.query_name.assign( data + name_off_, name_len_ );

    if( !rec.query_name.empty() && rec.query_name.back() == '\0' )
    {
        rec.query_name.pop_back();
    }

    rec.flag = flag_;
    rec.ref_name = RefName( ref_id_, "reference sequence" );

    if( pos_ == NO_POS ) rec.pos = boost::none;
    else rec.pos = (uint64_t)pos_;

    if( mapq_ == NO_MAPQ ) rec.mapq = boost::none;
    else rec.mapq = mapq_;

    rec.cigar.clear();

    for( uint16_t i( 0 ); i < n_cigar_; ++i )
    {
        uint32_t op( GetLE< uint32_t >( data + cigar_off_ + 4*(size_t)i ) );
        rec.cigar += std::to_string( op >> 4 );
        rec.cigar += CIGAR_OPS[GetField( op, 0, 4 )];
    }

    rec.rnext = RefName( next_ref_id_, "next reference sequence" );

    if( next_pos_ == NO_POS ) rec.pnext = boost::none;
    else rec.pnext = (uint64_t)next_pos_;

    rec.tlen = tlen_;

    // two bases per byte, high nibble first
    rec.seq.resize( seq_len_ );

    for( uint32_t i( 0 ); i < seq_len_; ++i )
    {
        uint8_t byte( (uint8_t)data[seq_off_ + i/2] );
        rec.seq[i] = BASES[(i%2 == 0) ? GetField( byte, 4, 8 )
                                      : GetField( byte, 0, 4 )];
    }

    if( seq_len_ == 0 || (uint8_t)data[qual_off_] == NO_QUAL )
    {
        rec.qual.clear();
    }
    else
    {
        rec.qual.resize( seq_len_ );

        for( uint32_t i( 0 ); i < seq_len_; ++i )
        {
            rec.qual[i] = (char)((uint8_t)data[qual_off_ + i] + 33);
        }
    }

    rec.extra.clear();
}

SEQ_NS_END

