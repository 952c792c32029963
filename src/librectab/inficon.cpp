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
/** \file librectab/inficon.cpp
    \brief Inficon Hapsite mass spectrometry decoder.
*/

#include <librectab/inficon.hpp>

RECTAB_NS_BEGIN

namespace {

uint8_t const MAGIC[] = { 0x04, 0x03, 0x02, 0x01 };

/// Ends the instrument collection steps; the m/z list follows at a fixed
/// distance from its start.
uint8_t const MZ_LIST_MARKER[] =
{
    0xFF, 0xFF, 0xFF, 0xFF,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0xF6, 0xFF, 0xFF, 0xFF,
    0, 0, 0, 0
};

char const SCAN_DATA_MARKER[] = "\xFF\xFF\xFF\xFFHapsGPIR";
char const SCAN_SECTION_TAG[] = "HapsScan";

size_t const MZ_LIST_OFF = 148;
size_t const SEGMENT_HDR_BYTES = 96;
size_t const SCAN_LEN_OFF = 180;
size_t const SCAN_SECTION_SKIP = 56;

uint32_t const MAX_SEGMENTS = 10000;
uint32_t const MAX_MZ_RANGES = 100000;
uint32_t const MAX_MZ_END = 4000000000U;
uint32_t const MAX_MZ_SPAN = 200000;
uint32_t const MZ_STEP = 100;

double const MZ_SCALE = 100.0;
double const MS_PER_MINUTE = 60000.0;

}

//------------------------------------------------------------------------------
TFieldNames const & CInficonDecoder::GetFieldNames()
{
    static TFieldNames const names = { "time", "mz", "intensity" };
    return names;
}

//------------------------------------------------------------------------------
void CInficonDecoder::ReadSegment( CReadBuffer & buf, TMzList & mzs )
{
    SkipBytes( buf, SEGMENT_HDR_BYTES, "segment header" );
    auto n_ranges( ReadLE< uint32_t >( buf, "segment header" ) );

    if( n_ranges > MAX_MZ_RANGES )
    {
        M_THROW_FORMAT( "too many m/z ranges" );
    }

    for( ; n_ranges > 0; --n_ranges )
    {
        auto start( ReadLE< uint32_t >( buf, "m/z range" ) ),
             end( ReadLE< uint32_t >( buf, "m/z range" ) );

        if( end > MAX_MZ_END )
        {
            M_THROW_FORMAT( "end of m/z range is invalid" );
        }

        SkipBytes( buf, 16, "m/z range" );  // dwell time and unknowns
        auto type( ReadLE< uint32_t >( buf, "m/z range" ) );
        SkipBytes( buf, 4, "m/z range" );

        if( type == 0 )
        {
            // selected ion
            mzs.push_back( start/MZ_SCALE );
            continue;
        }

        if( start >= end || end - start >= MAX_MZ_SPAN )
        {
            M_THROW_FORMAT( "m/z range is too big or invalid" );
        }

        for( uint32_t mz( start ); mz <= end; mz += MZ_STEP )
        {
            mzs.push_back( mz/MZ_SCALE );
        }
    }
}

//------------------------------------------------------------------------------
void CInficonDecoder::Init( CReadBuffer & buf )
{
    if( ReadBytes( buf, sizeof( MAGIC ), "magic" ) !=
            std::string( (char const *)MAGIC, sizeof( MAGIC ) ) )
    {
        M_THROW_FORMAT( "inficon file has bad magic bytes" );
    }

    if( !buf.SeekPattern( (char const *)MZ_LIST_MARKER,
                          sizeof( MZ_LIST_MARKER ) ) )
    {
        M_THROW_FORMAT( "could not find m/z header list" );
    }

    SkipBytes( buf, MZ_LIST_OFF, "m/z header list" );
    auto n_segments( ReadLE< uint32_t >( buf, "m/z header list" ) );

    if( n_segments > MAX_SEGMENTS )
    {
        M_THROW_FORMAT( "too many segments" );
    }

    segments_.assign( n_segments, TMzList() );

    for( auto & s : segments_ )
    {
        ReadSegment( buf, s );
    }

    if( !buf.SeekPattern( SCAN_DATA_MARKER, sizeof( SCAN_DATA_MARKER ) - 1 ) )
    {
        M_THROW_FORMAT( "could not find start of scan data" );
    }

    // the section length precedes the scan section tag
    SkipBytes( buf, SCAN_LEN_OFF, "scan data header" );
    data_left_ = ReadLE< uint32_t >( buf, "scan data header" );
    SkipBytes( buf, 8, "scan data header" );

    if( ReadBytes( buf, sizeof( SCAN_SECTION_TAG ) - 1, "scan data header" ) !=
            SCAN_SECTION_TAG )
    {
        M_THROW_FORMAT( "data header was malformed" );
    }

    SkipBytes( buf, SCAN_SECTION_SKIP, "scan data header" );
    mzs_left_ = 0;
}

//------------------------------------------------------------------------------
EParseStatus CInficonDecoder::Parse(
        char const * data, size_t len, bool eof, size_t & consumed )
{
    if( data_left_ == 0 )
    {
        return END_OF_STREAM;
    }

    CByteCursor c( data, len );
    Pending p{ segment_, mzs_left_, 0, time_, 0.0f };

    if( p.mzs_left == 0 )
    {
        if( !c.Have( SCAN_HDR_BYTES ) )
        {
            return NeedMore( eof, "scan header" );
        }

        c.Skip( 4 );    // scan index
        p.time = c.Get< int32_t >()/MS_PER_MINUTE;
        c.Skip( 2 );
        uint16_t n_mzs( c.Get< uint16_t >() );
        c.Skip( 2 );
        p.segment = c.Get< uint16_t >() >> 4;

        if( p.segment >= segments_.size() )
        {
            M_THROW_FORMAT(
                    "invalid segment number (" << p.segment << ") specified" );
        }

        if( n_mzs != segments_[p.segment].size() )
        {
            M_THROW_FORMAT(
                    "number of intensities (" << n_mzs <<
                    ") doesn't match number of mzs (" <<
                    segments_[p.segment].size() << ")" );
        }

        if( n_mzs == 0 )
        {
            M_THROW_FORMAT( "invalid m/z segment" );
        }

        p.mzs_left = n_mzs;
    }

    if( !c.Have( sizeof( float ) ) )
    {
        return NeedMore( eof, "scan" );
    }

    p.intensity = c.Get< float >();
    p.bytes = c.GetPos();
    pending_ = p;
    consumed = p.bytes;
    return RECORD;
}

//------------------------------------------------------------------------------
void CInficonDecoder::Get( char const *, Record & rec )
{
    TMzList const & mzs( segments_[pending_.segment] );
    segment_ = pending_.segment;
    time_ = pending_.time;
    rec.time = time_;
    rec.mz = mzs[mzs.size() - pending_.mzs_left];
    rec.intensity = pending_.intensity;
    mzs_left_ = pending_.mzs_left - 1;
    data_left_ -= Min( data_left_, pending_.bytes );
}

RECTAB_NS_END

