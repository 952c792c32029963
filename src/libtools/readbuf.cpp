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
/*! \file libtools/readbuf.cpp CReadBuffer class implementation. */

#include <algorithm>
#include <cstring>

#include <libtools/readbuf.hpp>

TOOLS_NS_BEGIN

//------------------------------------------------------------------------------
CReadBuffer::CReadBuffer( Stream s, size_t chunk )
    : src_( s ), chunk_( chunk == 0 ? 1 : chunk )
{
    if( !src_ )
    {
        M_THROW( "read buffer requires a source stream" );
    }
}

//------------------------------------------------------------------------------
CReadBuffer::CReadBuffer( std::string const & bytes )
    : data_( bytes.begin(), bytes.end() ), end_( bytes.size() ),
      chunk_( DEFAULT_CHUNK ), eof_( true )
{}

//------------------------------------------------------------------------------
size_t CReadBuffer::Refill()
{
    if( eof_ )
    {
        return 0;
    }

    if( start_ > 0 )
    {
        memmove( data_.data(), data_.data() + start_, end_ - start_ );
        end_ -= start_;
        start_ = 0;
    }

    size_t want( Max( chunk_, end_ ) );

    if( data_.size() < end_ + want )
    {
        data_.resize( end_ + want );
    }

    ++epoch_;
    src_->read( data_.data() + end_, want );
    size_t n( (size_t)src_->gcount() );

    if( src_->bad() )
    {
        M_THROW( "read failure at byte " << offset_ + end_ + n );
    }

    end_ += n;

    if( n < want )
    {
        eof_ = true;
    }

    return n;
}

//------------------------------------------------------------------------------
CBufSlice CReadBuffer::Consume( size_t n )
{
    if( n > GetSize() )
    {
        M_THROW( "attempt to consume " << n << " bytes; only "
                 << GetSize() << " bytes are buffered" );
    }

    CBufSlice result( *this, GetData(), n, epoch_ );
    start_ += n;
    offset_ += n;
    return result;
}

//------------------------------------------------------------------------------
bool CReadBuffer::Reserve( size_t n )
{
    while( GetSize() < n && !eof_ )
    {
        Refill();
    }

    return GetSize() >= n;
}

//------------------------------------------------------------------------------
bool CReadBuffer::SeekPattern( char const * needle, size_t nlen )
{
    if( nlen == 0 )
    {
        return true;
    }

    for( ;; )
    {
        char const * b( GetData() ),
                   * e( b + GetSize() ),
                   * p( std::search( b, e, needle, needle + nlen ) );

        if( p != e )
        {
            Consume( p - b );
            return true;
        }

        if( eof_ )
        {
            Consume( GetSize() );
            return false;
        }

        // a match may straddle the window end
        Consume( GetSize() - Min( GetSize(), nlen - 1 ) );
        Refill();
    }
}

TOOLS_NS_END

