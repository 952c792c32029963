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
/*! \file libtools/readbuf.hpp CReadBuffer class definition. */

#ifndef LIBTOOLS_READBUF_HPP
#define LIBTOOLS_READBUF_HPP

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <libtools/exception.hpp>
#include <libtools/defs.hpp>

TOOLS_NS_BEGIN

class CReadBuffer;

//------------------------------------------------------------------------------
/*! View of bytes consumed from a CReadBuffer.

    The bytes stay in the buffer storage until the next refill. The slice
    records the buffer epoch at creation time and refuses access once the
    buffer has been refilled.
*/
class CBufSlice
{
public:

    /*! Create an empty (but valid) slice. */
    CBufSlice() {}

    CBufSlice( CReadBuffer const & owner,
               char const * data, size_t size, uint64_t epoch )
        : owner_( &owner ), data_( data ), size_( size ), epoch_( epoch )
    {}

    /*! Check whether the underlying bytes are still available. */
    bool IsValid() const;

    /*! Get pointer to the slice data.

        \throws std::runtime_error if the slice is stale.
    */
    char const * GetData() const;

    size_t GetSize() const { return size_; }

    /*! Copy the slice data out.

        \throws std::runtime_error if the slice is stale.
    */
    std::string ToString() const { return std::string( GetData(), size_ ); }

private:

    CReadBuffer const * owner_ = nullptr;
    char const * data_ = nullptr;
    size_t size_ = 0;
    uint64_t epoch_ = 0;
};

//------------------------------------------------------------------------------
/*! Streaming byte window over an input stream.

    The window is always the prefix of the bytes not yet consumed from the
    source. Refill() is the only operation that reads from the source.

    The buffer also keeps the absolute offset of the window start and a
    counter of records that were decoded from it.
*/
class CReadBuffer
{
public:

    /*! Type used to hold shared ownership of underlying input stream. */
    typedef std::shared_ptr< std::istream > Stream;

    /*! Default amount of data read by one refill. */
    static size_t const DEFAULT_CHUNK = 64*1024;

    /*! Instance constructor.

        No data is read until the first refill.

        \param [in] s       Source stream.
        \param [in] chunk   Minimum number of bytes to request per refill.
    */
    CReadBuffer( Stream s, size_t chunk = DEFAULT_CHUNK );

    /*! Create a buffer holding the given bytes, already at end of source.
    */
    explicit CReadBuffer( std::string const & bytes );

    CReadBuffer( CReadBuffer const & ) = delete;
    CReadBuffer & operator=( CReadBuffer const & ) = delete;

    /*! Read more data from the source.

        Consumed bytes are discarded first. Requests the larger of the
        chunk size and the current window size.

        \return Number of bytes appended; 0 means end of source.

        \throws std::runtime_error if the source fails.
    */
    size_t Refill();

    /*! Drop bytes from the front of the window.

        \param [in] n Number of bytes to drop.

        \return The dropped bytes, valid until the next refill.

        \throws std::runtime_error if n exceeds the window size.
    */
    CBufSlice Consume( size_t n );

    /*! Refill until at least n bytes are buffered or the source ends.

        \return true if at least n bytes are available.
    */
    bool Reserve( size_t n );

    /*! Advance to the next occurrence of needle.

        Bytes before the match are consumed, the match itself is left at
        the front of the window. If the source ends without a match, all
        the data is consumed.

        \return true if the needle was found.
    */
    bool SeekPattern( char const * needle, size_t nlen );
    bool SeekPattern( std::string const & needle )
    {
        return SeekPattern( needle.data(), needle.size() );
    }

    char const * GetData() const { return data_.data() + start_; }
    size_t GetSize() const { return end_ - start_; }
    bool IsEmpty() const { return end_ == start_; }

    /*! Check if the source is exhausted. More data may still be buffered. */
    bool IsEof() const { return eof_; }

    /*! Absolute offset of the window start in the source. */
    uint64_t GetOffset() const { return offset_; }

    uint64_t GetRecordNo() const { return recno_; }
    void IncRecordNo() { ++recno_; }

    /*! Number of refills that moved the buffered data. */
    uint64_t GetEpoch() const { return epoch_; }

private:

    Stream src_;
    std::vector< char > data_;
    size_t start_ = 0,
           end_ = 0,
           chunk_;
    uint64_t offset_ = 0,
             recno_ = 0,
             epoch_ = 0;
    bool eof_ = false;
};

//==============================================================================
// IMPLEMENTATION
//==============================================================================
inline bool CBufSlice::IsValid() const
{
    return owner_ == nullptr || owner_->GetEpoch() == epoch_;
}

//------------------------------------------------------------------------------
inline char const * CBufSlice::GetData() const
{
    if( !IsValid() )
    {
        M_THROW( "buffer slice used after the buffer was refilled" );
    }

    return data_;
}

TOOLS_NS_END

#endif

