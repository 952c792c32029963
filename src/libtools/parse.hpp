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
/*! \file libtools/parse.hpp
    \brief Incremental record parsing over a CReadBuffer.

    A record decoder is a class providing:

    \code{.cpp}
        typedef ... Record;
        static std::vector< std::string > const & GetFieldNames();
        static bool const POSITIONAL;
        void Init( CReadBuffer & buf );
        EParseStatus Parse( char const * data, size_t len, bool eof,
                            size_t & consumed );
        void Get( char const * data, Record & rec );
    \endcode

    Parse() examines the window and either finds the extent of the next
    record (RECORD, with its length in \c consumed), asks for more data
    (NEED_MORE) or reports a clean end of input (END_OF_STREAM). Get()
    decodes the record found by the last Parse() call; it is only called
    before the window is changed.
*/

#ifndef LIBTOOLS_PARSE_HPP
#define LIBTOOLS_PARSE_HPP

#include <memory>
#include <string>

#include <libtools/byteorder.hpp>
#include <libtools/readbuf.hpp>
#include <libtools/exception.hpp>
#include <libtools/defs.hpp>

TOOLS_NS_BEGIN

//------------------------------------------------------------------------------
/*! Outcome of a single parse attempt. */
enum EParseStatus : int
{
    NEED_MORE = 0,      ///< Window holds an incomplete record.
    RECORD,             ///< A complete record was found.
    END_OF_STREAM       ///< No more records.
};

//------------------------------------------------------------------------------
/*! Report an incomplete record.

    \param [in] eof     Whether the source is exhausted.
    \param [in] section Part of the record that is incomplete.

    \return NEED_MORE if more data can still arrive.

    \throws CFormatError if eof is set.
*/
inline EParseStatus NeedMore( bool eof, char const * section )
{
    if( eof )
    {
        M_THROW_FORMAT( "record ended prematurely in " << section );
    }

    return NEED_MORE;
}

//------------------------------------------------------------------------------
/*! Bounds checked reader of little endian binary fields from a window. */
class CByteCursor
{
public:

    CByteCursor( char const * data, size_t len, size_t pos = 0 )
        : data_( data ), len_( len ), pos_( pos )
    {}

    /*! Check if n more bytes are available. */
    bool Have( size_t n ) const { return len_ - pos_ >= n; }

    /*! Advance by n bytes. The caller checks availability with Have(). */
    void Skip( size_t n ) { pos_ += n; }

    template< typename T_Word > T_Word Get()
    {
        T_Word result( GetLE< T_Word >( data_ + pos_ ) );
        pos_ += sizeof( T_Word );
        return result;
    }

    char const * GetPtr() const { return data_ + pos_; }
    size_t GetPos() const { return pos_; }
    size_t GetLeft() const { return len_ - pos_; }

private:

    char const * data_;
    size_t len_,
           pos_;
};

//------------------------------------------------------------------------------
/*! Run a parse function against a buffer, refilling as needed.

    \param [in]  buf        Buffer to parse from.
    \param [in]  fn         Callable with the signature of Parse().
    \param [out] consumed   Length of the record on RECORD.

    \return RECORD or END_OF_STREAM.

    \throws CFormatError if more data is requested at end of source.
*/
template< typename T_Fn >
EParseStatus ParseBuffered( CReadBuffer & buf, T_Fn fn, size_t & consumed )
{
    for( ;; )
    {
        consumed = 0;
        EParseStatus s( fn( buf.GetData(), buf.GetSize(), buf.IsEof(),
                            consumed ) );

        if( s != NEED_MORE )
        {
            return s;
        }

        if( buf.IsEof() )
        {
            M_THROW_FORMAT( "unexpected end of input" );
        }

        buf.Refill();
    }
}

//------------------------------------------------------------------------------
/*! Read a little endian word from the buffer front and consume it.

    Used by decoder setup code.

    \throws CFormatError if the source ends first.
*/
template< typename T_Word >
T_Word ReadLE( CReadBuffer & buf, char const * section )
{
    if( !buf.Reserve( sizeof( T_Word ) ) )
    {
        M_THROW_FORMAT( "record ended prematurely in " << section );
    }

    T_Word result( GetLE< T_Word >( buf.GetData() ) );
    buf.Consume( sizeof( T_Word ) );
    return result;
}

//------------------------------------------------------------------------------
/*! Consume n bytes, refilling as needed, without buffering all of them.

    \throws CFormatError if the source ends first.
*/
inline void SkipBytes( CReadBuffer & buf, uint64_t n, char const * section )
{
    while( n > 0 )
    {
        if( buf.IsEmpty() && ( buf.IsEof() || buf.Refill() == 0 ) )
        {
            M_THROW_FORMAT( "record ended prematurely in " << section );
        }

        auto step( Min( n, buf.GetSize() ) );
        buf.Consume( (size_t)step );
        n -= step;
    }
}

//------------------------------------------------------------------------------
/*! Copy n bytes out of the buffer front and consume them.

    \throws CFormatError if the source ends first.
*/
inline std::string ReadBytes( CReadBuffer & buf, size_t n,
                              char const * section )
{
    if( !buf.Reserve( n ) )
    {
        M_THROW_FORMAT( "record ended prematurely in " << section );
    }

    return buf.Consume( n ).ToString();
}

//------------------------------------------------------------------------------
/*! Driver of a record decoder over a shared buffer.

    Each call to Next() produces at most one record. Errors of positional
    decoders are tagged with the byte offset and 1-based index of the
    record being decoded. Once an exception escapes Next(), the reader
    stays failed and every later call throws.

    \tparam T_Decoder Record decoder class (see libtools/parse.hpp).
*/
template< typename T_Decoder >
class CRecordReader
{
public:

    typedef T_Decoder Decoder;
    typedef typename Decoder::Record Record;
    typedef std::shared_ptr< CReadBuffer > Buffer;

    /*! Instance constructor. Runs the decoder setup.

        \throws std::runtime_error if setup fails.
    */
    explicit CRecordReader( Buffer buf );

    /*! Decode the next record.

        \param [out] rec    Destination for the record fields.

        \return false when the input is exhausted.

        \throws CFormatError on malformed input.
        \throws std::runtime_error on source failures.
    */
    bool Next( Record & rec );

    bool IsDone() const { return done_; }
    bool IsFailed() const { return failed_; }

    CReadBuffer & GetBuffer() { return *buf_; }
    Decoder const & GetDecoder() const { return dec_; }

private:

    void Fail( char const * msg )
    {
        failed_ = true;
        failure_ = msg;
    }

    Buffer buf_;
    Decoder dec_;
    bool done_ = false,
         failed_ = false;
    std::string failure_;
};

//==============================================================================
// IMPLEMENTATION
//==============================================================================
template< typename T_Decoder >
CRecordReader< T_Decoder >::CRecordReader( Buffer buf )
    : buf_( buf )
{
    if( !buf_ )
    {
        M_THROW( "record reader requires a buffer" );
    }

    dec_.Init( *buf_ );
}

//------------------------------------------------------------------------------
template< typename T_Decoder >
bool CRecordReader< T_Decoder >::Next( Record & rec )
{
    if( failed_ )
    {
        M_THROW_FORMAT( "reader is in failed state: " << failure_ );
    }

    if( done_ )
    {
        return false;
    }

    uint64_t offset( buf_->GetOffset() ),
             recno( buf_->GetRecordNo() + 1 );

    try
    {
        size_t consumed( 0 );
        Decoder & dec( dec_ );
        EParseStatus s( ParseBuffered(
                    *buf_,
                    [&dec]( char const * d, size_t l, bool eof, size_t & c )
                    {
                        return dec.Parse( d, l, eof, c );
                    },
                    consumed ) );

        if( s == END_OF_STREAM )
        {
            done_ = true;
            return false;
        }

        dec_.Get( buf_->GetData(), rec );
        buf_->Consume( consumed );
        buf_->IncRecordNo();
        return true;
    }
    catch( CFormatError & e )
    {
        if( Decoder::POSITIONAL && !e.HasPosition() )
        {
            e.SetPosition( offset, recno );
        }

        Fail( e.what() );
        throw;
    }
    catch( std::exception const & e )
    {
        Fail( e.what() );
        throw;
    }
}

TOOLS_NS_END

#endif

