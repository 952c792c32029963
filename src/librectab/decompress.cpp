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
/** \file librectab/decompress.cpp
    \brief Detection and removal of a compression layer.
*/

#include <cstring>

#include <boost/iostreams/filtering_stream.hpp>

#include <config.h>

#ifdef USE_COMPRESSION
#   include <boost/iostreams/filter/bzip2.hpp>
#   include <boost/iostreams/filter/gzip.hpp>
#   include <boost/iostreams/filter/lzma.hpp>
#   include <boost/iostreams/filter/zstd.hpp>
#endif

#include <libtools/exception.hpp>

#include <librectab/decompress.hpp>

RECTAB_NS_BEGIN

namespace io = boost::iostreams;

namespace {

typedef std::shared_ptr< io::filtering_istream > TChain;

//------------------------------------------------------------------------------
/** Stream yielding prefix followed by the rest of s. */
TChain MkPrefixedStream( std::string const & prefix, CReadBuffer::Stream s )
{
    TChain result( new io::filtering_istream );
    result->push( CPrefixedSource( prefix, s ) );
    result->exceptions( std::ios_base::badbit );
    return result;
}

}

//------------------------------------------------------------------------------
CPrefixedSource::CPrefixedSource(
        std::string const & prefix, CReadBuffer::Stream rest )
    : state_( new State{ prefix, 0, rest } )
{}

//------------------------------------------------------------------------------
std::streamsize CPrefixedSource::read( char * s, std::streamsize n )
{
    State & st( *state_ );
    std::streamsize result( 0 );

    if( st.pos < st.prefix.size() )
    {
        result = Min( n, st.prefix.size() - st.pos );
        memcpy( s, st.prefix.data() + st.pos, (size_t)result );
        st.pos += (size_t)result;
        s += result;
        n -= result;
    }

    if( n > 0 && st.rest )
    {
        st.rest->read( s, n );
        result += st.rest->gcount();

        if( st.rest->bad() )
        {
            M_THROW( "read failure in compressed input" );
        }
    }

    return result == 0 ? -1 : result;
}

//------------------------------------------------------------------------------
bool HasCompressionSupport()
{
#ifdef USE_COMPRESSION
    return true;
#else
    return false;
#endif
}

//------------------------------------------------------------------------------
std::string ReadPrefix( std::istream & is, size_t n )
{
    std::string result( n, 0 );
    is.read( &result[0], n );

    if( is.bad() )
    {
        M_THROW( "read failure while detecting the input type" );
    }

    result.resize( (size_t)is.gcount() );
    return result;
}

//------------------------------------------------------------------------------
CDecompressed Decompress( CReadBuffer::Stream s, size_t chunk )
{
    if( !s )
    {
        M_THROW( "no input stream" );
    }

    std::string prefix( ReadPrefix( *s, SNIFF_LEN ) );
    CDecompressed result;
    result.file_type = CFileType::FromMagic( prefix );

    if( !result.file_type.IsCompression() || !HasCompressionSupport() )
    {
        result.buf.reset(
                new CReadBuffer( MkPrefixedStream( prefix, s ), chunk ) );
        return result;
    }

    result.compression = result.file_type;
    TChain chain( new io::filtering_istream );

#ifdef USE_COMPRESSION
    switch( result.compression.GetKind() )
    {
        case CFileType::GZIP:
            chain->push( io::gzip_decompressor() );
            break;
        case CFileType::BZIP:
            chain->push( io::bzip2_decompressor() );
            break;
        case CFileType::LZMA:
            chain->push( io::lzma_decompressor() );
            break;
        case CFileType::ZSTD:
            chain->push( io::zstd_decompressor() );
            break;
        default:
            M_THROW( "unexpected compression type " << result.compression );
    }
#endif

    chain->push( CPrefixedSource( prefix, s ) );
    chain->exceptions( std::ios_base::badbit );
    std::string inner( ReadPrefix( *chain, SNIFF_LEN ) );
    result.file_type = CFileType::FromMagic( inner );
    result.buf.reset(
            new CReadBuffer( MkPrefixedStream( inner, chain ), chunk ) );
    return result;
}

RECTAB_NS_END

