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
/** \file librectab/decompress.hpp
    \brief Detection and removal of a compression layer.
*/

#ifndef LIBRECTAB_DECOMPRESS_HPP
#define LIBRECTAB_DECOMPRESS_HPP

#include <memory>

#include <boost/iostreams/categories.hpp>

#include <libtools/readbuf.hpp>

#include <librectab/filetype.hpp>
#include <librectab/defs.hpp>

RECTAB_NS_BEGIN

//==============================================================================
/** boost::iostreams source replaying already read bytes before the rest of
    an input stream.

    Copies share state, as required for devices pushed onto a chain.
*/
class CPrefixedSource
{
public:

    typedef char char_type;
    typedef boost::iostreams::source_tag category;

    CPrefixedSource( std::string const & prefix, CReadBuffer::Stream rest );

    std::streamsize read( char * s, std::streamsize n );

private:

    struct State
    {
        std::string prefix;
        size_t pos;
        CReadBuffer::Stream rest;
    };

    std::shared_ptr< State > state_;
};

//==============================================================================
/** Result of Decompress(). */
struct CDecompressed
{
    std::shared_ptr< CReadBuffer > buf;     ///< Decompressed data.
    CFileType file_type;    ///< Type of the decompressed data.
    CFileType compression;  ///< Compression removed, or UNKNOWN if none.
};

/** Check if compressed inputs can be decoded by this build. */
bool HasCompressionSupport();

/** Read up to n bytes from a stream.

    \throws std::runtime_error if the stream fails.
*/
std::string ReadPrefix( std::istream & is, size_t n );

/** Identify the input and remove at most one compression layer.

    The leading bytes are examined without being lost. If they identify
    gzip (including multi-member BGZF), bzip2, xz or zstd data and the
    build supports decompression, the result buffer delivers decompressed
    bytes, \c file_type describes them and \c compression the container.
    Otherwise the input is passed through unchanged.

    \param [in] s       Input stream.
    \param [in] chunk   Refill chunk size of the resulting buffer.
*/
CDecompressed Decompress(
        CReadBuffer::Stream s,
        size_t chunk = CReadBuffer::DEFAULT_CHUNK );

RECTAB_NS_END

#endif

