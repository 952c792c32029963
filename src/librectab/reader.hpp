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
/** \file librectab/reader.hpp
    \brief Format independent record reader interface.
*/

#ifndef LIBRECTAB_READER_HPP
#define LIBRECTAB_READER_HPP

#include <memory>

#include <libtools/readbuf.hpp>

#include <librectab/filetype.hpp>
#include <librectab/value.hpp>
#include <librectab/defs.hpp>

RECTAB_NS_BEGIN

//==============================================================================
/** Record reader producing field values in a fixed column order. */
class CReader
{
public:

    typedef std::vector< CValue > TValues;

    virtual ~CReader() {}

    /** Name of the parser decoding the input (e.g. "fastq"). */
    virtual std::string const & GetParserName() const = 0;

    /** Field names, in the order values are reported by Next(). */
    virtual TFieldNames const & GetHeaders() const = 0;

    /** Decode the next record.

        \param [out] values One value per entry of GetHeaders().

        \return false when the input is exhausted.

        \throws CFormatError on malformed input.
    */
    virtual bool Next( TValues & values ) = 0;

    /** Type of the decoded data. */
    CFileType const & GetFileType() const { return file_type_; }

    /** Compression removed from the input, or UNKNOWN if none. */
    CFileType const & GetCompression() const { return compression_; }

    void SetSource( CFileType const & file_type, CFileType const & compression )
    {
        file_type_ = file_type;
        compression_ = compression;
    }

private:

    CFileType file_type_,
              compression_;
};

/** Create a reader for the named parser over a buffer.

    The caller owns the returned object.

    \throws std::runtime_error if no decoder handles the parser name.
    \throws CFormatError if the decoder setup fails.
*/
CReader * MkReader(
        std::string const & parser_name, std::shared_ptr< CReadBuffer > buf );

/** Create a reader over a possibly compressed stream.

    \param [in] s           Input stream.
    \param [in] parser_hint Parser name; if empty, the parser is chosen by
                            the detected file type.
    \param [in] chunk       Refill chunk size.
*/
CReader * MkReader(
        CReadBuffer::Stream s, std::string const & parser_hint = "",
        size_t chunk = CReadBuffer::DEFAULT_CHUNK );

/** Create a reader over in-memory bytes. */
CReader * MkReader(
        std::string const & bytes, std::string const & parser_hint );

RECTAB_NS_END

#endif

