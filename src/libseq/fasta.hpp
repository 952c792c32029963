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
/** \file libseq/fasta.hpp
    \brief FASTA record decoder.
*/

#ifndef LIBSEQ_FASTA_HPP
#define LIBSEQ_FASTA_HPP

#include <libtools/parse.hpp>
#include <libtools/readbuf.hpp>

#include <libseq/defs.hpp>

SEQ_NS_BEGIN

//==============================================================================
struct FastaRecord
{
    std::string id;         ///< Header line without the leading '>'.
    std::string sequence;   ///< Sequence lines concatenated.
};

//==============================================================================
/** Decoder of FASTA records.

    A record is a '>' header line followed by sequence lines up to the
    next line starting with '>' or the end of input. Both LF and CRLF
    line endings are accepted.
*/
class CFastaDecoder
{
public:

    typedef FastaRecord Record;

    static bool const POSITIONAL = false;

    static TFieldNames const & GetFieldNames();

    void Init( TOOLS_NS::CReadBuffer & ) {}

    TOOLS_NS::EParseStatus Parse(
            char const * data, size_t len, bool eof, size_t & consumed );

    void Get( char const * data, Record & rec );

private:

    void Reset();

    size_t hdr_end_ = 0,
           seq_start_ = 0,
           seq_end_ = 0,
           scan_pos_ = 0;

    /// Offsets of line terminator bytes inside [seq_start_, seq_end_).
    std::vector< size_t > newlines_;
};

SEQ_NS_END

#endif

