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
/** \file libseq/fastq.hpp
    \brief FASTQ record decoder.
*/

#ifndef LIBSEQ_FASTQ_HPP
#define LIBSEQ_FASTQ_HPP

#include <libtools/parse.hpp>
#include <libtools/readbuf.hpp>

#include <libseq/defs.hpp>

SEQ_NS_BEGIN

//==============================================================================
struct FastqRecord
{
    std::string id,
                sequence,
                quality;
};

//==============================================================================
/** Decoder of four line FASTQ records.

    The sequence occupies a single line. The quality line is located by
    the sequence length rather than by scanning, since quality strings
    may contain '@' and '+'.
*/
class CFastqDecoder
{
public:

    typedef FastqRecord Record;

    static bool const POSITIONAL = false;

    static TFieldNames const & GetFieldNames();

    void Init( TOOLS_NS::CReadBuffer & ) {}

    TOOLS_NS::EParseStatus Parse(
            char const * data, size_t len, bool eof, size_t & consumed );

    void Get( char const * data, Record & rec );

private:

    size_t hdr_end_ = 0,
           seq_start_ = 0,
           seq_end_ = 0,
           qual_start_ = 0;
};

SEQ_NS_END

#endif

