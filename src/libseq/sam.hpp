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
/** \file libseq/sam.hpp
    \brief SAM alignment record and text SAM decoder.
*/

#ifndef LIBSEQ_SAM_HPP
#define LIBSEQ_SAM_HPP

#include <utility>

#include <boost/optional.hpp>

#include <libtools/parse.hpp>
#include <libtools/readbuf.hpp>

#include <libseq/defs.hpp>

SEQ_NS_BEGIN

//==============================================================================
/** Alignment record shared by the SAM and BAM decoders.

    Positions are 0-based. Absent positions and mapping quality are
    represented by empty optionals, absent strings by empty strings.
*/
struct SamRecord
{
    std::string query_name;
    uint16_t flag = 0;
    std::string ref_name;
    boost::optional< uint64_t > pos;
    boost::optional< uint8_t > mapq;
    std::string cigar;
    std::string rnext;
    boost::optional< uint64_t > pnext;
    int32_t tlen = 0;
    std::string seq;
    std::string qual;
    std::string extra;  ///< Optional fields joined by '|'.
};

/** Field names common to SAM and BAM, in output order. */
TFieldNames const & GetAlignmentFieldNames();

//==============================================================================
/** Decoder of tab separated SAM text.

    Header lines starting with '@' at the beginning of the input are
    skipped during setup. Every other non-empty line is one record; blank
    lines are consumed together with the record before them.
*/
class CSamDecoder
{
public:

    typedef SamRecord Record;

    static bool const POSITIONAL = true;

    static TFieldNames const & GetFieldNames()
    {
        return GetAlignmentFieldNames();
    }

    /** Skip the header lines and any blank lines after them. */
    void Init( TOOLS_NS::CReadBuffer & buf );

    TOOLS_NS::EParseStatus Parse(
            char const * data, size_t len, bool eof, size_t & consumed );

    void Get( char const * data, Record & rec );

private:

    typedef std::pair< size_t, size_t > TSpan;

    static size_t const N_MANDATORY = 11;

    static size_t BlankLines(
            char const * data, size_t pos, size_t len, bool eof );

    std::vector< TSpan > fields_;
    uint16_t flag_ = 0;
    boost::optional< uint64_t > pos_,
                                pnext_;
    boost::optional< uint8_t > mapq_;
    int32_t tlen_ = 0;
};

SEQ_NS_END

#endif

