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
/** \file libseq/bam.hpp
    \brief Binary (BAM) alignment decoder.
*/

#ifndef LIBSEQ_BAM_HPP
#define LIBSEQ_BAM_HPP

#include <libseq/sam.hpp>

SEQ_NS_BEGIN

//==============================================================================
/** Reference sequence from the BAM header. */
struct BamReference
{
    std::string name;
    uint32_t length;
};

//==============================================================================
/** Decoder of uncompressed BAM data.

    BGZF decompression is done by the input layer, so the decoder sees the
    plain concatenation of the header and alignment blocks.
*/
class CBamDecoder
{
public:

    typedef SamRecord Record;
    typedef std::vector< BamReference > TReferences;

    static bool const POSITIONAL = true;

    static TFieldNames const & GetFieldNames()
    {
        return GetAlignmentFieldNames();
    }

    /** Read the magic, the header text and the reference table.

        \throws CFormatError if the header is malformed or truncated.
    */
    void Init( TOOLS_NS::CReadBuffer & buf );

    TOOLS_NS::EParseStatus Parse(
            char const * data, size_t len, bool eof, size_t & consumed );

    void Get( char const * data, Record & rec );

    TReferences const & GetReferences() const { return refs_; }

private:

    /// Size of the block length word.
    static size_t const LEN_BYTES = 4;

    /// Size of the fixed part of an alignment block.
    static size_t const FIXED_BYTES = 32;

    std::string const & RefName( int32_t id, char const * what ) const;

    TReferences refs_;

    // fields of the last parsed record
    int32_t ref_id_ = -1,
            pos_ = -1,
            next_ref_id_ = -1,
            next_pos_ = -1,
            tlen_ = 0;
    uint8_t name_len_ = 0,
            mapq_ = 0;
    uint16_t n_cigar_ = 0,
             flag_ = 0;
    uint32_t seq_len_ = 0;
    size_t name_off_ = 0,
           cigar_off_ = 0,
           seq_off_ = 0,
           qual_off_ = 0;
};

SEQ_NS_END

#endif

