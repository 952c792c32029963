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
/** \file librectab/inficon.hpp
    \brief Inficon Hapsite mass spectrometry decoder.
*/

#ifndef LIBRECTAB_INFICON_HPP
#define LIBRECTAB_INFICON_HPP

#include <libtools/parse.hpp>

#include <librectab/defs.hpp>

RECTAB_NS_BEGIN

//==============================================================================
/** One intensity reading of a scan. */
struct InficonRecord
{
    double time;        ///< Scan time in minutes.
    double mz;
    double intensity;
};

//==============================================================================
/** Decoder of Inficon Hapsite run files.

    The header holds, for each acquisition segment, the list of m/z values
    measured by that segment. Each scan names its segment and lists one
    intensity per m/z; every intensity becomes one record.
*/
class CInficonDecoder
{
public:

    typedef InficonRecord Record;
    typedef std::vector< double > TMzList;

    static bool const POSITIONAL = true;

    static TFieldNames const & GetFieldNames();

    /** Read the m/z tables and find the start of the scan data.

        \throws CFormatError if the header is malformed or truncated.
    */
    void Init( CReadBuffer & buf );

    EParseStatus Parse(
            char const * data, size_t len, bool eof, size_t & consumed );

    void Get( char const * data, Record & rec );

    std::vector< TMzList > const & GetSegments() const { return segments_; }

private:

    /// Size of the per scan header.
    static size_t const SCAN_HDR_BYTES = 16;

    void ReadSegment( CReadBuffer & buf, TMzList & mzs );

    std::vector< TMzList > segments_;
    uint64_t data_left_ = 0;    ///< Unread bytes of scan data.
    size_t mzs_left_ = 0;       ///< Unread intensities of the current scan.
    size_t segment_ = 0;
    double time_ = 0.0;

    // values of the last parsed record; committed by Get()
    struct Pending
    {
        size_t segment,
               mzs_left,
               bytes;
        double time;
        float intensity;
    } pending_;
};

RECTAB_NS_END

#endif

