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
/** \file librectab/filetype.hpp
    \brief File format identification.
*/

#ifndef LIBRECTAB_FILETYPE_HPP
#define LIBRECTAB_FILETYPE_HPP

#include <iostream>

#include <librectab/defs.hpp>

RECTAB_NS_BEGIN

//==============================================================================
/** Data format or compression container of a byte stream.

    Delimited text additionally carries its delimiter byte.
*/
class CFileType
{
public:

    enum EKind : int
    {
        // compression
        GZIP = 0,
        BZIP,
        LZMA,
        ZSTD,

        // bioinformatics
        BAM,
        FASTA,
        FASTQ,
        FACS,
        SAM,
        SCF,
        ZTR,

        // chemoinformatics
        AGILENT_MSMS_SCAN,
        AGILENT_CHEMSTATION_FID,
        AGILENT_CHEMSTATION_MS,
        AGILENT_CHEMSTATION_MWD,
        AGILENT_CHEMSTATION_UV,
        AGILENT_DAD,
        BRUKER_BAF,
        BRUKER_MSMS,
        INFICON_HAPSITE,
        THERMO_RAW,
        THERMO_CF,
        THERMO_DXF,
        WATERS_AUTOSPEC,
        NETCDF,
        MZXML,

        // geology
        LAS,

        // generic
        PNG,
        HDF5,
        DELIMITED_TEXT,
        UNKNOWN,

        N_KINDS
    };

    CFileType( EKind kind = UNKNOWN, char delim = 0 )
        : kind_( kind ), delim_( kind == DELIMITED_TEXT ? delim : 0 )
    {}

    EKind GetKind() const { return kind_; }
    char GetDelimiter() const { return delim_; }

    /** Check if this is a compression container. */
    bool IsCompression() const
    {
        return kind_ == GZIP || kind_ == BZIP ||
               kind_ == LZMA || kind_ == ZSTD;
    }

    /** Human readable kind name, e.g. "Gzip" or "DelimitedText(44)". */
    std::string GetName() const;

    /** Name of the parser for this type.

        Types without a parser are rendered as "unsupported/<name>".
    */
    std::string GetParserName() const;

    /** Classify a stream by its leading bytes.

        A pattern of length k is tried whenever at least k bytes are given;
        longer patterns take priority.

        \param [in] data    Leading bytes of the stream.
        \param [in] len     Number of bytes available (may be 0).
    */
    static CFileType FromMagic( char const * data, size_t len );

    static CFileType FromMagic( std::string const & data )
    {
        return FromMagic( data.data(), data.size() );
    }

    /** Candidate types for a file name extension (without the dot).

        Unknown extensions give a single UNKNOWN entry.
    */
    static std::vector< CFileType > FromExtension( std::string const & ext );

    /** Inverse of GetParserName(); unknown names give UNKNOWN. */
    static CFileType FromParserName( std::string const & name );

    friend bool operator==( CFileType const & x, CFileType const & y )
    {
        return x.kind_ == y.kind_ && x.delim_ == y.delim_;
    }

    friend bool operator!=( CFileType const & x, CFileType const & y )
    {
        return !(x == y);
    }

    friend std::ostream & operator<<( std::ostream & os, CFileType const & x )
    {
        return os << x.GetName();
    }

private:

    EKind kind_;
    char delim_;
};

RECTAB_NS_END

#endif

