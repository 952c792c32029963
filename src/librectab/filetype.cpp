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
/** \file librectab/filetype.cpp
    \brief File format identification.
*/

#include <cstring>
#include <map>

#include <librectab/filetype.hpp>

RECTAB_NS_BEGIN

namespace {

typedef CFileType FT;

//------------------------------------------------------------------------------
struct SMagic
{
    uint8_t bytes[8];
    size_t len;
    FT::EKind kind;
};

/// Magic numbers, longest first.
SMagic const MAGIC[] =
{
    { { 'F', 'C', 'S', '2', '.', '0', ' ', ' ' }, 8, FT::FACS },
    { { 'F', 'C', 'S', '3', '.', '0', ' ', ' ' }, 8, FT::FACS },
    { { 'F', 'C', 'S', '3', '.', '1', ' ', ' ' }, 8, FT::FACS },
    { { '~', 'V', 'E', 'R', 'S', 'I', 'O', 'N' }, 8, FT::LAS },
    { { '~', 'V', 'e', 'r', 's', 'i', 'o', 'n' }, 8, FT::LAS },
    { { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A }, 8, FT::PNG },
    { { 0x89, 'H', 'D', 'F', 0x0D, 0x0A, 0x1A, 0x0A }, 8, FT::HDF5 },
    { { 0x04, 0x03, 0x02, 0x01, 'S', 'P', 'A', 'H' }, 8, FT::INFICON_HAPSITE },
    { { 0xAE, 'Z', 'T', 'R', 0x0D, 0x0A, 0x1A, 0x0A }, 8, FT::ZTR },
    { { 0x01, 0xA1, 'F', 0x00, 'i', 0x00, 'n', 0x00 }, 8, FT::THERMO_RAW },

    { { 'B', 'A', 'M', 0x01 }, 4, FT::BAM },
    { { '@', 'H', 'D', '\t' }, 4, FT::SAM },
    { { '@', 'S', 'Q', '\t' }, 4, FT::SAM },
    { { '.', 's', 'c', 'f' }, 4, FT::SCF },
    { { 0x02, 0x38, 0x31, 0x00 }, 4, FT::AGILENT_CHEMSTATION_FID },
    { { 0x01, 0x32, 0x00, 0x00 }, 4, FT::AGILENT_CHEMSTATION_MS },
    { { 0x02, 0x33, 0x30, 0x00 }, 4, FT::AGILENT_CHEMSTATION_MWD },
    { { 0x03, 0x31, 0x33, 0x31 }, 4, FT::AGILENT_CHEMSTATION_UV },
    { { 0x28, 0xB5, 0x2F, 0xFD }, 4, FT::ZSTD },
    { { 0xFF, 0xFF, 0x06, 0x00 }, 4, FT::THERMO_DXF },
    { { 0xFF, 0xFF, 0x05, 0x00 }, 4, FT::THERMO_DXF },

    { { 0x1F, 0x8B }, 2, FT::GZIP },
    { { 0x0F, 0x8B }, 2, FT::GZIP },
    { { 0x42, 0x5A }, 2, FT::BZIP },
    { { 0xFD, 0x37 }, 2, FT::LZMA },
    { { 0x24, 0x00 }, 2, FT::BRUKER_BAF },
    { { 0x43, 0x44 }, 2, FT::NETCDF },

    { { '>' }, 1, FT::FASTA },
    { { '@' }, 1, FT::FASTQ },
};

/// UTF-16LE "CIsoGC" at offset 52 distinguishes Thermo CF from DXF.
uint8_t const THERMO_CF_TAG[] =
{
    'C', 0x00, 'I', 0x00, 's', 0x00, 'o', 0x00, 'G', 0x00, 'C', 0x00
};

size_t const THERMO_CF_TAG_OFF = 52;
size_t const THERMO_CF_MIN_LEN = 78;

//------------------------------------------------------------------------------
char const * const NAMES[FT::N_KINDS] =
{
    "Gzip", "Bzip", "Lzma", "Zstd",
    "Bam", "Fasta", "Fastq", "Facs", "Sam", "Scf", "Ztr",
    "AgilentMsMsScan", "AgilentChemstationFid", "AgilentChemstationMs",
    "AgilentChemstationMwd", "AgilentChemstationUv", "AgilentDad",
    "BrukerBaf", "BrukerMsms", "InficonHapsite", "ThermoRaw", "ThermoCf",
    "ThermoDxf", "WatersAutospec", "NetCdf", "MzXml",
    "Las",
    "Png", "Hdf5", "DelimitedText", "Unknown"
};

//------------------------------------------------------------------------------
std::vector< std::pair< std::string, CFileType > > const & ParserNames()
{
    static std::vector< std::pair< std::string, CFileType > > const names = {
        { "chemstation_fid", FT( FT::AGILENT_CHEMSTATION_FID ) },
        { "chemstation_ms", FT( FT::AGILENT_CHEMSTATION_MS ) },
        { "chemstation_mwd", FT( FT::AGILENT_CHEMSTATION_MWD ) },
        { "chemstation_uv", FT( FT::AGILENT_CHEMSTATION_UV ) },
        { "csv", FT( FT::DELIMITED_TEXT, ',' ) },
        { "bam", FT( FT::BAM ) },
        { "fcs", FT( FT::FACS ) },
        { "fasta", FT( FT::FASTA ) },
        { "fastq", FT( FT::FASTQ ) },
        { "inficon", FT( FT::INFICON_HAPSITE ) },
        { "png", FT( FT::PNG ) },
        { "sam", FT( FT::SAM ) },
        { "thermo_cf", FT( FT::THERMO_CF ) },
        { "thermo_dxf", FT( FT::THERMO_DXF ) },
        { "tsv", FT( FT::DELIMITED_TEXT, '\t' ) },
    };

    return names;
}

}

//------------------------------------------------------------------------------
std::string CFileType::GetName() const
{
    std::string result( NAMES[kind_] );

    if( kind_ == DELIMITED_TEXT )
    {
        result += '(' + std::to_string( (int)(uint8_t)delim_ ) + ')';
    }

    return result;
}

//------------------------------------------------------------------------------
std::string CFileType::GetParserName() const
{
    for( auto const & e : ParserNames() )
    {
        if( e.second == *this )
        {
            return e.first;
        }
    }

    return "unsupported/" + GetName();
}

//------------------------------------------------------------------------------
CFileType CFileType::FromParserName( std::string const & name )
{
    for( auto const & e : ParserNames() )
    {
        if( e.first == name )
        {
            return e.second;
        }
    }

    return CFileType();
}

//------------------------------------------------------------------------------
CFileType CFileType::FromMagic( char const * data, size_t len )
{
    for( auto const & m : MAGIC )
    {
        if( len < m.len || memcmp( data, m.bytes, m.len ) != 0 )
        {
            continue;
        }

        if( m.kind == THERMO_DXF && len >= THERMO_CF_MIN_LEN &&
            memcmp( data + THERMO_CF_TAG_OFF,
                    THERMO_CF_TAG, sizeof( THERMO_CF_TAG ) ) == 0 )
        {
            return CFileType( THERMO_CF );
        }

        return CFileType( m.kind );
    }

    return CFileType();
}

//------------------------------------------------------------------------------
std::vector< CFileType > CFileType::FromExtension( std::string const & ext )
{
    static std::map< std::string, std::vector< CFileType > > const EXT_MAP = {
        { "gz", { FT( GZIP ) } },
        { "gzip", { FT( GZIP ) } },
        { "bz", { FT( BZIP ) } },
        { "bz2", { FT( BZIP ) } },
        { "bzip", { FT( BZIP ) } },
        { "xz", { FT( LZMA ) } },
        { "zstd", { FT( ZSTD ) } },
        { "ch", { FT( AGILENT_CHEMSTATION_FID ),
                  FT( AGILENT_CHEMSTATION_MWD ) } },
        { "ms", { FT( AGILENT_CHEMSTATION_MS ) } },
        { "uv", { FT( AGILENT_CHEMSTATION_UV ) } },
        { "bam", { FT( BAM ) } },
        { "baf", { FT( BRUKER_BAF ) } },
        { "ami", { FT( BRUKER_MSMS ) } },
        { "fcs", { FT( FACS ) } },
        { "lmd", { FT( FACS ) } },
        { "fa", { FT( FASTA ) } },
        { "faa", { FT( FASTA ) } },
        { "fasta", { FT( FASTA ) } },
        { "fna", { FT( FASTA ) } },
        { "faq", { FT( FASTQ ) } },
        { "fastq", { FT( FASTQ ) } },
        { "fq", { FT( FASTQ ) } },
        { "hdf", { FT( HDF5 ) } },
        { "raw", { FT( THERMO_RAW ) } },
        { "mzxml", { FT( MZXML ) } },
        { "cdf", { FT( NETCDF ) } },
        { "png", { FT( PNG ) } },
        { "hps", { FT( INFICON_HAPSITE ) } },
        { "sam", { FT( SAM ) } },
        { "scf", { FT( SCF ) } },
        { "cf", { FT( THERMO_CF ) } },
        { "dxf", { FT( THERMO_DXF ) } },
        { "idx", { FT( WATERS_AUTOSPEC ) } },
        { "ztr", { FT( ZTR ) } },
    };

    auto i( EXT_MAP.find( ext ) );

    if( i == EXT_MAP.end() )
    {
        return { CFileType() };
    }

    return i->second;
}

RECTAB_NS_END

