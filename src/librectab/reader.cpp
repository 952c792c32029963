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
/** \file librectab/reader.cpp
    \brief Format independent record reader interface.
*/

#include <sstream>

#include <libtools/exception.hpp>
#include <libtools/parse.hpp>

#include <libseq/bam.hpp>
#include <libseq/fasta.hpp>
#include <libseq/fastq.hpp>
#include <libseq/sam.hpp>

#include <librectab/decompress.hpp>
#include <librectab/inficon.hpp>
#include <librectab/reader.hpp>

RECTAB_NS_BEGIN

namespace {

typedef CReader::TValues TValues;

//------------------------------------------------------------------------------
void ToValues( FastaRecord const & r, TValues & v )
{
    v.emplace_back( r.id );
    v.emplace_back( r.sequence );
}

void ToValues( FastqRecord const & r, TValues & v )
{
    v.emplace_back( r.id );
    v.emplace_back( r.sequence );
    v.emplace_back( r.quality );
}

void ToValues( SamRecord const & r, TValues & v )
{
    v.emplace_back( r.query_name );
    v.emplace_back( (int64_t)r.flag );
    v.emplace_back( r.ref_name );
    v.emplace_back( r.pos );
    v.emplace_back( r.mapq );
    v.emplace_back( r.cigar );
    v.emplace_back( r.rnext );
    v.emplace_back( r.pnext );
    v.emplace_back( (int64_t)r.tlen );
    v.emplace_back( r.seq );
    v.emplace_back( r.qual );
    v.emplace_back( r.extra );
}

void ToValues( InficonRecord const & r, TValues & v )
{
    v.emplace_back( r.time );
    v.emplace_back( r.mz );
    v.emplace_back( r.intensity );
}

//==============================================================================
/** CReader over a CRecordReader instance. */
template< typename T_Decoder >
class CDecoderReader : public CReader
{
public:

    CDecoderReader( std::string const & name,
                    std::shared_ptr< CReadBuffer > buf )
        : name_( name ), reader_( buf )
    {}

    virtual ~CDecoderReader() override {}

    virtual std::string const & GetParserName() const override
    {
        return name_;
    }

    virtual TFieldNames const & GetHeaders() const override
    {
        return T_Decoder::GetFieldNames();
    }

    virtual bool Next( TValues & values ) override
    {
        if( !reader_.Next( rec_ ) )
        {
            return false;
        }

        values.clear();
        ToValues( rec_, values );
        return true;
    }

private:

    std::string name_;
    CRecordReader< T_Decoder > reader_;
    typename T_Decoder::Record rec_;
};

}

//------------------------------------------------------------------------------
CReader * MkReader(
        std::string const & parser_name, std::shared_ptr< CReadBuffer > buf )
{
    if( parser_name == "fasta" )
    {
        return new CDecoderReader< CFastaDecoder >( parser_name, buf );
    }

    if( parser_name == "fastq" )
    {
        return new CDecoderReader< CFastqDecoder >( parser_name, buf );
    }

    if( parser_name == "sam" )
    {
        return new CDecoderReader< CSamDecoder >( parser_name, buf );
    }

    if( parser_name == "bam" )
    {
        return new CDecoderReader< CBamDecoder >( parser_name, buf );
    }

    if( parser_name == "inficon" )
    {
        return new CDecoderReader< CInficonDecoder >( parser_name, buf );
    }

    M_THROW( "no reader available for parser " << parser_name );
}

//------------------------------------------------------------------------------
CReader * MkReader(
        CReadBuffer::Stream s, std::string const & parser_hint, size_t chunk )
{
    CDecompressed in( Decompress( s, chunk ) );
    std::string parser_name( parser_hint.empty() ?
                                in.file_type.GetParserName() : parser_hint );
    CReader * result( MkReader( parser_name, in.buf ) );
    result->SetSource( in.file_type, in.compression );
    return result;
}

//------------------------------------------------------------------------------
CReader * MkReader(
        std::string const & bytes, std::string const & parser_hint )
{
    CReadBuffer::Stream s( new std::istringstream( bytes ) );
    return MkReader( s, parser_hint );
}

RECTAB_NS_END

