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
/** \file librectab/tabulate.cpp
    \brief Conversion of decoded records to tab separated text.
*/

#include <libtools/stopwatch.hpp>

#include <librectab/rt_ctx.hpp>
#include <librectab/tabulate.hpp>

RECTAB_NS_BEGIN

//------------------------------------------------------------------------------
void WriteHeader( CReader const & reader, std::ostream & os )
{
    char const * sep( "" );

    for( auto const & name : reader.GetHeaders() )
    {
        os << sep << name;
        sep = "\t";
    }

    os << '\n';
}

//------------------------------------------------------------------------------
uint64_t WriteRecords( CReader & reader, std::ostream & os,
                       uint64_t max_records, CCounterProgress * progress )
{
    CReader::TValues values;
    uint64_t result( 0 );

    while( result < max_records && reader.Next( values ) )
    {
        char const * sep( "" );

        for( auto const & v : values )
        {
            os << sep << v;
            sep = "\t";
        }

        os << '\n';

        if( !os )
        {
            M_THROW( "output write failed after " << result << " records" );
        }

        ++result;
        if( progress != nullptr ) progress->Increment();
    }

    return result;
}

//------------------------------------------------------------------------------
void Tabulate( CTabulateOptions const & opts )
{
    CTabulateContext ctx( opts );
    auto & os( ctx.GetOutStream() );
    auto const & src( ctx.source );
    bool compressed( src.compression != CFileType() );

    M_INFO( ctx.logger_, (CTabulateOptions const &)ctx );
    M_INFO( ctx.logger_, "input type: " << src.file_type <<
                         "; compression: " <<
                         (compressed ? src.compression.GetName()
                                     : std::string( "none" )) );

    if( src.file_type.IsCompression() && !HasCompressionSupport() )
    {
        M_WARN( ctx.logger_,
                "input is " << src.file_type << " compressed, but this "
                "build has no decompression support" );
    }

    if( ctx.detect_only )
    {
        os << src.file_type << '\t'
           << (compressed ? src.compression.GetName() : std::string( "-" ))
           << std::endl;
        return;
    }

    M_INFO( ctx.logger_, "parser: " << ctx.parser_name );
    auto & reader( *ctx.reader );

    {
        StopWatch sw( ctx.logger_, "tabulation" );
        sw.SetCounter( &ctx.n_records, "records" );
        CCounterProgress progress(
                "tabulating", "records", ctx.progress_flags_ );

        if( !ctx.no_header )
        {
            WriteHeader( reader, os );
        }

        ctx.n_records = WriteRecords(
                reader, os, ctx.max_records, &progress );
        progress.Stop();
    }

    os.flush();

    if( !os )
    {
        M_THROW( "output write failed" );
    }

    M_INFO( ctx.logger_, "records written: " << ctx.n_records );
}

RECTAB_NS_END

