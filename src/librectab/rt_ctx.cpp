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
/** \file librectab/rt_ctx.cpp
    \brief Execution context of the tabulation front end.
*/

#include <librectab/rt_ctx.hpp>

RECTAB_NS_BEGIN

//==============================================================================
//------------------------------------------------------------------------------
CCommonContext::CCommonContext( CommonOptions const & opts )
    : logger_( "rectab", CLogger::LogHandler(
                    opts.log_fname.empty() ?
                        new CStreamLogHandler( "<stderr>", &std::cerr ) :
                        new CFileLogHandler(
                                opts.log_fname, opts.log_fname ) ) )
{
    logger_.SetSeverity( opts.trace_level );

    if( opts.quiet )
    {
        progress_flags_ |= CCounterProgress::QUIET;
    }
}

//==============================================================================
//------------------------------------------------------------------------------
CReadBuffer::Stream CTabulateContext::OpenInput( std::string const & name )
{
    if( name.empty() || name == "-" )
    {
        return CReadBuffer::Stream( &std::cin, []( std::istream * ){} );
    }

    CReadBuffer::Stream result(
            new std::ifstream( name.c_str(), std::ios_base::binary ) );

    if( !*result )
    {
        M_THROW_ERRNO( "error opening input file " << name << ' ' );
    }

    return result;
}

//------------------------------------------------------------------------------
CTabulateContext::CTabulateContext( CTabulateOptions const & opts )
    : CCommonContext( opts ), CTabulateOptions( opts )
{
    ResetOutStream();

    if( !output.empty() )
    {
        ResetOutStream( output );
    }

    source = Decompress( OpenInput( input ) );
    parser_name = parser.empty() ? source.file_type.GetParserName() : parser;

    if( !detect_only )
    {
        reader.reset( MkReader( parser_name, source.buf ) );
        reader->SetSource( source.file_type, source.compression );
    }
}

RECTAB_NS_END

