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
/*! \file libtools/logger.cpp
    \brief Logger and log handler implementation.
*/

#include <fstream>

#include <libtools/logger.hpp>

TOOLS_NS_BEGIN

namespace {

char const * const SEVERITY_NAMES[CLogHandler::N_LEVELS] =
{
    "quiet", "error", "warning", "info"
};

}

//==============================================================================
char const * CLogHandler::Severity2Str( Severity s )
{
    if( s < QUIET || s >= N_LEVELS )
    {
        M_THROW( "severity level out of range: " << (int)s );
    }

    return SEVERITY_NAMES[s];
}

//------------------------------------------------------------------------------
CLogHandler::Severity CLogHandler::ParseSeverity( std::string const & name )
{
    for( int i( QUIET ); i < N_LEVELS; ++i )
    {
        if( name == SEVERITY_NAMES[i] )
        {
            return (Severity)i;
        }
    }

    M_THROW( "wrong log severity name: " << name <<
             "; allowed values: quiet, error, warning, info" );
}

//==============================================================================
CStreamLogHandler::CStreamLogHandler(
        std::string const & id, TStreamHandle h )
    : id_( id ), os_( h ), osp_( h.get() )
{
    CheckStream();
}

//------------------------------------------------------------------------------
CStreamLogHandler::CStreamLogHandler(
        std::string const & id, std::ostream * osp )
    : id_( id ), osp_( osp )
{
    CheckStream();
}

//------------------------------------------------------------------------------
void CStreamLogHandler::CheckStream() const
{
    if( osp_ == nullptr || osp_->fail() )
    {
        M_THROW( "log output " << id_ << " is not usable" );
    }
}

//------------------------------------------------------------------------------
void CStreamLogHandler::operator()( Severity l, std::string const & msg )
{
    *osp_ << '[' << id_ << "] " << Severity2Str( l ) << ": " << msg
          << std::endl;
    CheckStream();
}

//==============================================================================
CFileLogHandler::CFileLogHandler(
        std::string const & id, std::string const & fname )
    : CStreamLogHandler(
            id, TStreamHandle( new std::ofstream(
                    fname.c_str(), std::ios_base::app ) ) )
{}

//==============================================================================
CLogger::CLogger( std::string const & id, LogHandler handler )
    : l_( CLogHandler::QUIET ), id_( id ), handler_( handler )
{}

//------------------------------------------------------------------------------
void CLogger::Log( CLogHandler::Severity l, std::string const & msg,
                   char const * file, int lineno )
{
    if( !handler_ || l == CLogHandler::QUIET || l > l_ )
    {
        return;
    }

    std::ostringstream os;
    os << id_ << ": " << msg;

    // errors point at their origin
    if( l == CLogHandler::ERROR )
    {
        os << " [" << file << ':' << lineno << ']';
    }

    (*handler_)( l, os.str() );
}

TOOLS_NS_END

