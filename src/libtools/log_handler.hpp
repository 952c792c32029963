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
/*! \file libtools/log_handler.hpp
    \brief Log severities and message sinks.
*/

#ifndef LIBTOOLS_LOG_HANDLER_HPP
#define LIBTOOLS_LOG_HANDLER_HPP

#include <iostream>
#include <memory>
#include <string>

#include <libtools/exception.hpp>
#include <libtools/defs.hpp>

TOOLS_NS_BEGIN

//==============================================================================
/*! Destination of formatted log messages.
*/
class CLogHandler
{
public:

    /** Severity levels, from least to most verbose. */
    enum Severity : int
    {
        QUIET = 0,  ///< Threshold only: disables logging.
        ERROR,
        WARNING,
        INFO,
        N_LEVELS
    };

    /** Lower case name of a severity level ("quiet", "error", ...).

        \throws std::runtime_error if s is not a valid level.
    */
    static char const * Severity2Str( Severity s );

    /** Inverse of Severity2Str().

        \throws std::runtime_error if the name is not recognized.
    */
    static Severity ParseSeverity( std::string const & name );

    virtual ~CLogHandler() {}

    /** Emit one message. */
    virtual void operator()( Severity l, std::string const & msg ) = 0;
};

/** Severity from its name; lets --trace-level be parsed by
    boost::program_options.
*/
inline std::istream & operator>>(
        std::istream & is, CLogHandler::Severity & v )
{
    std::string name;
    is >> name;
    v = CLogHandler::ParseSeverity( name );
    return is;
}

inline std::ostream & operator<<(
        std::ostream & os, CLogHandler::Severity v )
{
    return os << CLogHandler::Severity2Str( v );
}

//==============================================================================
/** Writes messages to an output stream, one line each, as
    "[<id>] <severity>: <message>".
*/
class CStreamLogHandler : public CLogHandler
{
public:

    typedef std::shared_ptr< std::ostream > TStreamHandle;

    /** Log to a stream shared with the handler.

        \throws std::runtime_error if the stream is not usable.
    */
    CStreamLogHandler( std::string const & id, TStreamHandle h );

    /** Log to a stream owned elsewhere, e.g. std::cerr.

        \throws std::runtime_error if the stream is not usable.
    */
    CStreamLogHandler( std::string const & id, std::ostream * osp );

    /** \throws std::runtime_error if writing the message fails. */
    void operator()( Severity l, std::string const & msg ) override;

private:

    void CheckStream() const;

    std::string id_;
    TStreamHandle os_;
    std::ostream * osp_;
};

//==============================================================================
/** Appends messages to a text file. */
class CFileLogHandler : public CStreamLogHandler
{
public:

    /** \throws std::runtime_error if the file can not be opened. */
    CFileLogHandler( std::string const & id, std::string const & fname );
};

TOOLS_NS_END

#endif

