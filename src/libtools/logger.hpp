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
/*! \file libtools/logger.hpp
    \brief Severity filtered logging.
*/

#ifndef LIBTOOLS_LOGGER_HPP
#define LIBTOOLS_LOGGER_HPP

#include <memory>
#include <sstream>

#include <libtools/log_handler.hpp>
#include <libtools/defs.hpp>

/*! Log a stream formatted message.

    \b Example:
    \code{.cpp}
        M_LOG( ctx.logger_, CLogHandler::INFO, "records written: " << n );
    \endcode
*/
#define M_LOG(_o,_l,_m) { \
        std::ostringstream _os; _os << _m; \
        (_o).Log( (_l), _os.str(), __FILE__, __LINE__ ); \
    }

#define M_INFO(_o,_m) M_LOG( _o, TOOLS_NS::CLogHandler::INFO, _m )
#define M_WARN(_o,_m) M_LOG( _o, TOOLS_NS::CLogHandler::WARNING, _m )
#define M_ERR(_o,_m) M_LOG( _o, TOOLS_NS::CLogHandler::ERROR, _m )

TOOLS_NS_BEGIN

//==============================================================================
/** Named logger with a severity threshold.

    Messages at or below the threshold are prefixed with the logger id and
    passed to the handler; error messages also name their source location.
*/
class CLogger
{
public:

    typedef std::shared_ptr< CLogHandler > LogHandler;

    /** The threshold starts at CLogHandler::QUIET: nothing is logged until
        SetSeverity() is called.
    */
    CLogger( std::string const & id, LogHandler handler = LogHandler() );

    void Log( CLogHandler::Severity l, std::string const & msg,
              char const * file, int lineno );

    void SetSeverity( CLogHandler::Severity l ) { l_ = l; }
    CLogHandler::Severity GetSeverity() const { return l_; }

private:

    CLogHandler::Severity l_;
    std::string const id_;
    LogHandler handler_;
};

TOOLS_NS_END

#endif

