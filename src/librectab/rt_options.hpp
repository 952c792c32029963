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
/** \file librectab/rt_options.hpp
    \brief Parameters of the tabulation front end.
*/

#ifndef LIBRECTAB_RT_OPTIONS_HPP
#define LIBRECTAB_RT_OPTIONS_HPP

#include <iostream>
#include <limits>

#include <libtools/log_handler.hpp>

#include <librectab/defs.hpp>

RECTAB_NS_BEGIN

//==============================================================================
/// Parameters common to all rectab actions
///
struct CommonOptions
{
    std::string log_fname;  ///< Log file name.

    /// Severity threshold for logging.
    ///
    CLogHandler::Severity trace_level = CLogHandler::WARNING;

    bool quiet = false;     ///< Disable progress reporting.

    friend std::ostream & operator<<(
            std::ostream & os, CommonOptions const & x )
    {
        return os << '\n'
                  <<    "COMMON OPTIONS: \n\n"
                  <<    "   log file name: " << x.log_fname << '\n'
                  <<    "   trace_level: " << x.trace_level << '\n'
                  <<    "   suppress progress reporting: " << x.quiet << '\n'
                  << std::endl;
    }
};

//==============================================================================
/// Parameters of record tabulation.
///
struct CTabulateOptions : public CommonOptions
{
    std::string input;      ///< Input file name ("-" or empty for stdin).
    std::string output;     ///< Output file name (stdout, if empty).

    /// Parser name; detected from the input data if empty.
    std::string parser;

    /// Maximum number of records to write.
    uint64_t max_records = std::numeric_limits< uint64_t >::max();

    bool no_header = false;     ///< Omit the column names line.
    bool detect_only = false;   ///< Only report the detected input type.

    friend std::ostream & operator<<(
            std::ostream & os, CTabulateOptions const & x )
    {
        return os << (CommonOptions const &)x
                  <<    "TABULATE OPTIONS: \n\n"
                  <<    "   input: " << x.input << '\n'
                  <<    "   output: " << x.output << '\n'
                  <<    "   parser: "
                        << (x.parser.empty() ? "auto" : x.parser) << '\n'
                  <<    "   max records: "
                        << (x.max_records ==
                                std::numeric_limits< uint64_t >::max() ?
                                    std::string( "all" ) :
                                    std::to_string( x.max_records ))
                        << '\n'
                  <<    "   omit header: " << x.no_header << '\n'
                  <<    "   detect only: " << x.detect_only << '\n'
                  << std::endl;
    }
};

RECTAB_NS_END

#endif

