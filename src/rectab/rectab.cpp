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
/** \file rectab/rectab.cpp
    \brief Command line front end of the record tabulator.
*/

#include <cstdlib>
#include <iostream>

#include <boost/program_options.hpp>

#include <librectab/rt_options.hpp>
#include <librectab/tabulate.hpp>

//==============================================================================

using namespace TOOLS_NS;
using namespace RECTAB_NS;

//==============================================================================
namespace
{

static std::string const VERSION_STRING = RECTAB_VERSION;

namespace po = boost::program_options;

//------------------------------------------------------------------------------
/** Parse the command line.

    \return false if the program should exit without doing any work.
*/
bool ParseOptions( int argc, char ** argv, CTabulateOptions & opts )
{
    po::options_description global_options( "Global options" ),
                            common_options( "Common options" ),
                            tabulate_options( "Tabulation options" );

    //==========================================================================
    // global options description
    //
    global_options.add_options()
        ( "help,h", "print usage information" )
        ( "version,v", "print application version and exit" );

    //==========================================================================
    // common options description
    //
    common_options.add_options()
        ( "log-file",
          po::value< std::string >( &opts.log_fname ),
          "log file name [default: <stderr>]" )
        ( "trace-level",
          po::value< TOOLS_NS::CLogHandler::Severity >( &opts.trace_level ),
          "minimum log severity level;\n"
          "one of { quiet, info, warning, error } "
          "[default: warning]")
        ( "quiet",
          po::bool_switch( &opts.quiet ),
          "do not report progress" );

    //==========================================================================
    // tabulation options description
    //
    tabulate_options.add_options()
        ( "input,i",
          po::value< std::string >( &opts.input ),
          "input file name, possibly compressed with gzip, bzip2, xz "
          "or zstd [default: <stdin>]" )
        ( "output,o",
          po::value< std::string >( &opts.output ),
          "output file name [default: <stdout>]" )
        ( "parser,p",
          po::value< std::string >( &opts.parser ),
          "input parser {fasta,fastq,sam,bam,inficon} "
          "[default: detected from the input data]" )
        ( "max-records,n",
          po::value< uint64_t >( &opts.max_records ),
          "write at most this many records [default: all]" )
        ( "no-header",
          po::bool_switch( &opts.no_header ),
          "do not write the column names line" )
        ( "detect-only",
          po::bool_switch( &opts.detect_only ),
          "only print the detected input type and compression" );

    po::options_description all_opts( "Available Program Options are" );
    all_opts.add( global_options )
            .add( common_options )
            .add( tabulate_options );

    po::positional_options_description positional;
    positional.add( "input", 1 );

    po::variables_map cmd_line_args;
    po::store( po::command_line_parser( argc, argv ).
                    options( all_opts ).
                    positional( positional ).
                    style( po::command_line_style::default_style &
                           ~po::command_line_style::allow_guessing ).
                    run(),
               cmd_line_args );

    if( cmd_line_args.count( "version" ) > 0 )
    {
        std::cout << "rectab version " << VERSION_STRING << std::endl;
        return false;
    }

    if( cmd_line_args.count( "help" ) > 0 )
    {
        std::cout << "rectab [options] [input]\n" << std::endl;
        std::cout << all_opts << std::endl;
        return false;
    }

    po::notify( cmd_line_args );
    return true;
}

}

//==============================================================================
//------------------------------------------------------------------------------
int main( int argc, char * argv[] )
{
    try
    {
        CTabulateOptions opts;

        if( ParseOptions( argc, argv, opts ) )
        {
            Tabulate( opts );
        }

        return EXIT_SUCCESS;
    }
    catch( std::exception const & e )
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        std::cerr << "Run \"rectab -h\" for usage information."
                  << std::endl;
        return EXIT_FAILURE;
    }
}

