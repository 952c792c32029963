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
/** \file librectab/rt_ctx.hpp
    \brief Execution context of the tabulation front end.
*/

#ifndef LIBRECTAB_RT_CTX_HPP
#define LIBRECTAB_RT_CTX_HPP

#include <fstream>
#include <functional>
#include <memory>

#include <libtools/logger.hpp>
#include <libtools/progress.hpp>

#include <librectab/decompress.hpp>
#include <librectab/reader.hpp>
#include <librectab/rt_options.hpp>
#include <librectab/defs.hpp>

RECTAB_NS_BEGIN

//==============================================================================
struct CCommonContext
{
    CCommonContext( CommonOptions const & opts );
    CLogger logger_;
    int progress_flags_ = CCounterProgress::START;
};

//==============================================================================
/** Opened input and output of a tabulation run.

    The input is examined (and decompressed) on construction. A reader is
    created unless only type detection was requested.
*/
struct CTabulateContext : public CCommonContext, public CTabulateOptions
{
private:

    typedef std::unique_ptr<
        std::ostream,
        std::function< void( std::ostream * ) > > OutStream;

public:

    CTabulateContext( CTabulateOptions const & opts );

    std::ostream & GetOutStream() { return *osp; }

    void ResetOutStream( std::string const & name )
    {
        std::unique_ptr< std::ofstream > os( new std::ofstream( name.c_str() ) );

        if( !*os )
        {
            M_THROW_ERRNO( "error opening output file " << name << ' ' );
        }

        OutStream( os.release(),
                   []( std::ostream * os ){ delete os; } ).swap( osp );
    }

    void ResetOutStream( std::ostream & os = std::cout )
    {
        OutStream( &os, []( std::ostream * ){} ).swap( osp );
    }

    CDecompressed source;
    std::string parser_name;
    std::unique_ptr< CReader > reader;
    uint64_t n_records = 0;

private:

    static CReadBuffer::Stream OpenInput( std::string const & name );

    OutStream osp;
};

RECTAB_NS_END

#endif

