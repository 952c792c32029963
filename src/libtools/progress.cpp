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
/** \file libtools/progress.cpp
    \brief Console progress counter.
*/

#include <chrono>

#include <boost/format.hpp>

#include <libtools/progress.hpp>

TOOLS_NS_BEGIN

//------------------------------------------------------------------------------
CCounterProgress::CCounterProgress(
        std::string const & title, std::string const & units, int flags,
        std::ostream & os )
    : title_( title ), units_( units ), os_( os ), current_( 0 ),
      quiet_( (flags&QUIET) != 0 ), done_( false )
{
    if( (flags&START) != 0 )
    {
        Start();
    }
}

//------------------------------------------------------------------------------
void CCounterProgress::MonitorProc( CCounterProgress & self )
{
    self.Monitor();
}

//------------------------------------------------------------------------------
void CCounterProgress::Start()
{
    if( done_.load() || !stopped_ )
    {
        return;
    }

    timer_.Start();
    stopped_ = false;

    if( !quiet_ )
    {
        monitor_ = std::thread( MonitorProc, std::ref( *this ) );
    }
}

//------------------------------------------------------------------------------
void CCounterProgress::Monitor()
{
    static std::chrono::milliseconds const POLL_INTERVAL( 500 );

    while( !done_.load() )
    {
        os_ << title_ + ": " << current_.load() << ' ' << units_
            << "\r" << std::flush;
        std::this_thread::sleep_for( POLL_INTERVAL );
    }
}

//------------------------------------------------------------------------------
void CCounterProgress::Stop()
{
    if( stopped_ )
    {
        return;
    }

    done_.store( true );

    if( monitor_.joinable() )
    {
        monitor_.join();
    }

    timer_.Stop();
    stopped_ = true;

    if( !quiet_ )
    {
        auto microseconds( timer_.GetElapsed().count() );
        auto current( current_.load() );
        double rate( microseconds == 0 ? (double)current
                                       : (double)current/microseconds );
        os_ << title_ + ": " << current << ' ' << units_ << " done in "
            << microseconds/1000 << " ms; "
            << boost::format( "%.2f " )%(rate*1000000.0)
            << units_ << "/sec" << std::endl;
    }
}

TOOLS_NS_END

