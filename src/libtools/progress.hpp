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
/** \file libtools/progress.hpp
    \brief Console progress counter.
*/

#ifndef LIBTOOLS_PROGRESS_HPP
#define LIBTOOLS_PROGRESS_HPP

#include <atomic>
#include <iostream>
#include <string>
#include <thread>

#include <libtools/stopwatch.hpp>
#include <libtools/defs.hpp>

TOOLS_NS_BEGIN

//==============================================================================
/** Counter of processed units reported on a terminal line.

    A monitor thread redraws "<title>: <count> <units>" twice a second
    while the owner increments the counter. Stop() (also called from
    the destructor) joins the monitor and prints the total and rate.
*/
class CCounterProgress
{
public:

    enum : int {
        QUIET = 1,
        START = 2,
    };

    CCounterProgress( std::string const & title,
                      std::string const & units,
                      int flags = START,
                      std::ostream & os = std::cerr );
    ~CCounterProgress() { Stop(); }

    CCounterProgress( CCounterProgress const & ) = delete;
    CCounterProgress & operator=( CCounterProgress const & ) = delete;

    bool IsQuiet() const { return quiet_; }

    void Start();
    void Stop();

    void Increment( int64_t inc = 1 ) { current_.fetch_add( inc ); }
    int64_t GetCurrent() const { return current_.load(); }

    std::chrono::microseconds GetElapsed() const
    {
        return timer_.GetElapsed();
    }

private:

    static void MonitorProc( CCounterProgress & self );

    void Monitor();

    std::string const title_,
                      units_;
    std::ostream & os_;
    std::atomic< int64_t > current_;
    std::thread monitor_;
    Timer timer_;
    bool quiet_;
    bool stopped_ = true;
    std::atomic< bool > done_;
};

TOOLS_NS_END

#endif

