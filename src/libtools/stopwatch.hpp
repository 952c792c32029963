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
/** \file libtools/stopwatch.hpp
    \brief Timers used to measure and log task duration.
*/

#ifndef LIBTOOLS_STOPWATCH_HPP
#define LIBTOOLS_STOPWATCH_HPP

#include <chrono>

#include <boost/format.hpp>

#include <libtools/logger.hpp>
#include <libtools/defs.hpp>

TOOLS_NS_BEGIN

//==============================================================================
class Timer
{
public:

    void Start()
    {
        start_time = std::chrono::steady_clock::now();
    }

    void Stop()
    {
        end_time = std::chrono::steady_clock::now();
    }

    std::chrono::microseconds GetElapsed() const
    {
        using namespace std::chrono;
        return duration_cast< microseconds >( end_time - start_time );
    }

private:

    std::chrono::steady_clock::time_point start_time,
                                          end_time;
};

//==============================================================================
/** Scoped timer; logs the elapsed time at INFO level on destruction.

    When a counter is attached the rate is logged as well.
*/
class StopWatch : public Timer
{
public:

    StopWatch( CLogger & logger, std::string const & hdr )
        : logger_( logger ), hdr_( hdr )
    {
        Start();
    }

    /** Attach a counter of processed units, e.g. records.
    */
    void SetCounter( uint64_t const * counter, std::string const & units )
    {
        counter_ = counter;
        units_ = units;
    }

    ~StopWatch()
    {
        Stop();
        auto us( GetElapsed().count() );
        std::ostringstream oss;
        oss << hdr_ << (hdr_.empty() ? "" : ": ") << "complete in "
            << boost::format( "%.3f" )%(us/1000000.0) << " s";

        if( counter_ != nullptr )
        {
            double rate( us == 0 ? (double)*counter_
                                 : (double)*counter_*1000000.0/us );
            oss << "; " << *counter_ << ' ' << units_ << " ("
                << boost::format( "%.2f" )%rate << ' ' << units_ << "/sec)";
        }

        M_INFO( logger_, oss.str() );
    }

private:

    CLogger & logger_;
    std::string hdr_;
    uint64_t const * counter_ = nullptr;
    std::string units_;
};

TOOLS_NS_END

#endif

