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
/** \file librectab/tabulate.hpp
    \brief Conversion of decoded records to tab separated text.
*/

#ifndef LIBRECTAB_TABULATE_HPP
#define LIBRECTAB_TABULATE_HPP

#include <iostream>

#include <libtools/progress.hpp>

#include <librectab/reader.hpp>
#include <librectab/rt_options.hpp>
#include <librectab/defs.hpp>

RECTAB_NS_BEGIN

/** Write the column names line: tab separated, newline terminated. */
void WriteHeader( CReader const & reader, std::ostream & os );

/** Write records as tab separated lines.

    Absent values are written as empty fields.

    \param [in] reader      Record source.
    \param [in] os          Output stream.
    \param [in] max_records Stop after this many records.
    \param [in] progress    If not null, incremented per record.

    \return Number of records written.
*/
uint64_t WriteRecords( CReader & reader, std::ostream & os,
                       uint64_t max_records,
                       CCounterProgress * progress = nullptr );

/** Run the tabulation front end.

    \throws std::runtime_error on input, output or format errors.
*/
void Tabulate( CTabulateOptions const & opts );

RECTAB_NS_END

#endif

