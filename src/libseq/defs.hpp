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
//------------------------------------------------------------------------------
/*! \file libseq/defs.hpp
    \brief High level definitions for sequence record decoders.
*/

#ifndef LIBSEQ_DEFS_HPP
#define LIBSEQ_DEFS_HPP

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <libtools/defs.hpp>

#include <config.h>

//------------------------------------------------------------------------------
/*! \brief Internal namespace name for libseq entities.

    If macro \c OUTER_NS is defined, then its value becomes the enclosing
    namespace for \c RT_NS::SEQ_NS_LCL.
*/
#define SEQ_NS_LCL seq

//------------------------------------------------------------------------------
/*! \def SEQ_NS
    \brief Fully qualified namespace name for libseq entities.
*/
/*! \def SEQ_NS_BEGIN
    \brief Open libseq namespace.
*/
/*! \def SEQ_NS_END
    \brief Close libseq namespace.
*/
#ifdef OUTER_NS
#   define SEQ_NS OUTER_NS::RT_NS::SEQ_NS_LCL
#   define SEQ_NS_BEGIN namespace OUTER_NS { \
                             namespace RT_NS { \
                             namespace SEQ_NS_LCL {
#   define SEQ_NS_END }}}
#else
#   define SEQ_NS RT_NS::SEQ_NS_LCL
#   define SEQ_NS_BEGIN namespace RT_NS { namespace SEQ_NS_LCL {
#   define SEQ_NS_END }}
#endif

SEQ_NS_BEGIN

/// Ordered list of record field names.
typedef std::vector< std::string > TFieldNames;

/// Sentinel for "not found" offsets into a window.
static size_t const NPOS = (size_t)(-1);

//------------------------------------------------------------------------------
/** Find a byte in data[from, len).

    \return Offset of the byte or NPOS.
*/
inline size_t FindByte( char const * data, size_t from, size_t len, char c )
{
    if( from >= len ) return NPOS;
    void const * p( memchr( data + from, c, len - from ) );
    return p == nullptr ? NPOS : (size_t)((char const *)p - data);
}

//------------------------------------------------------------------------------
/** Check that data[0, len) consists of line terminators only. */
inline bool IsBlank( char const * data, size_t len )
{
    for( size_t i( 0 ); i < len; ++i )
    {
        if( data[i] != '\n' && data[i] != '\r' ) return false;
    }

    return true;
}

//------------------------------------------------------------------------------
/** End of a line ending at nl, with a preceding CR stripped. */
inline size_t StripCR( char const * data, size_t begin, size_t nl )
{
    return (nl > begin && data[nl - 1] == '\r') ? nl - 1 : nl;
}

SEQ_NS_END

#endif

