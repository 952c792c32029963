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
/*! \file libtools/byteorder.hpp
    \brief Extraction of little endian words and bit fields from raw bytes.
*/

#ifndef LIBTOOLS_BYTEORDER_HPP
#define LIBTOOLS_BYTEORDER_HPP

#include <cstring>
#include <utility>

#include <libtools/defs.hpp>

TOOLS_NS_BEGIN

//------------------------------------------------------------------------------
/** Reverse bytes in a word.

    \tparam T_Word  Trivially copyable word type.

    \param [in.out] word    The value in which bytes should be reversed.
*/
template< typename T_Word >
void ReverseBytes( T_Word & word )
{
    uint8_t * bytes( (uint8_t *)&word );

    for( size_t i( 0 ); i < sizeof( T_Word )/2; ++i )
    {
        std::swap( bytes[i], bytes[sizeof( T_Word ) - i - 1] );
    }
}

//------------------------------------------------------------------------------
/** Read a little endian value from unaligned memory.

    Works for integer types and for IEEE-754 \c float / \c double.

    \tparam T_Word  Type of the value.

    \param [in] p   Points to sizeof( T_Word ) bytes.

    \return The value in host byte order.
*/
template< typename T_Word >
inline T_Word GetLE( void const * p )
{
    T_Word result;
    memcpy( &result, p, sizeof( T_Word ) );
    if( FLIP_BYTES ) ReverseBytes( result );
    return result;
}

//------------------------------------------------------------------------------
/** Extract bits [begin, end) of a word, shifted down to bit 0.
*/
template< typename T_Word >
inline T_Word GetField( T_Word src, size_t begin, size_t end )
{
    size_t const w( sizeof( T_Word )*BYTE_BITS );
    T_Word mask( end - begin >= w ? (T_Word)~(T_Word)0
                                  : (T_Word)(((T_Word)1 << (end - begin)) - 1) );
    return (T_Word)((src>>begin)&mask);
}

TOOLS_NS_END

#endif

