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
/** \file librectab/defs.hpp
    \brief High level definitions for the record tabulation library.
*/

#ifndef LIBRECTAB_DEFS_HPP
#define LIBRECTAB_DEFS_HPP

#include <string>
#include <vector>

#include <libseq/defs.hpp>
#include <libtools/defs.hpp>

#include <config.h>

//------------------------------------------------------------------------------
/*! \brief Internal namespace name for librectab entities.

    If macro \c OUTER_NS is defined, then its value becomes the enclosing
    namespace for \c RT_NS::RECTAB_NS_LCL.
*/
#define RECTAB_NS_LCL rectab

#ifdef OUTER_NS
#   define RECTAB_NS OUTER_NS::RT_NS::RECTAB_NS_LCL
#   define RECTAB_NS_BEGIN namespace OUTER_NS { \
                           namespace RT_NS { \
                           namespace RECTAB_NS_LCL {
#   define RECTAB_NS_END }}}
#else
#   define RECTAB_NS RT_NS::RECTAB_NS_LCL
#   define RECTAB_NS_BEGIN namespace RT_NS { namespace RECTAB_NS_LCL {
#   define RECTAB_NS_END }}
#endif

RECTAB_NS_BEGIN

using namespace TOOLS_NS;
using namespace SEQ_NS;

/// Number of leading bytes examined to classify a stream.
static size_t const SNIFF_LEN = 128;

RECTAB_NS_END

#endif

