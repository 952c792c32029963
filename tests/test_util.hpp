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
/** \file tests/test_util.hpp
    \brief Minimal check macros shared by the test programs.
*/

#ifndef TESTS_TEST_UTIL_HPP
#define TESTS_TEST_UTIL_HPP

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

static int g_fail_count = 0;
static int g_pass_count = 0;

#define CHECK(cond) \
    do { \
        if (!(cond)) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s\n", __FILE__, __LINE__, #cond); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define CHECK_EQ(a, b) \
    do { \
        auto _a = (a); \
        auto _b = (b); \
        if (_a != _b) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s == %s  (got %lld vs %lld)\n", \
                         __FILE__, __LINE__, #a, #b, \
                         (long long)_a, (long long)_b); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define CHECK_STR_EQ(a, b) \
    do { \
        std::string _a = (a); \
        std::string _b = (b); \
        if (_a != _b) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s == %s  (got \"%s\" vs \"%s\")\n", \
                         __FILE__, __LINE__, #a, #b, _a.c_str(), _b.c_str()); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define CHECK_NEAR(a, b, eps) \
    do { \
        double _a = (a); \
        double _b = (b); \
        if (std::fabs(_a - _b) > (eps)) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s ~= %s  (got %g vs %g)\n", \
                         __FILE__, __LINE__, #a, #b, _a, _b); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define CHECK_THROWS(expr, exc) \
    do { \
        bool _thrown = false; \
        try { expr; } \
        catch (exc const &) { _thrown = true; } \
        catch (std::exception const & _e) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s threw unexpected: %s\n", \
                         __FILE__, __LINE__, #expr, _e.what()); \
            g_fail_count++; \
            break; \
        } \
        if (!_thrown) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s did not throw %s\n", \
                         __FILE__, __LINE__, #expr, #exc); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define TEST_SUMMARY() \
    do { \
        std::fprintf(stderr, "%d passed, %d failed\n", g_pass_count, g_fail_count); \
    } while (0)

#endif

