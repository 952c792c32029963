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
/** \file librectab/value.hpp
    \brief Dynamically typed record field value.
*/

#ifndef LIBRECTAB_VALUE_HPP
#define LIBRECTAB_VALUE_HPP

#include <iostream>

#include <boost/format.hpp>
#include <boost/optional.hpp>

#include <librectab/defs.hpp>

RECTAB_NS_BEGIN

//==============================================================================
/** Field value produced by the generic reader interface. */
class CValue
{
public:

    enum EType : int
    {
        NONE = 0,   ///< Absent value.
        INT,
        FLOAT,
        STRING
    };

    CValue() {}

    CValue( int64_t v ) : type_( INT ), int_( v ) {}
    CValue( double v ) : type_( FLOAT ), float_( v ) {}
    CValue( std::string const & v ) : type_( STRING ), str_( v ) {}

    template< typename T >
    CValue( boost::optional< T > const & v )
    {
        if( v ) *this = CValue( (int64_t)*v );
    }

    EType GetType() const { return type_; }
    bool IsNone() const { return type_ == NONE; }

    int64_t GetInt() const { return int_; }
    double GetFloat() const { return float_; }
    std::string const & GetString() const { return str_; }

    friend bool operator==( CValue const & x, CValue const & y )
    {
        if( x.type_ != y.type_ ) return false;

        switch( x.type_ )
        {
            case INT: return x.int_ == y.int_;
            case FLOAT: return x.float_ == y.float_;
            case STRING: return x.str_ == y.str_;
            default: return true;
        }
    }

    friend bool operator!=( CValue const & x, CValue const & y )
    {
        return !(x == y);
    }

    /** Text form used in tabular output; absent values print nothing. */
    friend std::ostream & operator<<( std::ostream & os, CValue const & x )
    {
        switch( x.type_ )
        {
            case INT: os << x.int_; break;
            case FLOAT: os << boost::format( "%.10g" ) % x.float_; break;
            case STRING: os << x.str_; break;
            default: break;
        }

        return os;
    }

private:

    EType type_ = NONE;
    int64_t int_ = 0;
    double float_ = 0.0;
    std::string str_;
};

RECTAB_NS_END

#endif

