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
/*! \file libtools/exception.hpp
    \brief Tools to assist with throwing exceptions.
*/

#ifndef LIBTOOLS_EXCEPTION_HPP
#define LIBTOOLS_EXCEPTION_HPP

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>

#include <libtools/defs.hpp>

//------------------------------------------------------------------------------
/*! \brief Throw a runtime exception.

    Adds exception origin (source file and line number) to the error message.
    The message itself can be formatted in C++ stream like manner.

    \b Example:
    \code{.cpp}
        M_THROW( "failed to read from file " << file_name );
    \endcode
*/
#define M_THROW(_m) { \
        std::ostringstream _os; \
        _os << _m << " [" << __FILE__ << ':' << __LINE__ << ']'; \
        throw std::runtime_error( _os.str().c_str() ); \
    }

//------------------------------------------------------------------------------
/*! \brief Throw a system exception.
*/
#define M_THROW_SYSTEM(_m,_e) {\
        M_THROW( _m << '(' << _e << " : " << strerror( _e ) << ')' ) \
    }

//------------------------------------------------------------------------------
/*! \brief Throw a system exception based on errno.
*/
#define M_THROW_ERRNO(_m) M_THROW_SYSTEM( _m, errno )

//------------------------------------------------------------------------------
/*! \brief Throw an input format exception.

    Used for errors caused by the data being decoded rather than by the
    program. The message is kept free of source origin, since it is meant
    for the user; the reader may later attach an input position to it.

    \b Example:
    \code{.cpp}
        M_THROW_FORMAT( "invalid segment number (" << seg << ") specified" );
    \endcode
*/
#define M_THROW_FORMAT(_m) { \
        std::ostringstream _os; _os << _m; \
        throw TOOLS_NS::CFormatError( _os.str() ); \
    }

TOOLS_NS_BEGIN

//------------------------------------------------------------------------------
/*! Exception type for malformed, truncated or undecodable input.

    Optionally carries the position of the record that failed: the absolute
    byte offset of the record start in the (decompressed) input and the
    1-based index of the record.
*/
class CFormatError : public std::runtime_error
{
public:

    /*! Instance constructor.

        \param [in] msg Error message.
    */
    explicit CFormatError( std::string const & msg );

    /*! Attach the input position to the error.

        The text returned by what() is updated accordingly.

        \param [in] offset      Byte offset of the failing record.
        \param [in] record_no   1-based index of the failing record.
    */
    void SetPosition( uint64_t offset, uint64_t record_no );

    bool HasPosition() const { return has_pos_; }
    uint64_t GetOffset() const { return offset_; }
    uint64_t GetRecordNo() const { return record_no_; }

    /// Error message without position information.
    std::string const & GetMessage() const { return msg_; }

    char const * what() const noexcept override;

private:

    std::string msg_;       ///< Original message.
    std::string text_;      ///< Message with position, if any.
    uint64_t offset_ = 0,
             record_no_ = 0;
    bool has_pos_ = false;
};

//==============================================================================
// IMPLEMENTATION
//==============================================================================
inline CFormatError::CFormatError( std::string const & msg )
    : std::runtime_error( msg ), msg_( msg ), text_( msg )
{}

//------------------------------------------------------------------------------
inline void CFormatError::SetPosition( uint64_t offset, uint64_t record_no )
{
    offset_ = offset;
    record_no_ = record_no;
    has_pos_ = true;
    std::ostringstream os;
    os << msg_ << " (byte " << offset_ << ", record " << record_no_ << ')';
    text_ = os.str();
}

//------------------------------------------------------------------------------
inline char const * CFormatError::what() const noexcept
{
    return text_.c_str();
}

TOOLS_NS_END

#endif

