//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_ERROR_HPP
#define BOOST_MIME_ERROR_HPP

#include <boost/mime/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <string>

namespace boost {
namespace mime {

/** Error codes returned when parsing a media type.

    Every value is equivalent to
    @ref condition::invalid_mime.

    @see
        @ref format_error.
*/
enum class error
{
    /// A slash was missing between the type and subtype
    missing_slash = 1,

    /// An equals sign was missing between a parameter and its value
    missing_equal,

    /// A quote was missing from a parameter value
    missing_quote,

    /// A byte outside the permitted grammar was found
    invalid_token,

    /// A wildcard was found where only an exact type is permitted
    invalid_range,

    /// The string is longer than @ref BOOST_MIME_MAX_SIZE
    too_long
};

//-----------------------------------------------

/** Error conditions corresponding to sets of error codes.
*/
enum class condition
{
    /// The string is not a valid media type or media range
    invalid_mime = 1
};

//-----------------------------------------------

/** Return a description of a parse failure.

    For @ref error::invalid_token the offending
    byte is rendered in upper case hexadecimal
    together with its position:

    @code
    invalid token, 0A at position 4
    @endcode

    Other errors produce the same text as
    `ec.message()`.

    @param ec The error returned by the parser.

    @param s The string which was parsed.

    @param pos The offset where parsing stopped.
*/
BOOST_MIME_DECL
std::string
format_error(
    system::error_code const& ec,
    core::string_view s,
    std::size_t pos);

} // mime
} // boost

#include <boost/mime/impl/error.hpp>

#endif
