//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_PARSE_OPTIONS_HPP
#define BOOST_MIME_PARSE_OPTIONS_HPP

#include <boost/mime/detail/config.hpp>

namespace boost {
namespace mime {

/** Options controlling how media types are parsed.
*/
struct parse_options
{
    /** Accept media ranges.

        When `true`, the subtype may be the single
        wildcard `*`, and the range which matches
        every media type is accepted. Otherwise a
        wildcard produces @ref error::invalid_range.
    */
    bool allow_range = false;

    /** Accept optional whitespace.

        When `true`, a space or horizontal tab may
        end the subtype or an unquoted parameter
        value, as in `text/plain ; charset=utf-8`.
        Whitespace following a semicolon or a quoted
        value is accepted regardless.
    */
    bool allow_ows = true;
};

} // mime
} // boost

#endif
