//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_PARSE_HPP
#define BOOST_MIME_PARSE_HPP

#include <boost/mime/detail/config.hpp>
#include <boost/mime/error.hpp>
#include <boost/mime/mime_type.hpp>
#include <boost/mime/parse_options.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>

namespace boost {
namespace mime {

/** Parse a media type or media range.

    The entire string must match. Strings which
    match an interned entry, ignoring case, do not
    allocate. Otherwise the result owns a copy of
    the string in which every case-insensitive part
    is converted to lower case.

    @par Example
    @code
    auto rv = parse( "text/plain;charset=utf-8" );
    if( rv.has_value() )
        assert( rv->param( "charset" ).has_value() );

    auto rv2 = parse( "text/*" );
    assert( rv2.error() == error::invalid_range );
    @endcode

    @par BNF
    @code
    media-type  = type "/" subtype *( OWS ";" OWS parameter )
    parameter   = token "=" ( token / quoted-string )
    @endcode

    @return The parsed value, or an error. The
    position of an invalid byte is available from
    @ref media_type_rule.

    @param s The string to parse.

    @param opt Options controlling the grammar.

    @see
        @ref format_error,
        @ref media_type_rule.
*/
BOOST_MIME_DECL
system::result<mime_type>
parse(
    core::string_view s,
    parse_options const& opt = {});

} // mime
} // boost

#endif
