//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_RFC_MEDIA_TYPE_RULE_HPP
#define BOOST_MIME_RFC_MEDIA_TYPE_RULE_HPP

#include <boost/mime/detail/config.hpp>
#include <boost/mime/mime_type.hpp>
#include <boost/system/result.hpp>

namespace boost {
namespace mime {

namespace implementation_defined {
struct media_type_rule_t
{
    using value_type = mime_type;

    BOOST_MIME_DECL
    auto
    parse(
        char const*& it,
        char const* end) const ->
            system::result<value_type>;
};

struct media_range_rule_t
{
    using value_type = mime_type;

    BOOST_MIME_DECL
    auto
    parse(
        char const*& it,
        char const* end) const ->
            system::result<value_type>;
};
} // implementation_defined

/** Rule matching media-type

    The rule consumes the remainder of the input.
    On failure the iterator is left at the byte
    where parsing stopped, which is the offending
    byte for @ref error::invalid_token.

    @par Example
    @code
    core::string_view s = "text/plain;\n";
    char const* it = s.data();
    auto rv = media_type_rule.parse( it, s.data() + s.size() );
    assert( rv.error() == error::invalid_token );
    assert( it - s.data() == 11 );
    @endcode

    @par BNF
    @code
    media-type  = type "/" subtype *( OWS ";" OWS parameter )
    parameter   = token "=" ( token / quoted-string )
    subtype     = token
    type        = token
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7231#section-3.1.1.1"
        >3.1.1.1.  Media Type (rfc7231)</a>

    @see
        @ref mime_type,
        @ref media_range_rule.
*/
BOOST_INLINE_CONSTEXPR implementation_defined::media_type_rule_t media_type_rule{};

/** Rule matching media-range

    This is the same as @ref media_type_rule
    except that the subtype may be the wildcard
    `*`, as in an `Accept` field.

    @par BNF
    @code
    media-range = ( "*" "/" "*"
                  / ( type "/" "*" )
                  / ( type "/" subtype )
                  ) *( OWS ";" OWS parameter )
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7231#section-5.3.2"
        >5.3.2.  Accept (rfc7231)</a>

    @see
        @ref mime_type,
        @ref media_type_rule.
*/
BOOST_INLINE_CONSTEXPR implementation_defined::media_range_rule_t media_range_rule{};

} // mime
} // boost

#endif
