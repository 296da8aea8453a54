//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_RFC_DETAIL_CHARS_HPP
#define BOOST_MIME_RFC_DETAIL_CHARS_HPP

#include <boost/mime/detail/config.hpp>
#include <boost/url/grammar/lut_chars.hpp>

namespace boost {
namespace mime {
namespace detail {

// tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*"
//       / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
//       / DIGIT / ALPHA
//
// The asterisk is left out, it only appears
// as a whole wildcard subtype.
BOOST_INLINE_CONSTEXPR grammar::lut_chars token_chars =
    "!#$%&'+-.^_`|~"
    "0123456789"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz";

// WS         = SP / HTAB
struct ws_t
{
    constexpr
    bool
    operator()(char c) const noexcept
    {
        return c == ' ' || c == '\t';
    }
};

BOOST_INLINE_CONSTEXPR ws_t ws{};

// qdtext     = HTAB / SP / %x21 / %x23-5B / %x5D-7E / obs-text
// quoted-pair = "\" ( HTAB / SP / VCHAR / obs-text )
//
// Matches every byte allowed after a backslash,
// a superset of qdtext.
struct qdtext_t
{
    constexpr
    bool
    operator()(char c) const noexcept
    {
        return
            c == '\t' || (
            static_cast<unsigned char>(c) > 31 &&
            static_cast<unsigned char>(c) != 127);
    }
};

BOOST_INLINE_CONSTEXPR qdtext_t qdtext{};

} // detail
} // mime
} // boost

#endif
