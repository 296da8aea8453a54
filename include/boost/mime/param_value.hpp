//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_PARAM_VALUE_HPP
#define BOOST_MIME_PARAM_VALUE_HPP

#include <boost/mime/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace boost {
namespace mime {

/** The value of a media type parameter.

    This holds a reference to the value as it
    appears in the media type, which is either a
    token or a quoted-string. Comparisons operate
    on the content, that is the text after the
    quotes are removed and each quoted-pair is
    replaced by the escaped character.

    The value of a `charset` parameter compares
    without regard to ASCII case, all other values
    compare exactly.

    @par Example
    @code
    mime_type mt( "text/plain; charset=\"UTF-8\"; format=flowed" );
    assert( *mt.param( "charset" ) == "utf-8" );
    assert( mt.param( "charset" )->is_quoted() );
    assert( *mt.param( "format" ) != "Flowed" );
    @endcode

    @par BNF
    @code
    value         = token / quoted-string
    quoted-string = DQUOTE *( qdtext / quoted-pair ) DQUOTE
    quoted-pair   = "\" ( HTAB / SP / VCHAR / obs-text )
    @endcode
*/
class param_value
{
    core::string_view s_;
    bool icase_ = false;

public:
    /** Constructor.

        @param s The value as it appears in a media
        type. It must be a token or a complete
        quoted-string.

        @param icase `true` if the value compares
        without regard to ASCII case.
    */
    explicit
    param_value(
        core::string_view s,
        bool icase = false) noexcept
        : s_(s)
        , icase_(icase)
    {
    }

    /** Return the value as it appears in the media type.

        Quotes and quoted-pairs are included.
    */
    core::string_view
    str() const noexcept
    {
        return s_;
    }

    /** Return true if the value is a quoted-string.
    */
    bool
    is_quoted() const noexcept
    {
        return ! s_.empty() && s_.front() == '"';
    }

    /** Return true if the value compares without regard to case.
    */
    bool
    is_case_insensitive() const noexcept
    {
        return icase_;
    }

    /** Return true if the value contains quoted-pairs.
    */
    BOOST_MIME_DECL
    bool
    has_escapes() const noexcept;

    /** Return the size of the content.
    */
    BOOST_MIME_DECL
    std::size_t
    unescaped_size() const noexcept;

    /** Return the content of the value.

        Quotes are removed and each quoted-pair is
        replaced by the escaped character.
    */
    BOOST_MIME_DECL
    std::string
    content() const;

    BOOST_MIME_DECL
    friend
    bool
    operator==(
        param_value const& a,
        param_value const& b) noexcept;

    /** Return true if the content equals a string.

        The string is compared as plain content,
        quotes in it are not removed.
    */
    BOOST_MIME_DECL
    friend
    bool
    operator==(
        param_value const& v,
        core::string_view s) noexcept;

    friend
    bool
    operator==(
        core::string_view s,
        param_value const& v) noexcept
    {
        return v == s;
    }

    friend
    bool
    operator!=(
        param_value const& a,
        param_value const& b) noexcept
    {
        return !(a == b);
    }

    friend
    bool
    operator!=(
        param_value const& v,
        core::string_view s) noexcept
    {
        return !(v == s);
    }

    friend
    bool
    operator!=(
        core::string_view s,
        param_value const& v) noexcept
    {
        return !(v == s);
    }

    /** Write the value as it appears in the media type.
    */
    BOOST_MIME_DECL
    friend
    std::ostream&
    operator<<(
        std::ostream& os,
        param_value const& v);
};

} // mime
} // boost

#endif
