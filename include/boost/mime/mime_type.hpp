//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_MIME_TYPE_HPP
#define BOOST_MIME_MIME_TYPE_HPP

#include <boost/mime/detail/config.hpp>
#include <boost/mime/atoms.hpp>
#include <boost/mime/param_value.hpp>
#include <boost/mime/params_view.hpp>
#include <boost/mime/parse_options.hpp>
#include <boost/mime/detail/mime_source.hpp>
#include <boost/mime/detail/param_source.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional/optional.hpp>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace boost {
namespace mime {

namespace detail {
struct mime_access;
} // detail

/** A parsed media type or media range.

    Objects of this type hold the normalized text
    of a media type together with the offsets of
    its parts, so that the accessors return views
    without scanning the string again. The type,
    subtype, suffix and parameter names are always
    lower case, as is the value of a `charset`
    parameter. Other parameter values are kept
    exactly as they appeared, quotes included.

    Common media types are interned: they refer to
    a static string instead of allocating, and
    compare in constant time.

    Objects are immutable once constructed.

    @par Example
    @code
    mime_type mt( "Image/SVG+XML" );
    assert( mt.type() == "image" );
    assert( mt.subtype() == "svg" );
    assert( *mt.suffix() == "xml" );
    assert( mt == "image/svg+xml" );
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
    @li <a href="https://www.rfc-editor.org/rfc/rfc6838#section-4.2.8"
        >4.2.8.  Structured Syntax Name Suffixes (rfc6838)</a>

    @see
        @ref parse,
        @ref make_atom,
        @ref matches.
*/
class mime_type
{
    detail::mime_source src_;
    std::uint16_t slash_ = 0;
    boost::optional<std::uint16_t> plus_;
    detail::param_source params_;

    friend struct detail::mime_access;

    mime_type(
        detail::mime_source src,
        std::uint16_t slash,
        boost::optional<std::uint16_t> plus,
        detail::param_source params) noexcept;

    std::size_t
    params_start() const noexcept
    {
        if(params_.empty())
            return src_.str().size();
        return params_.pos();
    }

public:
    /** Constructor.

        The string is parsed and normalized.

        @par Example
        @code
        mime_type mt( "text/html; charset=UTF-8" );
        assert( mt.str() == "text/html; charset=utf-8" );
        @endcode

        @param s The string to parse.

        @param opt Options controlling the grammar.

        @throws system::system_error The string is
        not a valid media type.
    */
    BOOST_MIME_DECL
    explicit
    mime_type(
        core::string_view s,
        parse_options const& opt = {});

    mime_type(mime_type const&) = default;
    mime_type(mime_type&&) = default;
    mime_type& operator=(mime_type const&) = default;
    mime_type& operator=(mime_type&&) = default;

    /** Return the normalized string.
    */
    core::string_view
    str() const noexcept
    {
        return src_.str();
    }

    /** Return the top-level type.

        This is `"*"` for the range matching
        every media type.
    */
    core::string_view
    type() const noexcept
    {
        return str().substr(0, slash_);
    }

    /** Return the subtype.

        The structured syntax suffix, if any, is
        not included:

        @code
        assert( mime_type( "image/svg+xml" ).subtype() == "svg" );
        @endcode
    */
    core::string_view
    subtype() const noexcept
    {
        std::size_t const end = plus_ ?
            *plus_ : params_start();
        return str().substr(
            slash_ + 1, end - slash_ - 1);
    }

    /** Return the structured syntax suffix, if any.

        This is the text following the first `+`
        in the subtype.
    */
    boost::optional<core::string_view>
    suffix() const noexcept
    {
        if(! plus_)
            return boost::none;
        return str().substr(
            *plus_ + 1,
            params_start() - *plus_ - 1);
    }

    /** Return the type, subtype and suffix.

        This is the string without any parameters.
    */
    core::string_view
    essence() const noexcept
    {
        return str().substr(
            0, params_start());
    }

    /** Return true if the subtype is the wildcard `*`.
    */
    bool
    is_range() const noexcept
    {
        return subtype() == "*";
    }

    /** Return true if there are parameters.
    */
    bool
    has_params() const noexcept
    {
        return ! params_.empty();
    }

    /** Return the parameters.
    */
    params_view
    params() const noexcept
    {
        return params_view(str(), params_);
    }

    /** Return the first parameter with the given name.

        Names are compared without regard to case.

        @param name The parameter name.
    */
    BOOST_MIME_DECL
    boost::optional<param_value>
    param(core::string_view name) const noexcept;

    /** Return the table identity.

        This is @ref atom::none unless the value
        refers to an interned string.
    */
    mime::atom
    atom_id() const noexcept
    {
        return static_cast<
            mime::atom>(src_.id());
    }

    /** Return a copy without the parameters.

        The essence is interned again, so that
        `text/plain; charset=latin1` produces the
        same value as parsing `text/plain`.
    */
    BOOST_MIME_DECL
    mime_type
    without_params() const;

    /** Return true if two media types are equal.

        The type, subtype, suffix and parameter names
        compare without regard to case, as does the
        value of the `charset` parameter. Other values
        compare by content. The order of parameters
        does not matter.
    */
    BOOST_MIME_DECL
    friend
    bool
    operator==(
        mime_type const& a,
        mime_type const& b) noexcept;

    /** Return true if a media type equals a string.

        The string is parsed as a media range. If it
        is not valid the result is `false`.
    */
    BOOST_MIME_DECL
    friend
    bool
    operator==(
        mime_type const& m,
        core::string_view s);

    friend
    bool
    operator==(
        core::string_view s,
        mime_type const& m)
    {
        return m == s;
    }

    friend
    bool
    operator!=(
        mime_type const& a,
        mime_type const& b) noexcept
    {
        return !(a == b);
    }

    friend
    bool
    operator!=(
        mime_type const& m,
        core::string_view s)
    {
        return !(m == s);
    }

    friend
    bool
    operator!=(
        core::string_view s,
        mime_type const& m)
    {
        return !(m == s);
    }

    /** Write the normalized string to a stream.
    */
    BOOST_MIME_DECL
    friend
    std::ostream&
    operator<<(
        std::ostream& os,
        mime_type const& m);
};

//------------------------------------------------

/** Return the normalized string of a media type.
*/
inline
std::string
to_string(mime_type const& m)
{
    auto const s = m.str();
    return std::string(s.data(), s.size());
}

/** Return an interned media type.

    No parsing takes place.

    @par Example
    @code
    auto mt = make_atom( atom::text_plain_utf_8 );
    assert( mt == "text/plain; charset=utf-8" );
    @endcode

    @throws std::invalid_argument `a` is
    @ref atom::none or not a table entry.
*/
BOOST_MIME_DECL
mime_type
make_atom(atom a);

/** Return true if a media range matches a media type.

    The range `*` `/` `*` matches every type, a range
    whose subtype is `*` matches every type with the
    same top-level type, and any other range must
    have the same type and subtype. In addition each
    parameter of the range, other than `q`, must be
    present in the type with an equal value.

    @par Example
    @code
    mime_type range( "text/*", { true } );
    assert( matches( range, mime_type( "text/html" ) ) );
    assert( ! matches( range, mime_type( "image/png" ) ) );
    @endcode

    @param range The media range.

    @param type The media type to test.
*/
BOOST_MIME_DECL
bool
matches(
    mime_type const& range,
    mime_type const& type) noexcept;

} // mime
} // boost

#endif
