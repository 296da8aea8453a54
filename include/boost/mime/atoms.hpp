//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_ATOMS_HPP
#define BOOST_MIME_ATOMS_HPP

#include <boost/mime/detail/config.hpp>

namespace boost {
namespace mime {

/** Identities of the interned media types.

    Parsing a string which matches one of these
    entries, compared without regard to case,
    produces a @ref mime_type backed by a static
    string. Two such values compare equal exactly
    when their identities are equal.

    The value @ref atom::none is never assigned to
    a table entry. It is returned by
    @ref mime_type::atom_id for values which own
    their string.

    @see
        @ref make_atom.
*/
enum class atom : unsigned char
{
    none = 0,

    text_plain,
    text_plain_utf_8,
    text_html,
    text_html_utf_8,
    text_css,
    text_css_utf_8,
    text_javascript,
    text_xml,
    text_event_stream,
    text_csv,
    text_csv_utf_8,
    text_tab_separated_values,
    text_tab_separated_values_utf_8,
    text_vcard,

    image_jpeg,
    image_gif,
    image_png,
    image_bmp,
    image_svg,
    image_webp,

    font_woff,
    font_woff2,

    application_json,
    application_javascript,
    application_javascript_utf_8,
    application_www_form_urlencoded,
    application_octet_stream,
    application_msgpack,
    application_pdf,
    application_dns,
    application_xml,

    multipart_form_data,

    star_star,
    text_star,
    image_star,
    video_star,
    audio_star
};

/// The number of table entries, including @ref atom::none
BOOST_INLINE_CONSTEXPR unsigned atom_count =
    static_cast<unsigned>(atom::audio_star) + 1;

} // mime
} // boost

#endif
