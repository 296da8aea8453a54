//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#include "src/detail/atoms.hpp"
#include "src/detail/mime_access.hpp"
#include <boost/mime/mime_type.hpp>
#include <boost/mime/names.hpp>
#include <boost/mime/detail/except.hpp>
#include <boost/url/grammar/ci_string.hpp>

namespace boost {
namespace mime {
namespace detail {

namespace {

// Indexed by atom, in the same order
constexpr atom_entry table[] = {
    { "", 0, 0, 0 },

    { "text/plain", 4, 0, 0 },
    { "text/plain; charset=utf-8", 4, 0, 10 },
    { "text/html", 4, 0, 0 },
    { "text/html; charset=utf-8", 4, 0, 9 },
    { "text/css", 4, 0, 0 },
    { "text/css; charset=utf-8", 4, 0, 8 },
    { "text/javascript", 4, 0, 0 },
    { "text/xml", 4, 0, 0 },
    { "text/event-stream", 4, 0, 0 },
    { "text/csv", 4, 0, 0 },
    { "text/csv; charset=utf-8", 4, 0, 8 },
    { "text/tab-separated-values", 4, 0, 0 },
    { "text/tab-separated-values; charset=utf-8", 4, 0, 25 },
    { "text/vcard", 4, 0, 0 },

    { "image/jpeg", 5, 0, 0 },
    { "image/gif", 5, 0, 0 },
    { "image/png", 5, 0, 0 },
    { "image/bmp", 5, 0, 0 },
    { "image/svg+xml", 5, 9, 0 },
    { "image/webp", 5, 0, 0 },

    { "font/woff", 4, 0, 0 },
    { "font/woff2", 4, 0, 0 },

    { "application/json", 11, 0, 0 },
    { "application/javascript", 11, 0, 0 },
    { "application/javascript; charset=utf-8", 11, 0, 22 },
    { "application/x-www-form-urlencoded", 11, 0, 0 },
    { "application/octet-stream", 11, 0, 0 },
    { "application/msgpack", 11, 0, 0 },
    { "application/pdf", 11, 0, 0 },
    { "application/dns-message", 11, 0, 0 },
    { "application/xml", 11, 0, 0 },

    { "multipart/form-data", 9, 0, 0 },

    { "*/*", 1, 0, 0 },
    { "text/*", 4, 0, 0 },
    { "image/*", 5, 0, 0 },
    { "video/*", 5, 0, 0 },
    { "audio/*", 5, 0, 0 }
};

static_assert(
    sizeof(table) / sizeof(table[0]) == atom_count,
    "atom table out of sync");

constexpr core::string_view utf8_params = "; charset=utf-8";

bool
is(core::string_view s, core::string_view name) noexcept
{
    return grammar::ci_is_equal(s, name);
}

atom
find_text(core::string_view sub) noexcept
{
    switch(sub.size())
    {
    case 1:
        if(sub[0] == '*')
            return atom::text_star;
        break;
    case 3:
        if(is(sub, names::css))
            return atom::text_css;
        if(is(sub, names::csv))
            return atom::text_csv;
        if(is(sub, names::xml))
            return atom::text_xml;
        break;
    case 4:
        if(is(sub, names::html))
            return atom::text_html;
        break;
    case 5:
        if(is(sub, names::plain))
            return atom::text_plain;
        if(is(sub, names::vcard))
            return atom::text_vcard;
        break;
    case 10:
        if(is(sub, names::javascript))
            return atom::text_javascript;
        break;
    case 12:
        if(is(sub, names::event_stream))
            return atom::text_event_stream;
        break;
    case 20:
        if(is(sub, names::tab_separated_values))
            return atom::text_tab_separated_values;
        break;
    default:
        break;
    }
    return atom::none;
}

atom
find_font(core::string_view sub) noexcept
{
    if(is(sub, names::woff))
        return atom::font_woff;
    if(is(sub, names::woff2))
        return atom::font_woff2;
    return atom::none;
}

atom
find_image(core::string_view sub) noexcept
{
    switch(sub.size())
    {
    case 3:
        if(is(sub, names::png))
            return atom::image_png;
        if(is(sub, names::gif))
            return atom::image_gif;
        if(is(sub, names::bmp))
            return atom::image_bmp;
        break;
    case 4:
        if(is(sub, names::jpeg))
            return atom::image_jpeg;
        if(is(sub, names::webp))
            return atom::image_webp;
        break;
    case 7:
        if(is(sub, "svg+xml"))
            return atom::image_svg;
        break;
    default:
        break;
    }
    return atom::none;
}

atom
find_application(core::string_view sub) noexcept
{
    switch(sub.size())
    {
    case 3:
        if(is(sub, names::pdf))
            return atom::application_pdf;
        if(is(sub, names::xml))
            return atom::application_xml;
        break;
    case 4:
        if(is(sub, names::json))
            return atom::application_json;
        break;
    case 7:
        if(is(sub, names::msgpack))
            return atom::application_msgpack;
        break;
    case 10:
        if(is(sub, names::javascript))
            return atom::application_javascript;
        break;
    case 11:
        if(is(sub, names::dns_message))
            return atom::application_dns;
        break;
    case 12:
        if(is(sub, names::octet_stream))
            return atom::application_octet_stream;
        break;
    case 21:
        if(is(sub, names::www_form_urlencoded))
            return atom::application_www_form_urlencoded;
        break;
    default:
        break;
    }
    return atom::none;
}

} // (anon)

//------------------------------------------------

atom_entry const*
get_atom_entry(atom a) noexcept
{
    auto const i = static_cast<unsigned>(a);
    if(i == 0 || i >= atom_count)
        return nullptr;
    return &table[i];
}

atom
find_atom(
    core::string_view s,
    std::size_t slash) noexcept
{
    auto const t = s.substr(0, slash);
    auto const sub = s.substr(slash + 1);
    switch(slash)
    {
    case 1:
        if(t[0] == '*' && sub == names::star)
            return atom::star_star;
        break;
    case 4:
        if(is(t, names::text))
            return find_text(sub);
        if(is(t, names::font))
            return find_font(sub);
        break;
    case 5:
        if(sub != names::star)
        {
            if(is(t, names::image))
                return find_image(sub);
            break;
        }
        if(is(t, names::image))
            return atom::image_star;
        if(is(t, names::video))
            return atom::video_star;
        if(is(t, names::audio))
            return atom::audio_star;
        break;
    case 9:
        if( is(t, names::multipart) &&
            is(sub, names::form_data))
            return atom::multipart_form_data;
        break;
    case 11:
        if(is(t, names::application))
            return find_application(sub);
        break;
    default:
        break;
    }
    return atom::none;
}

atom
find_atom_utf8(
    core::string_view s,
    std::size_t slash,
    std::size_t semi) noexcept
{
    if(! is(s.substr(semi), utf8_params))
        return atom::none;
    switch(find_atom(s.substr(0, semi), slash))
    {
    case atom::text_plain:
        return atom::text_plain_utf_8;
    case atom::text_html:
        return atom::text_html_utf_8;
    case atom::text_css:
        return atom::text_css_utf_8;
    case atom::text_csv:
        return atom::text_csv_utf_8;
    case atom::text_tab_separated_values:
        return atom::text_tab_separated_values_utf_8;
    case atom::application_javascript:
        return atom::application_javascript_utf_8;
    default:
        break;
    }
    return atom::none;
}

} // detail

//------------------------------------------------

mime_type
make_atom(atom a)
{
    auto const e = detail::get_atom_entry(a);
    if(! e)
        detail::throw_invalid_argument();
    boost::optional<std::uint16_t> plus;
    if(e->plus != 0)
        plus = e->plus;
    detail::param_source params;
    if(e->semicolon != 0)
        params = detail::param_source::utf8(
            e->semicolon);
    return detail::mime_access::construct(
        detail::mime_source(detail::atom_ref{
            static_cast<unsigned char>(a), e->str }),
        e->slash,
        plus,
        std::move(params));
}

} // mime
} // boost
