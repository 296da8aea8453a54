//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_NAMES_HPP
#define BOOST_MIME_NAMES_HPP

#include <boost/mime/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>

namespace boost {
namespace mime {

/** Well-known names used in media types.

    All names are lower case. They may be compared
    against the accessors of @ref mime_type, which
    return lower case text for every case-insensitive
    part of a media type.

    @par Example
    @code
    mime_type mt( "TEXT/Plain" );
    assert( mt.type() == names::text );
    assert( mt.subtype() == names::plain );
    @endcode
*/
namespace names {

/// The wildcard name "*"
BOOST_INLINE_CONSTEXPR core::string_view star = "*";

// top-level types
BOOST_INLINE_CONSTEXPR core::string_view text = "text";
BOOST_INLINE_CONSTEXPR core::string_view image = "image";
BOOST_INLINE_CONSTEXPR core::string_view audio = "audio";
BOOST_INLINE_CONSTEXPR core::string_view video = "video";
BOOST_INLINE_CONSTEXPR core::string_view application = "application";
BOOST_INLINE_CONSTEXPR core::string_view multipart = "multipart";
BOOST_INLINE_CONSTEXPR core::string_view message = "message";
BOOST_INLINE_CONSTEXPR core::string_view model = "model";
BOOST_INLINE_CONSTEXPR core::string_view font = "font";

// text subtypes
BOOST_INLINE_CONSTEXPR core::string_view plain = "plain";
BOOST_INLINE_CONSTEXPR core::string_view html = "html";
BOOST_INLINE_CONSTEXPR core::string_view xml = "xml";
BOOST_INLINE_CONSTEXPR core::string_view javascript = "javascript";
BOOST_INLINE_CONSTEXPR core::string_view css = "css";
BOOST_INLINE_CONSTEXPR core::string_view csv = "csv";
BOOST_INLINE_CONSTEXPR core::string_view event_stream = "event-stream";
BOOST_INLINE_CONSTEXPR core::string_view vcard = "vcard";
BOOST_INLINE_CONSTEXPR core::string_view tab_separated_values = "tab-separated-values";

// application subtypes
BOOST_INLINE_CONSTEXPR core::string_view json = "json";
BOOST_INLINE_CONSTEXPR core::string_view www_form_urlencoded = "x-www-form-urlencoded";
BOOST_INLINE_CONSTEXPR core::string_view msgpack = "msgpack";
BOOST_INLINE_CONSTEXPR core::string_view octet_stream = "octet-stream";
BOOST_INLINE_CONSTEXPR core::string_view pdf = "pdf";
BOOST_INLINE_CONSTEXPR core::string_view dns_message = "dns-message";

// font subtypes
BOOST_INLINE_CONSTEXPR core::string_view woff = "woff";
BOOST_INLINE_CONSTEXPR core::string_view woff2 = "woff2";

// multipart subtypes
BOOST_INLINE_CONSTEXPR core::string_view form_data = "form-data";

// image subtypes
BOOST_INLINE_CONSTEXPR core::string_view bmp = "bmp";
BOOST_INLINE_CONSTEXPR core::string_view gif = "gif";
BOOST_INLINE_CONSTEXPR core::string_view jpeg = "jpeg";
BOOST_INLINE_CONSTEXPR core::string_view png = "png";
BOOST_INLINE_CONSTEXPR core::string_view svg = "svg";
BOOST_INLINE_CONSTEXPR core::string_view webp = "webp";

// audio and video subtypes
BOOST_INLINE_CONSTEXPR core::string_view basic = "basic";
BOOST_INLINE_CONSTEXPR core::string_view mpeg = "mpeg";
BOOST_INLINE_CONSTEXPR core::string_view mp4 = "mp4";
BOOST_INLINE_CONSTEXPR core::string_view ogg = "ogg";

// parameters
BOOST_INLINE_CONSTEXPR core::string_view charset = "charset";
BOOST_INLINE_CONSTEXPR core::string_view boundary = "boundary";
BOOST_INLINE_CONSTEXPR core::string_view q = "q";

// parameter values
BOOST_INLINE_CONSTEXPR core::string_view utf_8 = "utf-8";

} // names

} // mime
} // boost

#endif
