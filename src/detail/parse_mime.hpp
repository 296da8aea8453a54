//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_SRC_DETAIL_PARSE_MIME_HPP
#define BOOST_MIME_SRC_DETAIL_PARSE_MIME_HPP

#include <boost/mime/mime_type.hpp>
#include <boost/mime/parse_options.hpp>
#include <boost/system/result.hpp>
#include <cstddef>

namespace boost {
namespace mime {
namespace detail {

// Scan and normalize a media type. On failure
// pos is the offset where scanning stopped.
system::result<mime_type>
parse_mime(
    core::string_view s,
    parse_options const& opt,
    std::size_t& pos);

} // detail
} // mime
} // boost

#endif
