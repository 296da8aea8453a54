//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_DETAIL_EXCEPT_HPP
#define BOOST_MIME_DETAIL_EXCEPT_HPP

#include <boost/mime/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace mime {
namespace detail {

BOOST_MIME_DECL
BOOST_NORETURN
void
throw_invalid_argument(
    source_location const& loc =
        BOOST_CURRENT_LOCATION);

BOOST_MIME_DECL
BOOST_NORETURN
void
throw_system_error(
    system::error_code const& ec,
    char const* what,
    source_location const& loc =
        BOOST_CURRENT_LOCATION);

} // detail
} // mime
} // boost

#endif
