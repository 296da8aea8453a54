//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_SRC_DETAIL_MIME_ACCESS_HPP
#define BOOST_MIME_SRC_DETAIL_MIME_ACCESS_HPP

#include <boost/mime/mime_type.hpp>
#include <utility>

namespace boost {
namespace mime {
namespace detail {

struct mime_access
{
    // The offsets must describe a string which
    // the scanner accepts.
    static
    mime_type
    construct(
        mime_source src,
        std::uint16_t slash,
        boost::optional<std::uint16_t> plus,
        param_source params) noexcept
    {
        return mime_type(
            std::move(src),
            slash,
            plus,
            std::move(params));
    }

    static
    mime_source const&
    source(mime_type const& m) noexcept
    {
        return m.src_;
    }

    static
    param_source const&
    params(mime_type const& m) noexcept
    {
        return m.params_;
    }

    static
    std::uint16_t
    slash(mime_type const& m) noexcept
    {
        return m.slash_;
    }

    static
    boost::optional<std::uint16_t>
    plus(mime_type const& m) noexcept
    {
        return m.plus_;
    }
};

} // detail
} // mime
} // boost

#endif
