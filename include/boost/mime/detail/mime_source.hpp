//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_DETAIL_MIME_SOURCE_HPP
#define BOOST_MIME_DETAIL_MIME_SOURCE_HPP

#include <boost/mime/detail/config.hpp>
#include <boost/mime/atoms.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/variant2/variant.hpp>
#include <string>
#include <utility>

namespace boost {
namespace mime {
namespace detail {

// A string with static storage duration and
// its table identity. The identity 0 is used
// by constants which are always compared
// structurally.
struct atom_ref
{
    unsigned char id;
    core::string_view str;
};

/*  The characters of a media type.

    Either a reference to an interned string,
    or an owned copy which has already been
    normalized to lower case.
*/
class mime_source
{
    variant2::variant<
        atom_ref,
        std::string> v_;

public:
    explicit
    mime_source(
        atom_ref const& a) noexcept
        : v_(a)
    {
    }

    explicit
    mime_source(
        std::string s) noexcept
        : v_(std::move(s))
    {
    }

    bool
    is_atom() const noexcept
    {
        return v_.index() == 0;
    }

    // 0 if dynamic
    unsigned char
    id() const noexcept
    {
        if(auto p = variant2::get_if<
                atom_ref>(&v_))
            return p->id;
        return 0;
    }

    core::string_view
    str() const noexcept
    {
        if(auto p = variant2::get_if<
                atom_ref>(&v_))
            return p->str;
        return variant2::get<
            std::string>(v_);
    }
};

} // detail
} // mime
} // boost

#endif
