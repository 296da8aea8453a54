//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_SRC_DETAIL_ATOMS_HPP
#define BOOST_MIME_SRC_DETAIL_ATOMS_HPP

#include <boost/mime/atoms.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <cstdint>

namespace boost {
namespace mime {
namespace detail {

// An interned media type. The plus and
// semicolon offsets are zero when absent.
struct atom_entry
{
    core::string_view str;
    std::uint16_t slash;
    std::uint16_t plus;
    std::uint16_t semicolon;
};

// Returns nullptr for atom::none and
// values outside the table.
atom_entry const*
get_atom_entry(atom a) noexcept;

// Look up a media type without parameters.
// Case is ignored.
atom
find_atom(
    core::string_view s,
    std::size_t slash) noexcept;

// Look up a media type whose parameters are
// s[semi..], which must be "; charset=utf-8"
// ignoring case.
atom
find_atom_utf8(
    core::string_view s,
    std::size_t slash,
    std::size_t semi) noexcept;

} // detail
} // mime
} // boost

#endif
