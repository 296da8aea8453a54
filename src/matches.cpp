//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#include <boost/mime/mime_type.hpp>
#include <boost/mime/names.hpp>
#include <boost/url/grammar/ci_string.hpp>

namespace boost {
namespace mime {

namespace {

bool
matches_params(
    mime_type const& range,
    mime_type const& type) noexcept
{
    for(auto p : range.params())
    {
        // weight is not a constraint
        if(grammar::ci_is_equal(p.name, names::q))
            continue;
        auto const v = type.param(p.name);
        if(! v || *v != p.value)
            return false;
    }
    return true;
}

// the subtype followed by the suffix, if any
core::string_view
full_subtype(mime_type const& m) noexcept
{
    return m.essence().substr(
        m.type().size() + 1);
}

} // (anon)

bool
matches(
    mime_type const& range,
    mime_type const& type) noexcept
{
    if(range.type() == names::star)
        return matches_params(range, type);

    if(! grammar::ci_is_equal(
            range.type(), type.type()))
        return false;

    if(! range.is_range() &&
        ! grammar::ci_is_equal(
            full_subtype(range),
            full_subtype(type)))
        return false;

    return matches_params(range, type);
}

} // mime
} // boost
