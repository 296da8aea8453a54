//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#include <boost/mime/rfc/media_type_rule.hpp>
#include "src/detail/parse_mime.hpp"

namespace boost {
namespace mime {
namespace implementation_defined {

namespace {

system::result<mime_type>
parse_rule(
    char const*& it,
    char const* end,
    bool allow_range)
{
    parse_options opt;
    opt.allow_range = allow_range;
    std::size_t pos;
    auto rv = detail::parse_mime(
        core::string_view(it, end - it),
        opt, pos);
    if(! rv)
    {
        it += pos;
        return rv;
    }
    it = end;
    return rv;
}

} // (anon)

auto
media_type_rule_t::
parse(
    char const*& it,
    char const* end) const ->
        system::result<value_type>
{
    return parse_rule(it, end, false);
}

auto
media_range_rule_t::
parse(
    char const*& it,
    char const* end) const ->
        system::result<value_type>
{
    return parse_rule(it, end, true);
}

} // implementation_defined
} // mime
} // boost
