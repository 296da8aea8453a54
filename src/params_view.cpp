//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#include <boost/mime/params_view.hpp>
#include <boost/mime/names.hpp>
#include <boost/assert.hpp>
#include <boost/url/grammar/ci_string.hpp>

namespace boost {
namespace mime {

param
params_view::
operator[](std::size_t i) const noexcept
{
    BOOST_ASSERT(i < size());
    if(ps_->shape() == detail::param_shape::utf8)
    {
        // synthesized, the source is not read
        return param{
            names::charset,
            param_value(names::utf_8, true) };
    }
    auto const p = ps_->get(i);
    auto const name = s_.substr(
        p.name.first, p.name.size());
    return param{
        name,
        param_value(
            s_.substr(p.value.first, p.value.size()),
            grammar::ci_is_equal(name, names::charset)) };
}

} // mime
} // boost
