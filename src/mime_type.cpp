//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#include <boost/mime/mime_type.hpp>
#include <boost/mime/detail/except.hpp>
#include <boost/assert.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include "src/detail/atoms.hpp"
#include "src/detail/mime_access.hpp"
#include "src/detail/parse_mime.hpp"
#include <ostream>
#include <utility>

namespace boost {
namespace mime {

namespace {

// true if every parameter of a has a
// parameter of b with the same name and
// an equal value
bool
contains_all(
    params_view a,
    params_view b) noexcept
{
    for(auto pa : a)
    {
        bool found = false;
        for(auto pb : b)
        {
            if( grammar::ci_is_equal(
                    pa.name, pb.name) &&
                pa.value == pb.value)
            {
                found = true;
                break;
            }
        }
        if(! found)
            return false;
    }
    return true;
}

mime_type
parse_or_throw(
    core::string_view s,
    parse_options const& opt)
{
    std::size_t pos;
    auto rv = detail::parse_mime(s, opt, pos);
    if(! rv)
        detail::throw_system_error(
            rv.error(), "invalid MIME");
    return std::move(*rv);
}

} // (anon)

mime_type::
mime_type(
    detail::mime_source src,
    std::uint16_t slash,
    boost::optional<std::uint16_t> plus,
    detail::param_source params) noexcept
    : src_(std::move(src))
    , slash_(slash)
    , plus_(plus)
    , params_(std::move(params))
{
    BOOST_ASSERT(slash_ < src_.str().size());
    BOOST_ASSERT(src_.str()[slash_] == '/');
    BOOST_ASSERT(! plus_ || (
        *plus_ > slash_ + 1 &&
        *plus_ < params_start()));
}

mime_type::
mime_type(
    core::string_view s,
    parse_options const& opt)
    : mime_type(parse_or_throw(s, opt))
{
}

auto
mime_type::
param(core::string_view name) const noexcept ->
    boost::optional<param_value>
{
    for(auto p : params())
        if(grammar::ci_is_equal(p.name, name))
            return p.value;
    return boost::none;
}

mime_type
mime_type::
without_params() const
{
    if(! has_params())
        return *this;
    auto const s = essence();
    auto const a = detail::find_atom(s, slash_);
    if(a != atom::none)
        return make_atom(a);
    return mime_type(
        detail::mime_source(std::string(
            s.data(), s.size())),
        slash_,
        plus_,
        {});
}

bool
operator==(
    mime_type const& a,
    mime_type const& b) noexcept
{
    auto const ia = a.src_.id();
    auto const ib = b.src_.id();
    if(ia != 0 && ib != 0)
        return ia == ib;

    if(! grammar::ci_is_equal(
            a.essence(), b.essence()))
        return false;

    auto const sa = a.params_.shape();
    auto const sb = b.params_.shape();
    if( sa == detail::param_shape::none &&
        sb == detail::param_shape::none)
        return true;
    if( sa == detail::param_shape::utf8 &&
        sb == detail::param_shape::utf8)
        return true;
    if( sa == detail::param_shape::none ||
        sb == detail::param_shape::none)
        return false;

    if(a.params_.size() != b.params_.size())
        return false;
    return
        contains_all(a.params(), b.params()) &&
        contains_all(b.params(), a.params());
}

bool
operator==(
    mime_type const& m,
    core::string_view s)
{
    if( ! m.has_params() ||
        m.params_.shape() ==
            detail::param_shape::utf8)
    {
        if(grammar::ci_is_equal(m.str(), s))
            return true;
    }
    std::size_t pos;
    parse_options opt;
    opt.allow_range = true;
    auto rv = detail::parse_mime(s, opt, pos);
    if(! rv)
        return false;
    return m == *rv;
}

std::ostream&
operator<<(
    std::ostream& os,
    mime_type const& m)
{
    os << m.str();
    return os;
}

} // mime
} // boost
