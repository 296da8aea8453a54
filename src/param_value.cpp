//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#include <boost/mime/param_value.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <ostream>

namespace boost {
namespace mime {

namespace {

// Visits the content characters of a value,
// skipping the quotes and the backslash of
// each quoted-pair.
class content_cursor
{
    char const* it_;
    char const* end_;
    bool quoted_ = false;

public:
    explicit
    content_cursor(
        core::string_view s) noexcept
        : it_(s.data())
        , end_(s.data() + s.size())
    {
        if( s.size() >= 2 &&
            s.front() == '"' &&
            s.back() == '"')
        {
            ++it_;
            --end_;
            quoted_ = true;
        }
    }

    bool
    done() const noexcept
    {
        return it_ == end_;
    }

    char
    next() noexcept
    {
        if( quoted_ &&
            *it_ == '\\' &&
            end_ - it_ > 1)
            ++it_;
        return *it_++;
    }
};

bool
content_equal(
    content_cursor a,
    content_cursor b,
    bool icase) noexcept
{
    while(! a.done() && ! b.done())
    {
        char ca = a.next();
        char cb = b.next();
        if(icase)
        {
            ca = grammar::to_lower(ca);
            cb = grammar::to_lower(cb);
        }
        if(ca != cb)
            return false;
    }
    return a.done() && b.done();
}

} // (anon)

bool
param_value::
has_escapes() const noexcept
{
    if(! is_quoted())
        return false;
    return s_.find('\\') != core::string_view::npos;
}

std::size_t
param_value::
unescaped_size() const noexcept
{
    std::size_t n = 0;
    content_cursor c(s_);
    while(! c.done())
    {
        c.next();
        ++n;
    }
    return n;
}

std::string
param_value::
content() const
{
    std::string r;
    r.reserve(unescaped_size());
    content_cursor c(s_);
    while(! c.done())
        r.push_back(c.next());
    return r;
}

bool
operator==(
    param_value const& a,
    param_value const& b) noexcept
{
    return content_equal(
        content_cursor(a.s_),
        content_cursor(b.s_),
        a.icase_ || b.icase_);
}

bool
operator==(
    param_value const& v,
    core::string_view s) noexcept
{
    if(v.is_quoted())
    {
        content_cursor a(v.s_);
        for(char c : s)
        {
            if(a.done())
                return false;
            char ca = a.next();
            if(v.icase_)
            {
                ca = grammar::to_lower(ca);
                c = grammar::to_lower(c);
            }
            if(ca != c)
                return false;
        }
        return a.done();
    }
    if(v.icase_)
        return grammar::ci_is_equal(v.s_, s);
    return v.s_ == s;
}

std::ostream&
operator<<(
    std::ostream& os,
    param_value const& v)
{
    os << v.s_;
    return os;
}

} // mime
} // boost
