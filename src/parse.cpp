//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#include <boost/mime/parse.hpp>
#include <boost/mime/names.hpp>
#include <boost/mime/rfc/detail/chars.hpp>
#include <boost/assert.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include "src/detail/atoms.hpp"
#include "src/detail/mime_access.hpp"
#include "src/detail/parse_mime.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace boost {
namespace mime {
namespace detail {

namespace {

std::uint16_t
as_u16(std::size_t i) noexcept
{
    BOOST_ASSERT(i <= BOOST_MIME_MAX_SIZE);
    return static_cast<std::uint16_t>(i);
}

void
to_lower(
    std::string& s,
    indexed r) noexcept
{
    for(auto i = r.first; i < r.last; ++i)
        s[i] = grammar::to_lower(s[i]);
}

// Copy the string, lowering the type, subtype,
// suffix, each parameter name and the value of
// each charset parameter.
std::string
lower_with_params(
    core::string_view s,
    param_source const& ps)
{
    std::string r(s.data(), s.size());
    indexed essence;
    essence.last = ps.pos();
    to_lower(r, essence);
    auto const n = ps.size();
    for(std::size_t i = 0; i < n; ++i)
    {
        auto const p = ps.get(i);
        to_lower(r, p.name);
        if(core::string_view(
            r.data() + p.name.first,
            p.name.size()) == names::charset)
            to_lower(r, p.value);
    }
    return r;
}

std::string
lower(core::string_view s)
{
    std::string r(s.data(), s.size());
    for(auto& c : r)
        c = grammar::to_lower(c);
    return r;
}

mime_type
finish(
    core::string_view s,
    std::uint16_t slash,
    boost::optional<std::uint16_t> plus,
    param_source ps)
{
    switch(ps.shape())
    {
    case param_shape::none:
    {
        auto const a = find_atom(s, slash);
        if(a != atom::none)
            return mime_access::construct(
                mime_source(atom_ref{
                    static_cast<unsigned char>(a),
                    get_atom_entry(a)->str }),
                slash, plus, std::move(ps));
        return mime_access::construct(
            mime_source(lower(s)),
            slash, plus, std::move(ps));
    }

    case param_shape::utf8:
    {
        auto const a = find_atom_utf8(
            s, slash, ps.pos());
        if(a != atom::none)
            return mime_access::construct(
                mime_source(atom_ref{
                    static_cast<unsigned char>(a),
                    get_atom_entry(a)->str }),
                slash, plus, std::move(ps));
        // every byte is case-insensitive here
        return mime_access::construct(
            mime_source(lower(s)),
            slash, plus, std::move(ps));
    }

    default:
        break;
    }
    auto r = lower_with_params(s, ps);
    return mime_access::construct(
        mime_source(std::move(r)),
        slash, plus, std::move(ps));
}

} // (anon)

//------------------------------------------------

system::result<mime_type>
parse_mime(
    core::string_view s,
    parse_options const& opt,
    std::size_t& pos)
{
    auto const n = s.size();
    pos = 0;
    if(n > BOOST_MIME_MAX_SIZE)
        BOOST_MIME_RETURN_EC(
            error::too_long);

    if(s == "*/*")
    {
        if(! opt.allow_range)
            BOOST_MIME_RETURN_EC(
                error::invalid_range);
        return make_atom(atom::star_star);
    }

    auto const is_ows = [&opt](char c)
    {
        return opt.allow_ows && ws(c);
    };

    // type
    std::size_t i = 0;
    bool star_type = false;
    for(;;)
    {
        if(i == n)
        {
            pos = n;
            BOOST_MIME_RETURN_EC(
                error::missing_slash);
        }
        char const c = s[i];
        if(c == '/' && i > 0)
            break;
        if( c == '*' && i == 0 &&
            n > 1 && s[1] == '/')
        {
            // "*/*" followed by parameters
            if(! opt.allow_range)
                BOOST_MIME_RETURN_EC(
                    error::invalid_range);
            star_type = true;
            ++i;
            continue;
        }
        if(! token_chars(c))
        {
            pos = i;
            BOOST_MIME_RETURN_EC(
                error::invalid_token);
        }
        ++i;
    }
    auto const slash = as_u16(i);

    // subtype
    auto const start = ++i;
    boost::optional<std::uint16_t> plus;
    std::size_t params_start = n;
    for(;;)
    {
        if(i == n)
        {
            if(i == start)
            {
                pos = n;
                BOOST_MIME_RETURN_EC(
                    error::invalid_token);
            }
            break;
        }
        char const c = s[i];
        if(c == '*' && i == start)
        {
            if(! opt.allow_range)
            {
                pos = i;
                BOOST_MIME_RETURN_EC(
                    error::invalid_range);
            }
            ++i;
            if(i == n)
                break;
            if(s[i] != ';' && ! is_ows(s[i]))
            {
                pos = i;
                BOOST_MIME_RETURN_EC(
                    error::invalid_token);
            }
            params_start = i;
            break;
        }
        if(star_type)
        {
            pos = i;
            BOOST_MIME_RETURN_EC(
                error::invalid_token);
        }
        if(i > start)
        {
            if(c == ';' || is_ows(c))
            {
                params_start = i;
                break;
            }
            if(c == '+' && ! plus)
                plus = as_u16(i);
        }
        if(! token_chars(c))
        {
            pos = i;
            BOOST_MIME_RETURN_EC(
                error::invalid_token);
        }
        ++i;
    }

    if(params_start == n)
        return finish(
            s, slash, plus, {});

    // parameters
    auto const semi = as_u16(params_start);
    param_source ps;
    i = params_start;
    for(;;)
    {
        // OWS ";" OWS
        while(i < n && ws(s[i]))
            ++i;
        if(i == n)
            break;
        if(s[i] != ';')
        {
            pos = i;
            BOOST_MIME_RETURN_EC(
                error::invalid_token);
        }
        ++i;
        while(i < n && ws(s[i]))
            ++i;
        if(i == n)
            break;
        if(s[i] == ';')
            continue;

        // name
        indexed_pair p;
        p.name.first = as_u16(i);
        for(;;)
        {
            if(i == n)
            {
                pos = n;
                BOOST_MIME_RETURN_EC(
                    error::missing_equal);
            }
            char const c = s[i];
            if(c == '=' && i > p.name.first)
                break;
            if(! token_chars(c))
            {
                pos = i;
                BOOST_MIME_RETURN_EC(
                    error::invalid_token);
            }
            ++i;
        }
        p.name.last = as_u16(i);
        ++i;

        // value
        p.value.first = as_u16(i);
        if(i < n && s[i] == '"')
        {
            ++i;
            for(;;)
            {
                if(i == n)
                {
                    pos = n;
                    BOOST_MIME_RETURN_EC(
                        error::missing_quote);
                }
                char const c = s[i];
                if(c == '"')
                {
                    ++i;
                    break;
                }
                if(c == '\\')
                {
                    // quoted-pair
                    ++i;
                    if(i == n)
                    {
                        pos = n;
                        BOOST_MIME_RETURN_EC(
                            error::missing_quote);
                    }
                }
                if(! qdtext(s[i]))
                {
                    pos = i;
                    BOOST_MIME_RETURN_EC(
                        error::invalid_token);
                }
                ++i;
            }
        }
        else
        {
            while(i < n && token_chars(s[i]))
                ++i;
            if( i == p.value.first || (
                i < n && s[i] != ';' &&
                ! is_ows(s[i])))
            {
                pos = i;
                BOOST_MIME_RETURN_EC(
                    error::invalid_token);
            }
        }
        p.value.last = as_u16(i);

        if(! ps.empty())
        {
            ps.push(p);
            continue;
        }
        if( p.name.first == params_start + 2 &&
            grammar::ci_is_equal(
                s.substr(p.name.first, p.name.size()),
                names::charset) &&
            grammar::ci_is_equal(
                s.substr(p.value.first, p.value.size()),
                names::utf_8))
            ps = param_source::utf8(semi);
        else
            ps = param_source(semi, p);
    }

    if(ps.empty())
    {
        // only empty parameters, drop them
        return finish(
            s.substr(0, params_start),
            slash, plus, {});
    }
    return finish(
        s, slash, plus, std::move(ps));
}

} // detail

//------------------------------------------------

system::result<mime_type>
parse(
    core::string_view s,
    parse_options const& opt)
{
    std::size_t pos;
    return detail::parse_mime(s, opt, pos);
}

} // mime
} // boost
