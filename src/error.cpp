//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#include <boost/mime/error.hpp>
#include <cstdio>

namespace boost {
namespace mime {

namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "boost.mime";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::missing_slash: return "a slash (/) was missing between the type and subtype";
    case error::missing_equal: return "an equals sign (=) was missing between a parameter and its value";
    case error::missing_quote: return "a quote (\") was missing from a parameter value";
    case error::invalid_token: return "invalid token";
    case error::invalid_range: return "unexpected asterisk";
    case error::too_long: return "the string is too long";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "boost.mime";
}

std::string
condition_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(code))
    {
    default:
    case condition::invalid_mime: return "invalid media type";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int code) const noexcept
{
    switch(static_cast<condition>(code))
    {
    case condition::invalid_mime:
        return ec.category() == error_cat;

    default:
        break;
    }
    return false;
}

//-----------------------------------------------

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail

//-----------------------------------------------

std::string
format_error(
    system::error_code const& ec,
    core::string_view s,
    std::size_t pos)
{
    if( ec != error::invalid_token ||
        pos >= s.size())
        return ec.message();
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02X",
        static_cast<unsigned>(
            static_cast<unsigned char>(s[pos])));
    std::string r = ec.message();
    r.append(", ");
    r.append(buf);
    r.append(" at position ");
    r.append(std::to_string(pos));
    return r;
}

} // mime
} // boost
