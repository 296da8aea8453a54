//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_DETAIL_PARAM_SOURCE_HPP
#define BOOST_MIME_DETAIL_PARAM_SOURCE_HPP

#include <boost/mime/detail/config.hpp>
#include <boost/assert.hpp>
#include <boost/variant2/variant.hpp>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace boost {
namespace mime {
namespace detail {

// half-open byte range [first, last)
struct indexed
{
    std::uint16_t first = 0;
    std::uint16_t last = 0;

    std::size_t
    size() const noexcept
    {
        return last - first;
    }
};

struct indexed_pair
{
    indexed name;
    indexed value;
};

enum class param_shape
{
    none,
    utf8,
    one,
    two,
    custom
};

/*  Describes the parameters of a media type.

    The common shapes are stored inline, only
    three or more parameters use the heap. The
    utf8 shape means exactly one parameter equal
    to "charset=utf-8", with the name starting two
    bytes past pos().
*/
class param_source
{
    struct none_t
    {
    };

    struct utf8_t
    {
    };

    struct one_t
    {
        indexed_pair a;
    };

    struct two_t
    {
        indexed_pair a;
        indexed_pair b;
    };

    struct custom_t
    {
        std::vector<indexed_pair> v;
    };

    variant2::variant<
        none_t,
        utf8_t,
        one_t,
        two_t,
        custom_t> v_;
    std::uint16_t pos_ = 0;

    param_source(
        std::uint16_t pos,
        utf8_t) noexcept
        : v_(utf8_t{})
        , pos_(pos)
    {
    }

public:
    param_source() = default;

    param_source(
        std::uint16_t pos,
        indexed_pair const& p) noexcept
        : v_(one_t{ p })
        , pos_(pos)
    {
    }

    static
    param_source
    utf8(std::uint16_t pos) noexcept
    {
        return param_source(pos, utf8_t{});
    }

    param_shape
    shape() const noexcept
    {
        return static_cast<
            param_shape>(v_.index());
    }

    bool
    empty() const noexcept
    {
        return shape() == param_shape::none;
    }

    // offset of the byte which ends the subtype
    std::uint16_t
    pos() const noexcept
    {
        BOOST_ASSERT(! empty());
        return pos_;
    }

    std::size_t
    size() const noexcept
    {
        switch(shape())
        {
        case param_shape::none:
            return 0;
        case param_shape::utf8:
        case param_shape::one:
            return 1;
        case param_shape::two:
            return 2;
        default:
            break;
        }
        return variant2::get<
            custom_t>(v_).v.size();
    }

    indexed_pair
    get(std::size_t i) const noexcept
    {
        BOOST_ASSERT(i < size());
        switch(shape())
        {
        case param_shape::utf8:
        {
            indexed_pair p;
            p.name.first = pos_ + 2;
            p.name.last = pos_ + 9;
            p.value.first = pos_ + 10;
            p.value.last = pos_ + 15;
            return p;
        }
        case param_shape::one:
            return variant2::get<one_t>(v_).a;
        case param_shape::two:
        {
            auto const& t = variant2::get<two_t>(v_);
            return i == 0 ? t.a : t.b;
        }
        default:
            break;
        }
        return variant2::get<
            custom_t>(v_).v[i];
    }

    // Append a parameter, promoting the shape.
    // An empty source is never pushed to, the
    // first parameter picks utf8 or one.
    void
    push(indexed_pair const& p)
    {
        switch(shape())
        {
        case param_shape::utf8:
        case param_shape::one:
        {
            auto const a = get(0);
            v_.emplace<two_t>(two_t{ a, p });
            break;
        }
        case param_shape::two:
        {
            auto const& t = variant2::get<two_t>(v_);
            custom_t c;
            c.v.reserve(4);
            c.v.push_back(t.a);
            c.v.push_back(t.b);
            c.v.push_back(p);
            v_.emplace<custom_t>(std::move(c));
            break;
        }
        case param_shape::custom:
            variant2::get<custom_t>(
                v_).v.push_back(p);
            break;
        default:
            BOOST_ASSERT(false);
            break;
        }
    }
};

} // detail
} // mime
} // boost

#endif
