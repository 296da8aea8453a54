//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

// Test that header file is self-contained.
#include <boost/mime/detail/param_source.hpp>

#include "test_suite.hpp"

namespace boost {
namespace mime {
namespace detail {

struct param_source_test
{
    static
    indexed_pair
    make_pair(
        std::uint16_t n0, std::uint16_t n1,
        std::uint16_t v0, std::uint16_t v1)
    {
        indexed_pair p;
        p.name.first = n0;
        p.name.last = n1;
        p.value.first = v0;
        p.value.last = v1;
        return p;
    }

    static
    bool
    same(indexed_pair const& a, indexed_pair const& b)
    {
        return
            a.name.first == b.name.first &&
            a.name.last == b.name.last &&
            a.value.first == b.value.first &&
            a.value.last == b.value.last;
    }

    void
    testNone()
    {
        param_source ps;
        BOOST_TEST(ps.empty());
        BOOST_TEST(ps.shape() == param_shape::none);
        BOOST_TEST_EQ(ps.size(), 0u);
    }

    void
    testUtf8()
    {
        // "text/plain; charset=utf-8"
        auto ps = param_source::utf8(10);
        BOOST_TEST(! ps.empty());
        BOOST_TEST(ps.shape() == param_shape::utf8);
        BOOST_TEST_EQ(ps.pos(), 10u);
        BOOST_TEST_EQ(ps.size(), 1u);
        BOOST_TEST(same(ps.get(0),
            make_pair(12, 19, 20, 25)));

        // promotion keeps the implied pair
        auto const b = make_pair(27, 28, 29, 30);
        ps.push(b);
        BOOST_TEST(ps.shape() == param_shape::two);
        BOOST_TEST_EQ(ps.pos(), 10u);
        BOOST_TEST(same(ps.get(0),
            make_pair(12, 19, 20, 25)));
        BOOST_TEST(same(ps.get(1), b));
    }

    void
    testPromote()
    {
        auto const a = make_pair(11, 12, 13, 14);
        auto const b = make_pair(15, 16, 17, 18);
        auto const c = make_pair(19, 20, 21, 22);
        auto const d = make_pair(23, 24, 25, 26);

        param_source ps(10, a);
        BOOST_TEST(ps.shape() == param_shape::one);
        BOOST_TEST_EQ(ps.size(), 1u);
        BOOST_TEST(same(ps.get(0), a));

        ps.push(b);
        BOOST_TEST(ps.shape() == param_shape::two);
        BOOST_TEST_EQ(ps.size(), 2u);

        ps.push(c);
        BOOST_TEST(ps.shape() == param_shape::custom);
        BOOST_TEST_EQ(ps.size(), 3u);

        ps.push(d);
        BOOST_TEST(ps.shape() == param_shape::custom);
        BOOST_TEST_EQ(ps.size(), 4u);
        BOOST_TEST_EQ(ps.pos(), 10u);
        BOOST_TEST(same(ps.get(0), a));
        BOOST_TEST(same(ps.get(1), b));
        BOOST_TEST(same(ps.get(2), c));
        BOOST_TEST(same(ps.get(3), d));

        // copies are independent
        auto ps2 = ps;
        ps2.push(a);
        BOOST_TEST_EQ(ps.size(), 4u);
        BOOST_TEST_EQ(ps2.size(), 5u);
    }

    void
    run()
    {
        testNone();
        testUtf8();
        testPromote();
    }
};

TEST_SUITE(
    param_source_test,
    "boost.mime.detail.param_source");

} // detail
} // mime
} // boost
