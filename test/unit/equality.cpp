//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#include <boost/mime/mime_type.hpp>
#include <boost/mime/parse.hpp>

#include "test_suite.hpp"

namespace boost {
namespace mime {

struct equality_test
{
    static
    mime_type
    range(core::string_view s)
    {
        parse_options opt;
        opt.allow_range = true;
        return mime_type(s, opt);
    }

    void
    eq(core::string_view a, core::string_view b)
    {
        mime_type const ma(a);
        mime_type const mb(b);
        BOOST_TEST(ma == mb);
        BOOST_TEST(mb == ma);
        BOOST_TEST(! (ma != mb));
        BOOST_TEST(ma == b);
        BOOST_TEST(b == ma);
        BOOST_TEST(mb == a);
    }

    void
    ne(core::string_view a, core::string_view b)
    {
        mime_type const ma(a);
        mime_type const mb(b);
        BOOST_TEST(ma != mb);
        BOOST_TEST(mb != ma);
        BOOST_TEST(! (ma == mb));
        BOOST_TEST(ma != b);
        BOOST_TEST(b != ma);
        BOOST_TEST(mb != a);
    }

    void
    testEssence()
    {
        eq("text/plain", "text/plain");
        eq("TEXT/PLAIN", "text/plain");
        eq("text/x-foo", "TEXT/X-FOO");
        eq("image/svg+xml", "IMAGE/SVG+XML");
        eq("text/plain;", "text/plain");
        eq("a/b ;", "a/b");

        ne("text/plain", "text/html");
        ne("text/plain", "text/plai");
        ne("text/x-foo", "text/x-bar");
        ne("image/svg+xml", "image/svg");
    }

    void
    testParams()
    {
        eq("text/plain; charset=utf-8",
            "text/plain;charset=utf-8");
        eq("text/plain;CHARSET=UTF-8",
            "text/plain;charset=utf-8");
        eq("text/plain; charset=\"utf-8\"",
            "text/plain; charset=utf-8");
        eq("text/plain; charset=\"UTF-8\"",
            "text/plain; charset=utf-8");
        eq("a/b; x=1; y=2", "a/b; y=2; x=1");
        eq("application/x-custom; param1=a; param2=b",
            "application/x-custom; param2=b; param1=a");
        eq("text/x-custom; abc=a", "text/x-custom; aBc=a");
        eq("a/b; x=\"ab\"", "a/b; x=ab");
        eq("a/b; x=\"a\\b\"", "a/b; x=ab");
        eq("a/b; w=1; x=2; y=3; z=4",
            "a/b; z=4; y=3; x=2; w=1");
        eq("a/b; charset=utf-8; x=1",
            "a/b; x=1; CHARSET=UTF-8");

        ne("a/b; x=AB", "a/b; x=ab");
        ne("a/b; x=1", "a/b; y=1");
        ne("a/b; x=1", "a/b; x=1; y=2");
        ne("a/b; x=1; y=2", "a/b; x=1; z=2");
        ne("a/b; x=1; x=1", "a/b; x=1; y=1");
        ne("text/plain", "text/plain; charset=utf-8");
        ne("text/plain; charset=utf-8",
            "text/plain; charset=latin1");
        ne("a/b; x=\"ab\"", "a/b; x=\"Ab\"");
    }

    void
    testAtoms()
    {
        // interned on both sides
        mime_type const a("text/plain; charset=utf-8");
        mime_type const b("TEXT/PLAIN; CHARSET=UTF-8");
        BOOST_TEST(a.atom_id() != atom::none);
        BOOST_TEST(a.atom_id() == b.atom_id());
        BOOST_TEST(a == b);

        // interned against dynamic
        mime_type const c("text/plain ; charset=utf-8");
        BOOST_TEST(c.atom_id() == atom::none);
        BOOST_TEST(a == c);
        BOOST_TEST(c == a);

        mime_type const d("text/plain");
        BOOST_TEST(a != d);
        BOOST_TEST(d != c);

        // utf8 shapes on both sides
        mime_type const e("a/b; charset=utf-8");
        mime_type const f("A/B ;charset=UTF-8");
        BOOST_TEST(e == f);
    }

    void
    testString()
    {
        mime_type const mt("text/plain; charset=utf-8");
        BOOST_TEST(mt == "text/plain; charset=utf-8");
        BOOST_TEST(mt == "TEXT/PLAIN; CHARSET=UTF-8");
        BOOST_TEST(mt == "text/plain;charset=utf-8");
        BOOST_TEST(mt == "text/plain;charset=\"utf-8\"");
        BOOST_TEST(mt != "text/plain");
        BOOST_TEST(mt != "garbage");
        BOOST_TEST(mt != "");

        mime_type const tp("text/plain");
        BOOST_TEST(tp == "Text/Plain");
        BOOST_TEST(tp == "text/plain;");
        BOOST_TEST(tp == "text/plain ");
        BOOST_TEST(tp != "text/plain; x=1");
        BOOST_TEST(tp != "text/*");

        mime_type const star = range("text/*");
        BOOST_TEST(star == "text/*");
        BOOST_TEST(star == "TEXT/*");
        BOOST_TEST(star != "text/plain");

        mime_type const any = range("*/*");
        BOOST_TEST(any == "*/*");
        BOOST_TEST(any != "text/plain");

        mime_type const q("a/b; x=\"Q\"");
        BOOST_TEST(q == "a/b; x=Q");
        BOOST_TEST(q != "a/b; x=\"q\"");
    }

    void
    testRoundTrip()
    {
        core::string_view const cases[] = {
            "text/plain",
            "TEXT/PLAIN; CHARSET=UTF-8",
            "Multipart/Form-Data; Boundary=AbCd",
            "a/b; x=\"q\\\"uote\"; CHARSET=\"LATIN1\"",
            "image/SVG+XML ; A=B ;C=\"D\"",
            "text/plain;;x=1",
        };
        for(auto s : cases)
        {
            auto rv = parse(s);
            if(! BOOST_TEST(rv.has_value()))
                continue;
            auto rv2 = parse(rv->str());
            if(! BOOST_TEST(rv2.has_value()))
                continue;
            BOOST_TEST(*rv == *rv2);
            BOOST_TEST_EQ(rv->str(), rv2->str());
        }
    }

    void
    run()
    {
        testEssence();
        testParams();
        testAtoms();
        testString();
        testRoundTrip();
    }
};

TEST_SUITE(
    equality_test,
    "boost.mime.equality");

} // mime
} // boost
