//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

// Test that header file is self-contained.
#include <boost/mime/mime_type.hpp>

#include <boost/mime/names.hpp>
#include <boost/mime/parse.hpp>

#include "test_suite.hpp"

#include <sstream>
#include <utility>

namespace boost {
namespace mime {

struct mime_type_test
{
    void
    testAccessors()
    {
        {
            mime_type mt("text/plain");
            BOOST_TEST_EQ(mt.str(), "text/plain");
            BOOST_TEST_EQ(mt.type(), names::text);
            BOOST_TEST_EQ(mt.subtype(), names::plain);
            BOOST_TEST_EQ(mt.essence(), "text/plain");
            BOOST_TEST(! mt.suffix().has_value());
            BOOST_TEST(! mt.has_params());
            BOOST_TEST(mt.params().empty());
            BOOST_TEST(! mt.is_range());
        }
        {
            mime_type mt("TEXT/PLAIN");
            BOOST_TEST_EQ(mt.type(), "text");
            BOOST_TEST_EQ(mt.subtype(), "plain");
            BOOST_TEST_EQ(mt.str(), "text/plain");
        }
        {
            mime_type mt("image/svg+xml");
            BOOST_TEST_EQ(mt.type(), names::image);
            BOOST_TEST_EQ(mt.subtype(), names::svg);
            if(BOOST_TEST(mt.suffix().has_value()))
                BOOST_TEST_EQ(*mt.suffix(), names::xml);
        }
        {
            mime_type mt("text/plain ; charset=utf-8");
            BOOST_TEST_EQ(mt.type(), "text");
            BOOST_TEST_EQ(mt.subtype(), "plain");
            BOOST_TEST_EQ(mt.essence(), "text/plain");
            BOOST_TEST(mt.has_params());
            auto v = mt.param("charset");
            if(BOOST_TEST(v.has_value()))
                BOOST_TEST(*v == "utf-8");
        }
        {
            mime_type mt("Application/Vnd.API+JSON; Charset=UTF-8; Q=X");
            BOOST_TEST_EQ(mt.type(), "application");
            BOOST_TEST_EQ(mt.subtype(), "vnd.api");
            BOOST_TEST_EQ(mt.essence(), "application/vnd.api+json");
            if(BOOST_TEST(mt.suffix().has_value()))
                BOOST_TEST_EQ(*mt.suffix(), "json");
            BOOST_TEST_EQ(mt.params().size(), 2u);
            BOOST_TEST_EQ(mt.str(),
                "application/vnd.api+json; charset=utf-8; q=X");
        }
        {
            mime_type mt("text/*", { true });
            BOOST_TEST(mt.is_range());
            BOOST_TEST_EQ(mt.subtype(), names::star);
        }
    }

    void
    testParam()
    {
        mime_type mt(
            "multipart/form-data; charset=BASE64; boundary=ABCDEFG");
        BOOST_TEST(mt.type() == names::multipart);
        BOOST_TEST(mt.subtype() == names::form_data);

        auto cs = mt.param(names::charset);
        if(BOOST_TEST(cs.has_value()))
        {
            BOOST_TEST(*cs == "bAsE64");
            BOOST_TEST_EQ(cs->str(), "base64");
        }

        auto b = mt.param("BOUNDARY");
        if(BOOST_TEST(b.has_value()))
        {
            BOOST_TEST(*b == "ABCDEFG");
            BOOST_TEST(*b != "abcdefg");
            BOOST_TEST_EQ(b->str(), "ABCDEFG");
        }

        BOOST_TEST(! mt.param("baz").has_value());
        BOOST_TEST(! mime_type("text/plain").param(
            "charset").has_value());

        // the first of several
        mime_type dup("a/b; x=1; x=2");
        auto x = dup.param("x");
        if(BOOST_TEST(x.has_value()))
            BOOST_TEST(*x == "1");

        mime_type q("application/x-custom; title=\"the \\\" char\"");
        auto t = q.param("title");
        if(BOOST_TEST(t.has_value()))
        {
            BOOST_TEST(*t == "the \" char");
            BOOST_TEST_EQ(t->content(), "the \" char");
        }

        mime_type e("application/x-custom;param=\"\"");
        auto pe = e.param("param");
        if(BOOST_TEST(pe.has_value()))
            BOOST_TEST(*pe == "");
    }

    void
    testWithoutParams()
    {
        {
            mime_type mt("text/plain; charset=latin1");
            auto s = mt.without_params();
            BOOST_TEST_EQ(s.str(), "text/plain");
            BOOST_TEST(! s.has_params());
            BOOST_TEST(s.atom_id() == atom::text_plain);
            BOOST_TEST(s == mime_type("text/plain"));
        }
        {
            auto s = make_atom(
                atom::text_html_utf_8).without_params();
            BOOST_TEST(s.atom_id() == atom::text_html);
        }
        {
            mime_type mt("IMAGE/X-Custom+XML ; a=b");
            auto s = mt.without_params();
            BOOST_TEST_EQ(s.str(), "image/x-custom+xml");
            BOOST_TEST(s.atom_id() == atom::none);
            if(BOOST_TEST(s.suffix().has_value()))
                BOOST_TEST_EQ(*s.suffix(), "xml");
        }
        {
            mime_type mt("a/b");
            BOOST_TEST_EQ(mt.without_params().str(), "a/b");
        }
    }

    void
    testAtoms()
    {
        mime_type a("text/plain; charset=utf-8");
        mime_type b("Text/Plain; Charset=UTF-8");
        BOOST_TEST(a.atom_id() == atom::text_plain_utf_8);
        BOOST_TEST(b.atom_id() == atom::text_plain_utf_8);
        BOOST_TEST_EQ(b.str(), "text/plain; charset=utf-8");

        // only the canonical spelling is interned
        mime_type c("text/plain;charset=utf-8");
        BOOST_TEST(c.atom_id() == atom::none);
        BOOST_TEST(c == a);

        mime_type d("text/foo");
        BOOST_TEST(d.atom_id() == atom::none);
    }

    void
    testFormat()
    {
        mime_type mt("TEXT/HTML; Charset=UTF-8");
        BOOST_TEST_EQ(to_string(mt), "text/html; charset=utf-8");
        std::stringstream ss;
        ss << mt;
        BOOST_TEST_EQ(ss.str(), "text/html; charset=utf-8");
    }

    void
    testCopy()
    {
        mime_type a("a/b; x=1; y=2; z=3");
        mime_type b = a;
        BOOST_TEST(a == b);
        BOOST_TEST_EQ(b.params().size(), 3u);
        mime_type c(std::move(b));
        BOOST_TEST_EQ(c.str(), a.str());
        c = mime_type("text/plain");
        BOOST_TEST(c.atom_id() == atom::text_plain);
        c = a;
        BOOST_TEST_EQ(c.str(), "a/b; x=1; y=2; z=3");
    }

    void
    run()
    {
        testAccessors();
        testParam();
        testWithoutParams();
        testAtoms();
        testFormat();
        testCopy();
    }
};

TEST_SUITE(
    mime_type_test,
    "boost.mime.mime_type");

} // mime
} // boost
