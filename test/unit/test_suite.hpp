//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_TEST_SUITE_HPP
#define BOOST_MIME_TEST_SUITE_HPP

#include <boost/core/lightweight_test.hpp>
#include <cstring>

namespace test_suite {

// A registered suite. Instances are linked
// together during static initialization.
struct any_runner
{
    char const* name;
    any_runner* next;

    explicit
    any_runner(char const* name_) noexcept
        : name(name_)
        , next(head())
    {
        head() = this;
    }

    virtual ~any_runner() = default;

    virtual void run() = 0;

    static
    any_runner*&
    head() noexcept
    {
        static any_runner* p = nullptr;
        return p;
    }
};

template<class T>
struct runner : any_runner
{
    explicit
    runner(char const* name_) noexcept
        : any_runner(name_)
    {
    }

    void
    run() override
    {
        T().run();
    }
};

// Run every suite whose name starts with
// prefix, or all of them if prefix is null.
inline
int
run(char const* prefix)
{
    for(auto r = any_runner::head(); r; r = r->next)
    {
        if( prefix && std::strncmp(
                r->name, prefix,
                std::strlen(prefix)) != 0)
            continue;
        r->run();
    }
    return ::boost::report_errors();
}

} // test_suite

#define TEST_SUITE(type, name) \
    static ::test_suite::runner<type> type##_runner_(name)

#endif
