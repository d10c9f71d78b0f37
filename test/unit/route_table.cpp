//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

// Test that header file is self-contained.
#include <boost/urit/route_table.hpp>

#include <boost/core/lightweight_test.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace boost {
namespace urit {

struct route_table_test
{
    void
    testFind()
    {
        route_table_builder<std::string> b;
        b.add("/users/{id}", "user")
         .add("/users/me", "me")
         .add("/users/{id:[0-9]+}", "numeric")
         .add("/files/{path:.+}", "files");
        BOOST_TEST_EQ(b.size(), 4u);

        route_table<std::string> t(std::move(b));
        BOOST_TEST_EQ(b.size(), 0u);
        BOOST_TEST_EQ(t.size(), 4u);
        BOOST_TEST(! t.empty());

        {
            auto rv = t.find("/users/me");
            if(BOOST_TEST(rv))
            {
                BOOST_TEST_EQ(*rv->handler, "me");
                BOOST_TEST(rv->params.empty());
            }
        }
        {
            auto rv = t.find("/users/42");
            if(BOOST_TEST(rv))
            {
                BOOST_TEST_EQ(*rv->handler, "numeric");
                BOOST_TEST_EQ(rv->route->raw(),
                    "/users/{id:[0-9]+}");
                BOOST_TEST_EQ(rv->params.at("id"), "42");
            }
        }
        {
            auto rv = t.find("/users/bob");
            if(BOOST_TEST(rv))
            {
                BOOST_TEST_EQ(*rv->handler, "user");
                BOOST_TEST_EQ(rv->params.at("id"), "bob");
            }
        }
        {
            auto rv = t.find("/files/a/b.txt");
            if(BOOST_TEST(rv))
                BOOST_TEST_EQ(rv->params.at("path"), "a/b.txt");
        }
        BOOST_TEST(! t.find("/users/bob/x"));
        BOOST_TEST(! t.find(""));
    }

    void
    testOrder()
    {
        route_table_builder<int> b;
        b.add("/{x}", 4);
        b.add("/a/{x}", 3);
        b.add("/a/b", 2);
        b.add("/a/{x:[0-9]+}", 1);
        auto t = std::move(b).finalize();

        int expected = 1;
        for(auto const& e : t)
            BOOST_TEST_EQ(e.handler, expected++);
    }

    void
    testDuplicate()
    {
        route_table_builder<int> b;
        b.add("/a/{x}", 1);
        try
        {
            b.add("/a/{y}", 2);
            BOOST_ERROR("duplicate not rejected");
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == error::duplicate_template);
        }
        BOOST_TEST_EQ(b.size(), 1u);

        // a different constraint is a different template
        b.add("/a/{x:[^/]+}", 3);
        BOOST_TEST_EQ(b.size(), 2u);

        BOOST_TEST_THROWS(
            b.add("", 4),
            std::invalid_argument);
        BOOST_TEST_THROWS(
            b.add("/a/{", 4),
            system::system_error);
    }

    void
    testOptions()
    {
        template_options opts;
        opts.case_sensitive = false;
        route_table_builder<int> b(opts);
        b.add("/Users/{id}", 1);
        route_table<int> t(std::move(b));
        auto rv = t.find("/users/7");
        if(BOOST_TEST(rv))
            BOOST_TEST_EQ(*rv->handler, 1);
    }

    void
    testMoveOnlyHandler()
    {
        route_table_builder<std::unique_ptr<int>> b;
        b.add("/p/{x}", std::unique_ptr<int>(new int(5)));
        route_table<std::unique_ptr<int>> t(std::move(b));
        auto rv = t.find("/p/q");
        if(BOOST_TEST(rv))
            BOOST_TEST_EQ(**rv->handler, 5);
    }

    void
    testEmpty()
    {
        route_table<int> t{ route_table_builder<int>() };
        BOOST_TEST(t.empty());
        BOOST_TEST(t.begin() == t.end());
        BOOST_TEST(! t.find("/"));
    }

    void
    run()
    {
        testFind();
        testOrder();
        testDuplicate();
        testOptions();
        testMoveOnlyHandler();
        testEmpty();
    }
};

} // urit
} // boost

int
main()
{
    boost::urit::route_table_test().run();
    return boost::report_errors();
}
