//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

// Test that header file is self-contained.
#include <boost/urit/component.hpp>

#include <boost/urit/error.hpp>
#include <boost/core/lightweight_test.hpp>

namespace boost {
namespace urit {

struct component_test
{
    void
    testEncode()
    {
        BOOST_TEST_EQ(encode("a b/c", component::path_segment),
            "a%20b%2Fc");
        BOOST_TEST_EQ(encode("a b/c", component::path),
            "a%20b/c");
        BOOST_TEST_EQ(encode("a&b=c d+e", component::query_param),
            "a%26b%3Dc+d%2Be");
        BOOST_TEST_EQ(encode("a&b=c d", component::query),
            "a&b=c%20d");
        BOOST_TEST_EQ(encode("x/y?z#", component::fragment),
            "x/y?z%23");
        BOOST_TEST_EQ(encode("u:p@h", component::user_info),
            "u:p%40h");
        BOOST_TEST_EQ(encode("u:p@h", component::authority),
            "u:p@h");
        BOOST_TEST_EQ(encode("a:b", component::host),
            "a%3Ab");
        BOOST_TEST_EQ(encode("[::1]", component::host),
            "[::1]");
        BOOST_TEST_EQ(encode("[v1.fe80::a+en1]", component::host),
            "[v1.fe80::a+en1]");
        BOOST_TEST_EQ(encode("[fe80::1%eth0]", component::host),
            "[fe80::1%25eth0]");
        BOOST_TEST_EQ(encode("80a", component::port),
            "80%61");
        BOOST_TEST_EQ(encode("svn+ssh_", component::scheme),
            "svn+ssh%5F");

        // existing escapes are encoded again
        BOOST_TEST_EQ(encode("%20", component::path),
            "%2520");
        BOOST_TEST_EQ(encode("", component::path), "");
    }

    void
    testContextualEncode()
    {
        BOOST_TEST_EQ(contextual_encode("a%20b c", component::path),
            "a%20b%20c");
        BOOST_TEST_EQ(contextual_encode("%2f", component::path_segment),
            "%2f");

        // a percent sign which does not begin an escape
        BOOST_TEST_EQ(contextual_encode("100%", component::path),
            "100%25");
        BOOST_TEST_EQ(contextual_encode("%zz", component::path),
            "%25zz");
        BOOST_TEST_EQ(contextual_encode("%2", component::path),
            "%252");
        BOOST_TEST_EQ(contextual_encode("a%26b c", component::query_param),
            "a%26b+c");
    }

    void
    testIsValid()
    {
        BOOST_TEST(is_valid("a%20b/c", component::path));
        BOOST_TEST(! is_valid("a%20b/c", component::path_segment));
        BOOST_TEST(! is_valid("a b", component::path));
        BOOST_TEST(! is_valid("100%", component::path));
        BOOST_TEST(is_valid("8080", component::port));
        BOOST_TEST(! is_valid("80a", component::port));
        BOOST_TEST(is_valid("a=b&c", component::query));
        BOOST_TEST(! is_valid("a=b", component::query_param));
        BOOST_TEST(is_valid("", component::host));
        BOOST_TEST(is_valid("[::1]", component::host));
        BOOST_TEST(! is_valid("::1", component::host));
        BOOST_TEST_EQ(contextual_encode("[fe80::1%25eth0]",
            component::host), "[fe80::1%25eth0]");
    }

    void
    testDecode()
    {
        {
            auto rv = decode("a%20b%2Fc");
            if(BOOST_TEST(rv.has_value()))
                BOOST_TEST_EQ(*rv, "a b/c");
        }
        {
            // plus is not a space here
            auto rv = decode("a+b%2b");
            if(BOOST_TEST(rv.has_value()))
                BOOST_TEST_EQ(*rv, "a+b+");
        }
        {
            auto rv = decode(encode(
                "x y/%z", component::path_segment));
            if(BOOST_TEST(rv.has_value()))
                BOOST_TEST_EQ(*rv, "x y/%z");
        }
        {
            auto rv = decode("100%");
            if(BOOST_TEST(rv.has_error()))
                BOOST_TEST(rv.error() == error::bad_escape);
        }
        {
            auto rv = decode("%g0");
            if(BOOST_TEST(rv.has_error()))
                BOOST_TEST(rv.error() == error::bad_escape);
        }
    }

    void
    run()
    {
        testEncode();
        testContextualEncode();
        testIsValid();
        testDecode();
    }
};

} // urit
} // boost

int
main()
{
    boost::urit::component_test().run();
    return boost::report_errors();
}
