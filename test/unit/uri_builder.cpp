//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

// Test that header file is self-contained.
#include <boost/urit/uri_builder.hpp>

#include <boost/urit/error.hpp>
#include <boost/core/lightweight_test.hpp>

namespace boost {
namespace urit {

struct uri_builder_test
{
    static
    component_templates
    full_parts()
    {
        component_templates parts;
        parts.scheme = "http";
        parts.host = "{host}";
        parts.port = "{port}";
        parts.path = "/files/{name}";
        parts.query = "q={q}";
        parts.fragment = "{frag}";
        return parts;
    }

    void
    testExpandMap()
    {
        binding_map v{
            { "host", "example.com" },
            { "port", "8080" },
            { "name", "a b" },
            { "q", "x&y z" },
            { "frag", "sec 1" } };
        BOOST_TEST_EQ(
            expand_uri(full_parts(), v, encoding::strict),
            "http://example.com:8080/files/a%20b?q=x%26y+z#sec%201");

        // existing escapes survive contextual encoding
        v["name"] = "a%20b c";
        BOOST_TEST_EQ(
            expand_uri(full_parts(), v, encoding::contextual),
            "http://example.com:8080/files/a%20b%20c?q=x%26y+z#sec%201");
        BOOST_TEST_EQ(
            expand_uri(full_parts(), v, encoding::strict),
            "http://example.com:8080/files/a%2520b%20c?q=x%26y+z#sec%201");
    }

    void
    testUnencodedParts()
    {
        component_templates parts;
        parts.scheme = "{s}";
        parts.host = "h";
        parts.port = "{p}";
        parts.path = "/{s}";
        binding_map v{ { "s", "a b" }, { "p", "8 0" } };

        // scheme and port values are inserted as-is
        BOOST_TEST_EQ(
            expand_uri(parts, v, encoding::strict),
            "a b://h:8 0/a%20b");

        parts.path = "/{x}";
        std::vector<std::string> pv{ "a b", "8 0", "c d" };
        BOOST_TEST_EQ(
            expand_uri(parts, pv, encoding::strict),
            "a b://h:8 0/c%20d");
    }

    void
    testIpLiteralHost()
    {
        component_templates parts;
        parts.scheme = "http";
        parts.host = "{h}";
        parts.port = "8080";
        parts.path = "/";
        BOOST_TEST_EQ(expand_uri(parts,
            binding_map{ { "h", "[::1]" } }, encoding::strict),
            "http://[::1]:8080/");
        BOOST_TEST_EQ(expand_uri(parts,
            binding_map{ { "h", "a:b" } }, encoding::strict),
            "http://a%3Ab:8080/");
    }

    void
    testAssembly()
    {
        binding_map const no_values;
        {
            component_templates parts;
            parts.path = "/a/b";
            BOOST_TEST_EQ(expand_uri(parts, no_values,
                encoding::strict), "/a/b");
        }
        {
            component_templates parts;
            parts.scheme = "mailto";
            parts.path = "joe@example.com";
            BOOST_TEST_EQ(expand_uri(parts, no_values,
                encoding::strict), "mailto:joe@example.com");
        }
        {
            // authority is used when no finer part is present
            component_templates parts;
            parts.scheme = "https";
            parts.authority = "u@h:1";
            parts.path = "/";
            BOOST_TEST_EQ(expand_uri(parts, no_values,
                encoding::strict), "https://u@h:1/");

            parts.host = "h2";
            BOOST_TEST_EQ(expand_uri(parts, no_values,
                encoding::strict), "https://h2/");
        }
        {
            component_templates parts;
            parts.user_info = "{user}";
            parts.host = "h";
            binding_map v{ { "user", "a@b" } };
            BOOST_TEST_EQ(expand_uri(parts, v,
                encoding::strict), "//a%40b@h");
        }
        {
            // empty query and fragment add no delimiter
            component_templates parts;
            parts.path = "/p";
            parts.query = "";
            parts.fragment = "";
            BOOST_TEST_EQ(expand_uri(parts, no_values,
                encoding::strict), "/p");
        }
        {
            component_templates parts;
            BOOST_TEST_EQ(expand_uri(parts, no_values,
                encoding::strict), "");
        }
    }

    void
    testMissingValue()
    {
        component_templates parts;
        parts.path = "/users/{id}";
        try
        {
            expand_uri(parts, binding_map{},
                encoding::strict);
            BOOST_ERROR("missing_value_error not thrown");
        }
        catch(missing_value_error const& e)
        {
            BOOST_TEST_EQ(e.name(), "id");
            BOOST_TEST(e.code() == error::missing_value);
        }

        BOOST_TEST_THROWS(
            expand_uri(parts, std::vector<std::string>{},
                encoding::strict),
            missing_value_error);

        // a malformed component template
        parts.path = "/users/{id";
        BOOST_TEST_THROWS(
            expand_uri(parts, binding_map{ { "id", "1" } },
                encoding::strict),
            system::system_error);
    }

    void
    testExpandPositional()
    {
        {
            component_templates parts;
            parts.path = "/{a}/{b}/{a}";
            parts.query = "x={b}";
            std::vector<std::string> v{ "1 1", "2" };
            BOOST_TEST_EQ(
                expand_uri(parts, v, encoding::strict),
                "/1%201/2/1%201?x=2");
        }
        {
            // the encoded value is reused across components
            component_templates parts;
            parts.path = "/{a}";
            parts.query = "v={a}";
            std::vector<std::string> v{ "p q" };
            BOOST_TEST_EQ(
                expand_uri(parts, v, encoding::strict),
                "/p%20q?v=p%20q");
        }
        {
            // values are consumed across components in order
            component_templates parts;
            parts.host = "{h}";
            parts.path = "/{p}";
            std::vector<std::string> v{ "example.com", "x", "extra" };
            BOOST_TEST_EQ(
                expand_uri(parts, v, encoding::strict),
                "//example.com/x");
        }
    }

    void
    run()
    {
        testExpandMap();
        testUnencodedParts();
        testIpLiteralHost();
        testAssembly();
        testMissingValue();
        testExpandPositional();
    }
};

} // urit
} // boost

int
main()
{
    boost::urit::uri_builder_test().run();
    return boost::report_errors();
}
