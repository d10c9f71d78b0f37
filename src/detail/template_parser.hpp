//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_SRC_DETAIL_TEMPLATE_PARSER_HPP
#define BOOST_URIT_SRC_DETAIL_TEMPLATE_PARSER_HPP

#include <boost/urit/detail/config.hpp>
#include <boost/urit/template_options.hpp>
#include <boost/assert.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional/optional.hpp>
#include <boost/system/result.hpp>
#include <algorithm>
#include <string>
#include <vector>

namespace boost {
namespace urit {
namespace detail {

// default constraint for a placeholder
constexpr char const default_constraint[] = "[^/]+";

struct parsed_template
{
    std::string normalized;
    std::string source;

    // one entry per capturing group
    std::vector<optional<std::string>> groups;

    // first occurrence order, no duplicates
    std::vector<std::string> names;

    // placeholders including repeats
    std::size_t occurrences = 0;
    std::size_t explicit_constraints = 0;
    std::size_t literal_chars = 0;
};

// Parse a non-empty template and build its pattern source
system::result<parsed_template>
parse_template(
    core::string_view s,
    template_options const& opts);

// Strip explicit constraints, keeping "{name}"
system::result<std::string>
normalize_template(
    core::string_view s);

// Append literal text with regex metacharacters escaped
void
append_escaped(
    std::string& dest,
    core::string_view s);

// Walk a normalized template, copying literal text
// to dest and calling f(name, dest) for each placeholder.
template<class F>
void
substitute(
    core::string_view normalized,
    std::string& dest,
    F&& f)
{
    auto it = normalized.data();
    auto const end = it + normalized.size();
    while(it != end)
    {
        auto const p = std::find(it, end, '{');
        dest.append(it, p);
        if(p == end)
            break;
        auto const q = std::find(p + 1, end, '}');
        BOOST_ASSERT(q != end);
        f(core::string_view(p + 1, q - p - 1), dest);
        it = q + 1;
    }
}

} // detail
} // urit
} // boost

#endif
