//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#include <boost/urit/uri_template.hpp>
#include <boost/urit/detail/except.hpp>
#include <boost/urit/error.hpp>
#include "src/detail/template_parser.hpp"
#include <algorithm>
#include <ostream>
#include <unordered_map>

namespace boost {
namespace urit {

uri_template::
uri_template() noexcept = default;

uri_template::
uri_template(
    core::string_view s,
    template_options const& opts)
{
    if(s.empty())
        detail::throw_invalid_argument();
    auto rv = parse_uri_template(s, opts);
    if(rv.has_error())
        detail::throw_system_error(rv.error());
    *this = std::move(*rv);
}

uri_template const&
uri_template::
empty() noexcept
{
    static uri_template const t;
    return t;
}

bool
uri_template::
is_placeholder_present(
    core::string_view name) const noexcept
{
    return std::find_if(
        names_.begin(),
        names_.end(),
        [name](std::string const& s)
        {
            return name == core::string_view(s);
        }) != names_.end();
}

std::string
uri_template::
generate(
    binding_map const& values) const
{
    std::string result;
    result.reserve(normalized_.size());
    detail::substitute(normalized_, result,
        [&values](
            core::string_view name,
            std::string& dest)
        {
            auto it = values.find(std::string(
                name.data(), name.size()));
            if(it != values.end())
                dest.append(it->second);
        });
    return result;
}

std::string
uri_template::
generate(
    std::vector<std::string> const& values) const
{
    return generate(values, 0, values.size());
}

std::string
uri_template::
generate(
    std::vector<std::string> const& values,
    std::size_t offset,
    std::size_t length) const
{
    if( offset > values.size() ||
        length > values.size() - offset)
        detail::throw_out_of_range();

    // name -> value given to its first occurrence
    std::unordered_map<
        std::string, std::string const*> assigned;
    auto next = values.begin() + offset;
    auto const last = next + length;
    std::string result;
    result.reserve(normalized_.size());
    detail::substitute(normalized_, result,
        [&](core::string_view name,
            std::string& dest)
        {
            std::string key(
                name.data(), name.size());
            auto it = assigned.find(key);
            if(it != assigned.end())
            {
                dest.append(*it->second);
                return;
            }
            if(next == last)
                return;
            auto const& v = *next++;
            assigned.emplace(std::move(key), &v);
            dest.append(v);
        });
    return result;
}

//------------------------------------------------

system::result<uri_template>
parse_uri_template(
    core::string_view s,
    template_options const& opts)
{
    auto rv = detail::parse_template(s, opts);
    if(rv.has_error())
        return rv.error();
    auto& pt = *rv;
    auto cp = compile_pattern(
        pt.source, std::move(pt.groups), opts);
    if(cp.has_error())
        return cp.error();

    uri_template t;
    t.raw_.assign(s.data(), s.size());
    t.normalized_ = std::move(pt.normalized);
    t.pattern_ = std::move(*cp);
    t.names_ = std::move(pt.names);
    t.occurrences_ = pt.occurrences;
    t.explicit_constraints_ = pt.explicit_constraints;
    t.literal_chars_ = pt.literal_chars;
    t.ends_with_slash_ = s.back() == '/';
    return t;
}

std::ostream&
operator<<(
    std::ostream& os,
    uri_template const& t)
{
    return os << t.pattern();
}

} // urit
} // boost
