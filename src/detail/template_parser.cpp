//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#include "src/detail/template_parser.hpp"
#include "src/detail/template_rule.hpp"
#include <boost/urit/error.hpp>
#include <re2/re2.h>

namespace boost {
namespace urit {
namespace detail {

namespace {

// number of capturing groups in an explicit
// constraint, or an error if it does not compile
system::result<std::size_t>
constraint_groups(
    core::string_view constraint,
    template_options const& opts)
{
    re2::RE2::Options ro;
    ro.set_log_errors(false);
    // match bytes, not UTF-8 code points
    ro.set_encoding(
        re2::RE2::Options::EncodingLatin1);
    ro.set_max_mem(opts.max_program_memory);
    re2::RE2 re(
        re2::StringPiece(
            constraint.data(),
            constraint.size()),
        ro);
    if(! re.ok())
        BOOST_URIT_RETURN_EC(
            error::bad_constraint);
    return static_cast<std::size_t>(
        re.NumberOfCapturingGroups());
}

} // (anon)

void
append_escaped(
    std::string& dest,
    core::string_view s)
{
    for(char c : s)
    {
        switch(c)
        {
        case '\\':
        case '.':
        case '^':
        case '$':
        case '|':
        case '?':
        case '*':
        case '+':
        case '(':
        case ')':
        case '[':
        case ']':
        case '{':
        case '}':
            dest.push_back('\\');
            break;
        default:
            break;
        }
        dest.push_back(c);
    }
}

system::result<parsed_template>
parse_template(
    core::string_view s,
    template_options const& opts)
{
    if(s.empty())
        BOOST_URIT_RETURN_EC(
            error::empty_template);
    auto rv = grammar::parse(s, template_rule);
    if(rv.has_error())
        return rv.error();

    parsed_template pt;
    if(! opts.case_sensitive)
        pt.source = "(?i)";
    for(auto const& part : *rv)
    {
        if(! part.is_placeholder())
        {
            pt.normalized.append(
                part.literal.data(),
                part.literal.size());
            append_escaped(pt.source, part.literal);
            pt.literal_chars += part.literal.size();
            continue;
        }

        auto const& ph = part.ph;
        std::string name(
            ph.name.data(), ph.name.size());
        pt.normalized.push_back('{');
        pt.normalized.append(name);
        pt.normalized.push_back('}');
        if(std::find(
            pt.names.begin(),
            pt.names.end(),
            name) == pt.names.end())
            pt.names.push_back(name);

        ++pt.occurrences;
        pt.source.push_back('(');
        if(ph.constraint.empty())
        {
            pt.source.append(default_constraint);
            pt.groups.emplace_back(std::move(name));
        }
        else
        {
            auto n = constraint_groups(
                ph.constraint, opts);
            if(n.has_error())
                return n.error();
            // wrapped so an explicit constraint never
            // produces the same source as the default
            pt.source.append("(?:");
            pt.source.append(
                ph.constraint.data(),
                ph.constraint.size());
            pt.source.push_back(')');
            pt.groups.emplace_back(std::move(name));
            // groups nested in the constraint bind nothing
            pt.groups.resize(pt.groups.size() + *n);
            ++pt.explicit_constraints;
        }
        pt.source.push_back(')');
    }
    return pt;
}

system::result<std::string>
normalize_template(
    core::string_view s)
{
    auto rv = grammar::parse(s, template_rule);
    if(rv.has_error())
        return rv.error();
    std::string result;
    result.reserve(s.size());
    for(auto const& part : *rv)
    {
        if(! part.is_placeholder())
        {
            result.append(
                part.literal.data(),
                part.literal.size());
            continue;
        }
        result.push_back('{');
        result.append(
            part.ph.name.data(),
            part.ph.name.size());
        result.push_back('}');
    }
    return result;
}

} // detail
} // urit
} // boost
