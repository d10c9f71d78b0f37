//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#include <boost/urit/compiled_pattern.hpp>
#include <boost/urit/error.hpp>
#include <re2/re2.h>
#include <functional>
#include <ostream>
#include <string_view>

namespace boost {
namespace urit {

namespace {

// Each call owns its submatch storage; the
// program itself is shared and const.
bool
full_match(
    re2::RE2 const& re,
    core::string_view s,
    std::vector<re2::StringPiece>& sub)
{
    sub.resize(1 + static_cast<std::size_t>(
        re.NumberOfCapturingGroups()));
    return re.Match(
        re2::StringPiece(s.data(), s.size()),
        0,
        s.size(),
        re2::RE2::ANCHOR_BOTH,
        sub.data(),
        static_cast<int>(sub.size()));
}

} // (anon)

compiled_pattern::
compiled_pattern() noexcept = default;

compiled_pattern::
compiled_pattern(
    core::string_view source,
    group_names names,
    template_options const& opts)
    : compiled_pattern(compile_pattern(
        source, std::move(names), opts).value())
{
}

bool
compiled_pattern::
match(
    core::string_view s,
    binding_map& out) const
{
    out.clear();
    if(! re_)
        return s.empty();
    std::vector<re2::StringPiece> sub;
    if(! full_match(*re_, s, sub))
        return false;
    for(std::size_t i = 0; i < names_.size(); ++i)
    {
        auto const& g = sub[i + 1];
        if( ! names_[i] ||
            g.data() == nullptr)
            continue;
        out.insert_or_assign(
            *names_[i],
            std::string(g.data(), g.size()));
    }
    return true;
}

bool
compiled_pattern::
match(
    core::string_view s,
    group_values& out) const
{
    out.clear();
    if(! re_)
        return s.empty();
    std::vector<re2::StringPiece> sub;
    if(! full_match(*re_, s, sub))
        return false;
    out.reserve(sub.size() - 1);
    for(std::size_t i = 1; i < sub.size(); ++i)
    {
        if(sub[i].data() == nullptr)
            out.emplace_back();
        else
            out.emplace_back(std::string(
                sub[i].data(), sub[i].size()));
    }
    return true;
}

//------------------------------------------------

system::result<compiled_pattern>
compile_pattern(
    core::string_view source,
    group_names names,
    template_options const& opts)
{
    re2::RE2::Options ro;
    ro.set_log_errors(false);
    // match bytes, not UTF-8 code points
    ro.set_encoding(
        re2::RE2::Options::EncodingLatin1);
    ro.set_max_mem(opts.max_program_memory);
    auto re = std::make_shared<re2::RE2 const>(
        re2::StringPiece(
            source.data(),
            source.size()),
        ro);
    if(! re->ok())
        BOOST_URIT_RETURN_EC(
            error::bad_pattern);
    auto const n = static_cast<std::size_t>(
        re->NumberOfCapturingGroups());
    if(names.size() > n)
        BOOST_URIT_RETURN_EC(
            error::bad_pattern);
    names.resize(n);

    compiled_pattern cp;
    cp.source_.assign(
        source.data(), source.size());
    cp.names_ = std::move(names);
    cp.re_ = std::move(re);
    return cp;
}

std::size_t
hash_value(
    compiled_pattern const& p) noexcept
{
    return std::hash<std::string_view>()(
        std::string_view(
            p.source().data(),
            p.source().size()));
}

std::ostream&
operator<<(
    std::ostream& os,
    compiled_pattern const& p)
{
    os.write(
        p.source().data(),
        static_cast<std::streamsize>(
            p.source().size()));
    return os;
}

} // urit
} // boost
