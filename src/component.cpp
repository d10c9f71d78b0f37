//
// Copyright (c) 2026 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#include <boost/urit/component.hpp>
#include <boost/urit/error.hpp>
#include <boost/url/encode.hpp>
#include <boost/url/encoding_opts.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/rfc/pchars.hpp>
#include <boost/url/rfc/sub_delim_chars.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>

namespace boost {
namespace urit {

namespace {

constexpr grammar::lut_chars scheme_chars =
    urls::unreserved_chars - '_' - '~' + '+';

constexpr grammar::lut_chars user_info_chars =
    urls::unreserved_chars + urls::sub_delim_chars + ':';

constexpr grammar::lut_chars authority_chars =
    user_info_chars + '@' + '[' + ']';

constexpr grammar::lut_chars host_chars =
    urls::unreserved_chars + urls::sub_delim_chars + '[' + ']';

// IPv6 or IPvFuture address in brackets
constexpr grammar::lut_chars ip_literal_chars =
    host_chars + ':';

constexpr grammar::lut_chars port_chars =
    grammar::lut_chars("0123456789");

constexpr grammar::lut_chars path_chars =
    urls::pchars + '/';

constexpr grammar::lut_chars query_chars =
    urls::pchars + '/' + '?';

constexpr grammar::lut_chars query_param_chars =
    query_chars - '&' - '=' - '+';

grammar::lut_chars const&
allowed_chars(component kind) noexcept
{
    switch(kind)
    {
    case component::scheme: return scheme_chars;
    case component::authority: return authority_chars;
    case component::user_info: return user_info_chars;
    case component::host: return host_chars;
    case component::port: return port_chars;
    case component::path: return path_chars;
    case component::path_segment: return urls::pchars;
    case component::query_param: return query_param_chars;
    case component::query:
    case component::fragment:
    default:
        return query_chars;
    }
}

bool
is_ip_literal(core::string_view s) noexcept
{
    return
        s.size() >= 2 &&
        s.front() == '[' &&
        s.back() == ']';
}

grammar::lut_chars const&
allowed_chars(
    component kind,
    core::string_view s) noexcept
{
    if( kind == component::host &&
        is_ip_literal(s))
        return ip_literal_chars;
    return allowed_chars(kind);
}

urls::encoding_opts
encoding_for(component kind) noexcept
{
    urls::encoding_opts opt;
    opt.space_as_plus =
        kind == component::query_param;
    return opt;
}

// true if a valid escape begins at it
bool
is_escape(
    char const* it,
    char const* end) noexcept
{
    return
        end - it >= 3 &&
        it[0] == '%' &&
        grammar::hexdig_value(it[1]) >= 0 &&
        grammar::hexdig_value(it[2]) >= 0;
}

} // (anon)

std::string
encode(
    core::string_view s,
    component kind)
{
    return urls::encode(
        s,
        allowed_chars(kind, s),
        encoding_for(kind));
}

std::string
contextual_encode(
    core::string_view s,
    component kind)
{
    auto const& cs = allowed_chars(kind, s);
    auto const opt = encoding_for(kind);
    std::string result;
    result.reserve(s.size());
    auto it = s.data();
    auto const end = it + s.size();
    auto it0 = it;
    while(it != end)
    {
        if(! is_escape(it, end))
        {
            ++it;
            continue;
        }
        result.append(urls::encode(
            core::string_view(it0, it - it0), cs, opt));
        result.append(it, 3);
        it += 3;
        it0 = it;
    }
    result.append(urls::encode(
        core::string_view(it0, it - it0), cs, opt));
    return result;
}

bool
is_valid(
    core::string_view s,
    component kind) noexcept
{
    auto const& cs = allowed_chars(kind, s);
    auto it = s.data();
    auto const end = it + s.size();
    while(it != end)
    {
        if(is_escape(it, end))
        {
            it += 3;
            continue;
        }
        if(! cs(*it))
            return false;
        ++it;
    }
    return true;
}

system::result<std::string>
decode(core::string_view s)
{
    std::string result;
    result.reserve(s.size());
    auto it = s.data();
    auto const end = it + s.size();
    while(it != end)
    {
        if(*it != '%')
        {
            result.push_back(*it++);
            continue;
        }
        if(! is_escape(it, end))
            BOOST_URIT_RETURN_EC(
                error::bad_escape);
        auto d0 = grammar::hexdig_value(it[1]);
        auto d1 = grammar::hexdig_value(it[2]);
        result.push_back(static_cast<char>(
            d0 * 16 + d1));
        it += 3;
    }
    return result;
}

} // urit
} // boost
