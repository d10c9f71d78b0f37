//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#include <boost/urit/uri_builder.hpp>
#include <boost/urit/component.hpp>
#include <boost/urit/detail/except.hpp>
#include "src/detail/template_parser.hpp"
#include <unordered_map>

namespace boost {
namespace urit {

namespace {

std::string
encode_value(
    core::string_view v,
    component kind,
    encoding enc)
{
    if(enc == encoding::strict)
        return encode(v, kind);
    return contextual_encode(v, kind);
}

class map_source
{
    binding_map const& values_;
    encoding enc_;

public:
    map_source(
        binding_map const& values,
        encoding enc) noexcept
        : values_(values)
        , enc_(enc)
    {
    }

    void
    operator()(
        core::string_view name,
        component kind,
        bool escape,
        std::string& dest) const
    {
        auto it = values_.find(std::string(
            name.data(), name.size()));
        if(it == values_.end())
            detail::throw_missing_value(name);
        if(escape)
            dest.append(encode_value(
                it->second, kind, enc_));
        else
            dest.append(it->second);
    }
};

// one cursor and one set of assignments
// shared by every component
class positional_source
{
    std::vector<std::string> const& values_;
    std::size_t next_ = 0;
    std::unordered_map<
        std::string, std::string> assigned_;
    encoding enc_;

public:
    positional_source(
        std::vector<std::string> const& values,
        encoding enc) noexcept
        : values_(values)
        , enc_(enc)
    {
    }

    void
    operator()(
        core::string_view name,
        component kind,
        bool escape,
        std::string& dest)
    {
        std::string key(
            name.data(), name.size());
        auto it = assigned_.find(key);
        if(it != assigned_.end())
        {
            dest.append(it->second);
            return;
        }
        if(next_ == values_.size())
            detail::throw_missing_value(name);
        auto const& v = values_[next_++];
        std::string s = escape ?
            encode_value(v, kind, enc_) : v;
        dest.append(s);
        assigned_.emplace(
            std::move(key), std::move(s));
    }
};

template<class Source>
void
append_component(
    std::string& dest,
    core::string_view tmpl,
    component kind,
    bool escape,
    Source& src)
{
    if(tmpl.find('{') == core::string_view::npos)
    {
        dest.append(tmpl.data(), tmpl.size());
        return;
    }
    auto rv = detail::normalize_template(tmpl);
    if(rv.has_error())
        detail::throw_system_error(rv.error());
    detail::substitute(*rv, dest,
        [&](core::string_view name,
            std::string& out)
        {
            src(name, kind, escape, out);
        });
}

bool
has_content(
    optional<std::string> const& s) noexcept
{
    return s && ! s->empty();
}

template<class Source>
std::string
build(
    component_templates const& parts,
    Source& src)
{
    std::string s;
    if(parts.scheme)
    {
        append_component(s, *parts.scheme,
            component::scheme, false, src);
        s.push_back(':');
    }

    if( parts.user_info ||
        parts.host ||
        parts.port)
    {
        s.append("//");
        if(has_content(parts.user_info))
        {
            append_component(s, *parts.user_info,
                component::user_info, true, src);
            s.push_back('@');
        }
        if(parts.host)
            append_component(s, *parts.host,
                component::host, true, src);
        if(has_content(parts.port))
        {
            s.push_back(':');
            append_component(s, *parts.port,
                component::port, false, src);
        }
    }
    else if(parts.authority)
    {
        s.append("//");
        append_component(s, *parts.authority,
            component::authority, true, src);
    }

    if(parts.path)
        append_component(s, *parts.path,
            component::path, true, src);

    if(has_content(parts.query))
    {
        s.push_back('?');
        append_component(s, *parts.query,
            component::query_param, true, src);
    }

    if(has_content(parts.fragment))
    {
        s.push_back('#');
        append_component(s, *parts.fragment,
            component::fragment, true, src);
    }
    return s;
}

} // (anon)

std::string
expand_uri(
    component_templates const& parts,
    binding_map const& values,
    encoding enc)
{
    map_source src(values, enc);
    return build(parts, src);
}

std::string
expand_uri(
    component_templates const& parts,
    std::vector<std::string> const& values,
    encoding enc)
{
    positional_source src(values, enc);
    return build(parts, src);
}

} // urit
} // boost
