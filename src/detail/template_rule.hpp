//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_SRC_DETAIL_TEMPLATE_RULE_HPP
#define BOOST_URIT_SRC_DETAIL_TEMPLATE_RULE_HPP

#include <boost/urit/detail/config.hpp>
#include <boost/urit/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/error.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/system/result.hpp>
#include <vector>

namespace boost {
namespace urit {
namespace detail {

/*
template     = *( literal / placeholder )
literal      = 1*( %x00-7A / %x7C-FF )     ; anything but "{"
placeholder  = "{" *WSP name *WSP [ ":" *WSP constraint *WSP ] "}"
name         = word-char *( word-char / "-" / "." )
word-char    = ALPHA / DIGIT / "_"
constraint   = 1*( balanced text, "{" and "}" nest, "\" quotes the next char )
*/

//------------------------------------------------

struct word_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return
            (ch >= 'a' && ch <= 'z') ||
            (ch >= '0' && ch <= '9') ||
            (ch >= 'A' && ch <= 'Z') ||
            (ch == '_');
    }
};

struct name_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return
            word_char{}(ch) ||
            ch == '-' ||
            ch == '.';
    }
};

struct ws_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return ch == ' ' || ch == '\t';
    }
};

struct literal_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return ch != '{';
    }
};

//------------------------------------------------

constexpr struct
{
    using value_type = core::string_view;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if( it == end ||
            ! word_char{}(*it))
            BOOST_URIT_RETURN_EC(
                error::invalid_name);
        auto it0 = it++;
        it = grammar::find_if_not(
            it, end, name_char{});
        return core::string_view(it0, it - it0);
    }
} placeholder_name_rule{};

// Everything up to the brace which closes the
// placeholder, with surrounding whitespace removed.
constexpr struct
{
    using value_type = core::string_view;

    // true if an odd run of backslashes precedes it
    static
    constexpr
    bool
    is_escaped(
        char const* first,
        char const* it) noexcept
    {
        bool escaped = false;
        while( it != first &&
                it[-1] == '\\')
        {
            escaped = ! escaped;
            --it;
        }
        return escaped;
    }

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        auto const it0 = it;
        std::size_t depth = 0;
        for(;;)
        {
            if(it == end)
                BOOST_URIT_RETURN_EC(
                    error::unclosed_placeholder);
            if(*it == '\\')
            {
                if(++it == end)
                    BOOST_URIT_RETURN_EC(
                        error::unclosed_placeholder);
                ++it;
                continue;
            }
            if(*it == '{')
            {
                ++depth;
            }
            else if(*it == '}')
            {
                if(depth == 0)
                    break;
                --depth;
            }
            ++it;
        }
        auto first = it0;
        auto last = it;
        while( first != last &&
                ws_char{}(*first))
            ++first;
        while( last != first &&
                ws_char{}(last[-1]) &&
                ! is_escaped(first, last - 1))
            --last;
        if(first == last)
            BOOST_URIT_RETURN_EC(
                error::bad_constraint);
        return core::string_view(
            first, last - first);
    }
} constraint_rule{};

//------------------------------------------------

/** A placeholder in a template
*/
struct placeholder
{
    core::string_view name;

    // empty for the default constraint
    core::string_view constraint;
};

constexpr struct
{
    using value_type = placeholder;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end)
            BOOST_URIT_RETURN_EC(
                grammar::error::syntax);
        if(*it != '{')
            BOOST_URIT_RETURN_EC(
                grammar::error::mismatch);
        ++it;
        value_type v;
        it = grammar::find_if_not(
            it, end, ws_char{});
        if(it == end)
            BOOST_URIT_RETURN_EC(
                error::unclosed_placeholder);
        {
            auto rv = grammar::parse(
                it, end, placeholder_name_rule);
            if(rv.has_error())
                return rv.error();
            v.name = rv.value();
        }
        it = grammar::find_if_not(
            it, end, ws_char{});
        if(it == end)
            BOOST_URIT_RETURN_EC(
                error::unclosed_placeholder);
        if(*it == ':')
        {
            ++it;
            auto rv = grammar::parse(
                it, end, constraint_rule);
            if(rv.has_error())
                return rv.error();
            v.constraint = rv.value();
        }
        if(it == end)
            BOOST_URIT_RETURN_EC(
                error::unclosed_placeholder);
        if(*it != '}')
            BOOST_URIT_RETURN_EC(
                error::invalid_name);
        ++it;
        return v;
    }
} placeholder_rule{};

//------------------------------------------------

/** A run of literal text or a single placeholder
*/
struct template_part
{
    // literal text, empty for a placeholder
    core::string_view literal;
    placeholder ph;

    bool
    is_placeholder() const noexcept
    {
        return ! ph.name.empty();
    }
};

struct template_rule_t
{
    using value_type = std::vector<template_part>;

    auto
    parse(
        char const*& it,
        char const* const end) const ->
            system::result<value_type>
    {
        value_type rv;
        while(it != end)
        {
            if(*it == '{')
            {
                auto rv1 = grammar::parse(
                    it, end, placeholder_rule);
                if(rv1.has_error())
                    return rv1.error();
                template_part tp;
                tp.ph = rv1.value();
                rv.push_back(tp);
                continue;
            }
            auto const it0 = it;
            it = grammar::find_if_not(
                it, end, literal_char{});
            template_part tp;
            tp.literal = core::string_view(
                it0, it - it0);
            rv.push_back(tp);
        }
        // gcc 7 bug workaround
        return system::result<value_type>(std::move(rv));
    }
};

constexpr template_rule_t template_rule{};

} // detail
} // urit
} // boost

#endif
