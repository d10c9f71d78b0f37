//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_COMPILED_PATTERN_HPP
#define BOOST_URIT_COMPILED_PATTERN_HPP

#include <boost/urit/detail/config.hpp>
#include <boost/urit/template_options.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional/optional.hpp>
#include <boost/system/result.hpp>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace re2 {
class RE2;
} // re2

namespace boost {
namespace urit {

/** Placeholder names mapped to their matched values
*/
using binding_map =
    std::unordered_map<std::string, std::string>;

/** Matched values in capturing group order

    An element is empty when its group did not
    participate in the match.
*/
using group_values =
    std::vector<optional<std::string>>;

/** Placeholder names in capturing group order

    An element is empty when its group does not
    bind a placeholder.
*/
using group_names =
    std::vector<optional<std::string>>;

class compiled_pattern;

/** Compile a pattern

    @return The pattern, or an error equivalent to
    @ref condition::bad_template if the source does
    not compile or there are more names than groups.
*/
BOOST_URIT_DECL
system::result<compiled_pattern>
compile_pattern(
    core::string_view source,
    group_names names = {},
    template_options const& opts = {});

#ifdef BOOST_MSVC
#pragma warning(push)
#pragma warning(disable: 4251) // shared_ptr needs dll-interface
#endif

/** A compiled regular expression with named groups.

    The pattern owns the generated source text and
    the mapping from each capturing group to the
    placeholder it binds. Copies share one compiled
    program, which is never modified after
    construction, so a pattern may be matched from
    any number of threads at once.

    Equality and hashing depend only on the source.

    @see @ref compile_pattern.
*/
class BOOST_URIT_DECL
    compiled_pattern
{
    std::string source_;
    group_names names_;
    std::shared_ptr<re2::RE2 const> re_;

    friend BOOST_URIT_DECL
    system::result<compiled_pattern>
    compile_pattern(
        core::string_view,
        group_names,
        template_options const&);

public:
    /** Constructor

        Default-constructed patterns have an empty
        source and match only the empty string.
    */
    compiled_pattern() noexcept;

    /** Constructor

        @param source The pattern source.

        @param names The placeholder bound by each
        capturing group. Groups without an entry
        bind nothing.

        @param opts The compile options.

        @throws system::system_error The source does not
        compile, or there are more names than groups.
    */
    explicit
    compiled_pattern(
        core::string_view source,
        group_names names = {},
        template_options const& opts = {});

    /// Return the pattern source
    core::string_view
    source() const noexcept
    {
        return source_;
    }

    /// Return the placeholder bound by each group
    group_names const&
    names() const noexcept
    {
        return names_;
    }

    /// Return the number of capturing groups
    std::size_t
    group_count() const noexcept
    {
        return names_.size();
    }

    /** Match an entire string, extracting bindings.

        The map is cleared first. On success it holds
        each placeholder name mapped to the text its
        group captured. When several groups bind the
        same name, the last participating group wins.

        @return true if the whole string matches.
    */
    bool
    match(
        core::string_view s,
        binding_map& out) const;

    /** Match an entire string, extracting group values.

        The vector is cleared first. On success it holds
        one element per capturing group, in group order.

        @return true if the whole string matches.
    */
    bool
    match(
        core::string_view s,
        group_values& out) const;

    /// Return the pattern source as a string
    std::string
    to_string() const
    {
        return source_;
    }

    friend
    bool
    operator==(
        compiled_pattern const& a,
        compiled_pattern const& b) noexcept
    {
        return a.source_ == b.source_;
    }

    friend
    bool
    operator!=(
        compiled_pattern const& a,
        compiled_pattern const& b) noexcept
    {
        return !(a == b);
    }
};

#ifdef BOOST_MSVC
#pragma warning(pop)
#endif

/// Return a hash of the pattern source
BOOST_URIT_DECL
std::size_t
hash_value(
    compiled_pattern const& p) noexcept;

/// Write the pattern source to a stream
BOOST_URIT_DECL
std::ostream&
operator<<(
    std::ostream& os,
    compiled_pattern const& p);

} // urit
} // boost

namespace std {

template<>
struct hash<::boost::urit::compiled_pattern>
{
    std::size_t
    operator()(
        ::boost::urit::compiled_pattern const& p) const noexcept
    {
        return ::boost::urit::hash_value(p);
    }
};

} // std

#endif
