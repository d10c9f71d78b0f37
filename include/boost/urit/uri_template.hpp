//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_URI_TEMPLATE_HPP
#define BOOST_URIT_URI_TEMPLATE_HPP

#include <boost/urit/detail/config.hpp>
#include <boost/urit/compiled_pattern.hpp>
#include <boost/urit/template_options.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace boost {
namespace urit {

class uri_template;

/** Parse a URI template

    @return The template, or an error equivalent to
    @ref condition::bad_template. An empty string
    yields @ref error::empty_template.
*/
BOOST_URIT_DECL
system::result<uri_template>
parse_uri_template(
    core::string_view s,
    template_options const& opts = {});

/** A compiled URI template.

    A template is literal text interleaved with
    placeholders of the form `{name}` or
    `{name:constraint}`. A placeholder without a
    constraint matches one or more characters other
    than `/`; the constraint, when present, is a
    regular expression which replaces that default.

    Templates are immutable values. Two templates are
    equal when their generated pattern sources are
    identical, regardless of how the raw strings were
    spelled.

    @par Example
    @code
    uri_template t( "/users/{id:[0-9]+}/posts/{slug}" );

    binding_map m;
    if( t.match( "/users/42/posts/hello", m ) )
    {
        // m["id"] == "42", m["slug"] == "hello"
    }

    std::string s = t.generate( m );
    // s == "/users/42/posts/hello"
    @endcode

    @see @ref parse_uri_template,
         @ref compare_specificity.
*/
class BOOST_URIT_DECL
    uri_template
{
    std::string raw_;
    std::string normalized_;
    compiled_pattern pattern_;
    std::vector<std::string> names_;
    std::size_t occurrences_ = 0;
    std::size_t explicit_constraints_ = 0;
    std::size_t literal_chars_ = 0;
    bool ends_with_slash_ = false;

    friend BOOST_URIT_DECL
    system::result<uri_template>
    parse_uri_template(
        core::string_view,
        template_options const&);

public:
    /** Constructor

        Constructs the empty template.

        @see @ref empty.
    */
    uri_template() noexcept;

    /** Constructor

        @param s The template string.

        @param opts The compile options.

        @throws std::invalid_argument `s` is empty.

        @throws system::system_error The template is
        malformed or its pattern does not compile. The
        code is equivalent to @ref condition::bad_template.
    */
    explicit
    uri_template(
        core::string_view s,
        template_options const& opts = {});

    /** Return the empty template

        The empty template has no placeholders and
        matches only the empty string.
    */
    static
    uri_template const&
    empty() noexcept;

    /// Return the template string
    core::string_view
    raw() const noexcept
    {
        return raw_;
    }

    /// Return the template with constraints removed
    core::string_view
    normalized() const noexcept
    {
        return normalized_;
    }

    /// Return the compiled pattern
    compiled_pattern const&
    pattern() const noexcept
    {
        return pattern_;
    }

    /// Return the placeholder names in order of first occurrence
    std::vector<std::string> const&
    placeholders() const noexcept
    {
        return names_;
    }

    /// Return the number of distinct placeholders
    std::size_t
    placeholder_count() const noexcept
    {
        return names_.size();
    }

    /** Return the number of placeholders, counting repeats

        For `"/{a}/{b}/{a}"` this returns 3, while
        @ref placeholder_count returns 2.
    */
    std::size_t
    placeholder_occurrence_count() const noexcept
    {
        return occurrences_;
    }

    /// Return true if a placeholder with the given name exists
    bool
    is_placeholder_present(
        core::string_view name) const noexcept;

    /// Return the number of placeholders with a constraint
    std::size_t
    explicit_constraint_count() const noexcept
    {
        return explicit_constraints_;
    }

    /** Return the number of literal characters

        This counts the template characters which are
        not part of a placeholder.
    */
    std::size_t
    literal_character_count() const noexcept
    {
        return literal_chars_;
    }

    /// Return true if the template ends in '/'
    bool
    ends_with_slash() const noexcept
    {
        return ends_with_slash_;
    }

    /** Match a URI against the template.

        @param uri The string to match in full.

        @param out Cleared, then filled with the value
        of each placeholder on success.

        @return true if the URI matches.
    */
    bool
    match(
        core::string_view uri,
        binding_map& out) const
    {
        return pattern_.match(uri, out);
    }

    /** Match a URI against the template.

        @param uri The string to match in full.

        @param out Cleared, then filled with the value
        of each capturing group on success.

        @return true if the URI matches.
    */
    bool
    match(
        core::string_view uri,
        group_values& out) const
    {
        return pattern_.match(uri, out);
    }

    /** Create a URI by substituting placeholder values.

        Each placeholder is replaced by its value in the
        map. A placeholder without a value is replaced
        by the empty string. Values are not encoded.
    */
    std::string
    generate(
        binding_map const& values) const;

    /** Create a URI by substituting values in order.

        The first occurrence of each distinct placeholder
        consumes the next value. Later occurrences of the
        same name reuse the value it was given. Once the
        values run out, placeholders are replaced by the
        empty string.
    */
    std::string
    generate(
        std::vector<std::string> const& values) const;

    /** Create a URI by substituting values in order.

        Works like the overload above, using only the
        `length` values starting at `offset`.

        @throws std::out_of_range `offset + length`
        exceeds `values.size()`.
    */
    std::string
    generate(
        std::vector<std::string> const& values,
        std::size_t offset,
        std::size_t length) const;

    /// Return the pattern source
    std::string
    to_string() const
    {
        return pattern_.to_string();
    }

    friend
    bool
    operator==(
        uri_template const& a,
        uri_template const& b) noexcept
    {
        return a.pattern_ == b.pattern_;
    }

    friend
    bool
    operator!=(
        uri_template const& a,
        uri_template const& b) noexcept
    {
        return !(a == b);
    }
};

/// Return a hash of the pattern source
inline
std::size_t
hash_value(
    uri_template const& t) noexcept
{
    return hash_value(t.pattern());
}

/// Write the pattern source to a stream
BOOST_URIT_DECL
std::ostream&
operator<<(
    std::ostream& os,
    uri_template const& t);

} // urit
} // boost

namespace std {

template<>
struct hash<::boost::urit::uri_template>
{
    std::size_t
    operator()(
        ::boost::urit::uri_template const& t) const noexcept
    {
        return ::boost::urit::hash_value(t);
    }
};

} // std

#endif
