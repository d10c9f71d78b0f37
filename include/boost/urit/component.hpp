//
// Copyright (c) 2026 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_COMPONENT_HPP
#define BOOST_URIT_COMPONENT_HPP

#include <boost/urit/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>

namespace boost {
namespace urit {

/** The kind of URI component a value is placed in.

    Each kind determines the set of characters which
    may appear unencoded, following RFC 3986.
*/
enum class component
{
    /// ALPHA DIGIT "+" "-" "."
    scheme,

    /// unreserved sub-delims ":" "@" "[" "]"
    authority,

    /// unreserved sub-delims ":"
    user_info,

    /** unreserved sub-delims "[" "]"

        A value enclosed in "[" and "]" is an IP
        literal, and may also contain ":".
    */
    host,

    /// DIGIT
    port,

    /// pchar "/"
    path,

    /// pchar
    path_segment,

    /// pchar "/" "?"
    query,

    /** A query parameter name or value

        Same as @ref component::query without the
        characters "&", "=" and "+". A space is
        written as "+".
    */
    query_param,

    /// pchar "/" "?"
    fragment
};

/** Percent-encode a string for use in a component.

    Every character not allowed unencoded in the
    component is replaced by its percent-escape,
    using upper case hexadecimal digits. This
    includes any `%` already present.

    @par Example
    @code
    std::string s = encode( "a b/c", component::path_segment );
    // s == "a%20b%2Fc"
    @endcode

    @param s The string to encode.

    @param kind The component the result is placed in.

    @return The encoded string.
*/
BOOST_URIT_DECL
std::string
encode(
    core::string_view s,
    component kind);

/** Percent-encode a string, preserving existing escapes.

    Works like @ref encode, except that a `%` which
    begins a valid percent-escape (`%` followed by two
    hexadecimal digits) is copied through unchanged,
    so already-encoded input is not encoded twice.

    @par Example
    @code
    std::string s = contextual_encode( "a%20b c", component::path );
    // s == "a%20b%20c"
    @endcode
*/
BOOST_URIT_DECL
std::string
contextual_encode(
    core::string_view s,
    component kind);

/** Return true if a string is valid in a component.

    The string is valid when every character is
    allowed unencoded in the component or is part
    of a valid percent-escape.
*/
BOOST_URIT_DECL
bool
is_valid(
    core::string_view s,
    component kind) noexcept;

/** Decode all percent-escapes in a string.

    @return The decoded string, or @ref error::bad_escape
    if a `%` is not followed by two hexadecimal digits.
*/
BOOST_URIT_DECL
system::result<std::string>
decode(core::string_view s);

} // urit
} // boost

#endif
