//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_URI_BUILDER_HPP
#define BOOST_URIT_URI_BUILDER_HPP

#include <boost/urit/detail/config.hpp>
#include <boost/urit/compiled_pattern.hpp>
#include <boost/optional/optional.hpp>
#include <string>
#include <vector>

namespace boost {
namespace urit {

/** How values are percent-encoded during expansion
*/
enum class encoding
{
    /// Encode every character not allowed in the component
    strict,

    /// Like strict, but leave valid percent-escapes alone
    contextual
};

/** Templates for the components of a URI.

    Each member is an independent template which may
    contain placeholders. An absent member contributes
    nothing to the URI. When any of `user_info`, `host`
    or `port` is present, `authority` is ignored.
*/
struct component_templates
{
    optional<std::string> scheme;
    optional<std::string> authority;
    optional<std::string> user_info;
    optional<std::string> host;
    optional<std::string> port;
    optional<std::string> path;
    optional<std::string> query;
    optional<std::string> fragment;
};

/** Build a URI from component templates.

    Every placeholder in every component is replaced
    by its value from the map, percent-encoded for the
    component it appears in. Scheme and port values
    are inserted as-is. Query values are encoded as
    query parameters.

    The URI is assembled as
    @code
    [ scheme ":" ] [ "//" [ user_info "@" ] host [ ":" port ] ] path [ "?" query ] [ "#" fragment ]
    @endcode
    with `"//" authority` used in place of the
    user_info, host and port when none of those
    is present.

    @par Example
    @code
    component_templates parts;
    parts.scheme = "http";
    parts.host = "{host}";
    parts.path = "/files/{name}";
    std::string s = expand_uri( parts,
        binding_map{ { "host", "example.com" }, { "name", "a b" } },
        encoding::strict );
    // s == "http://example.com/files/a%20b"
    @endcode

    @throws missing_value_error A placeholder has no
    value in the map.

    @throws system::system_error A component template
    is malformed.
*/
BOOST_URIT_DECL
std::string
expand_uri(
    component_templates const& parts,
    binding_map const& values,
    encoding enc);

/** Build a URI from component templates.

    Values are consumed in order across all components.
    The first occurrence of each distinct placeholder
    takes the next value, and later occurrences of the
    same name, in any component, repeat the encoded
    value it was given.

    @throws missing_value_error The values run out
    before every placeholder has one.

    @throws system::system_error A component template
    is malformed.
*/
BOOST_URIT_DECL
std::string
expand_uri(
    component_templates const& parts,
    std::vector<std::string> const& values,
    encoding enc);

} // urit
} // boost

#endif
