//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_SPECIFICITY_HPP
#define BOOST_URIT_SPECIFICITY_HPP

#include <boost/urit/detail/config.hpp>
#include <boost/urit/uri_template.hpp>

namespace boost {
namespace urit {

/** Compare two templates by specificity.

    When several templates match the same URI, the
    most specific one is preferred. Templates are
    ordered by these keys, in priority:

    @li more explicit constraints first,
    @li more literal characters first,
    @li fewer placeholders first, counting repeats,
    @li pattern source, lexicographically.

    The last key makes this a strict total order in
    which two templates compare equal exactly when
    they are equal.

    @return A negative value if `a` is more specific
    than `b`, zero if they are equal, and a positive
    value otherwise.
*/
BOOST_URIT_DECL
int
compare_specificity(
    uri_template const& a,
    uri_template const& b) noexcept;

/** Function object ordering templates most specific first

    @par Example
    @code
    std::vector<uri_template> v = ...;
    std::sort( v.begin(), v.end(), more_specific{} );
    @endcode
*/
struct more_specific
{
    bool
    operator()(
        uri_template const& a,
        uri_template const& b) const noexcept
    {
        return compare_specificity(a, b) < 0;
    }
};

} // urit
} // boost

#endif
