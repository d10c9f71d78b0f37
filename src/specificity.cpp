//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#include <boost/urit/specificity.hpp>

namespace boost {
namespace urit {

int
compare_specificity(
    uri_template const& a,
    uri_template const& b) noexcept
{
    // descending
    if(a.explicit_constraint_count() != b.explicit_constraint_count())
        return a.explicit_constraint_count() >
            b.explicit_constraint_count() ? -1 : 1;

    // descending
    if(a.literal_character_count() != b.literal_character_count())
        return a.literal_character_count() >
            b.literal_character_count() ? -1 : 1;

    // ascending; repeats are counted so that equal
    // sources always produce equal keys
    if( a.placeholder_occurrence_count() !=
        b.placeholder_occurrence_count())
        return a.placeholder_occurrence_count() <
            b.placeholder_occurrence_count() ? -1 : 1;

    int const c = a.pattern().source().compare(
        b.pattern().source());
    if(c < 0)
        return -1;
    return c > 0 ? 1 : 0;
}

} // urit
} // boost
