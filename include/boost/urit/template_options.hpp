//
// Copyright (c) 2026 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_TEMPLATE_OPTIONS_HPP
#define BOOST_URIT_TEMPLATE_OPTIONS_HPP

#include <boost/urit/detail/config.hpp>
#include <cstdint>

namespace boost {
namespace urit {

/** Settings used when compiling a template.

    @see @ref uri_template,
         @ref compile_pattern.
*/
struct template_options
{
    /** Match letter case exactly.

        When false, the generated pattern source is
        prefixed with the inline flag `(?i)`. The flag
        is part of the source, so a case-insensitive
        template never compares equal to the otherwise
        identical case-sensitive one.
    */
    bool case_sensitive = true;

    /** Memory budget for one compiled program, in bytes.

        Templates whose pattern exceeds the budget fail
        to compile with @ref error::bad_pattern.
    */
    std::int64_t max_program_memory = 8 << 20;
};

} // urit
} // boost

#endif
