//
// Copyright (c) 2026 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_DETAIL_EXCEPT_HPP
#define BOOST_URIT_DETAIL_EXCEPT_HPP

#include <boost/urit/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace urit {
namespace detail {

BOOST_NORETURN
BOOST_URIT_DECL
void
throw_invalid_argument(
    source_location const& loc =
        BOOST_CURRENT_LOCATION);

BOOST_NORETURN
BOOST_URIT_DECL
void
throw_out_of_range(
    source_location const& loc =
        BOOST_CURRENT_LOCATION);

BOOST_NORETURN
BOOST_URIT_DECL
void
throw_system_error(
    system::error_code const& ec,
    source_location const& loc =
        BOOST_CURRENT_LOCATION);

BOOST_NORETURN
BOOST_URIT_DECL
void
throw_missing_value(
    core::string_view name,
    source_location const& loc =
        BOOST_CURRENT_LOCATION);

} // detail
} // urit
} // boost

#endif
