//
// Copyright (c) 2026 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_HPP
#define BOOST_URIT_HPP

#include <boost/urit/compiled_pattern.hpp>
#include <boost/urit/component.hpp>
#include <boost/urit/error.hpp>
#include <boost/urit/route_table.hpp>
#include <boost/urit/specificity.hpp>
#include <boost/urit/template_options.hpp>
#include <boost/urit/uri_builder.hpp>
#include <boost/urit/uri_template.hpp>

#endif
