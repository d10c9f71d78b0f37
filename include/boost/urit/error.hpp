//
// Copyright (c) 2026 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_ERROR_HPP
#define BOOST_URIT_ERROR_HPP

#include <boost/urit/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <string>

namespace boost {
namespace urit {

/** Error codes returned by the library
*/
enum class error
{
    /// The template string is empty
    empty_template = 1,

    /// A placeholder is missing its closing brace
    unclosed_placeholder,

    /// A placeholder name does not follow the identifier grammar
    invalid_name,

    /// An explicit placeholder constraint is empty or does not compile
    bad_constraint,

    /// The generated pattern source does not compile
    bad_pattern,

    /// A placeholder has no value during component-aware generation
    missing_value,

    /// A percent-escape is malformed
    bad_escape,

    /// An equal template was already registered
    duplicate_template
};

//------------------------------------------------

/** Error conditions corresponding to sets of error codes.
*/
enum class condition
{
    /** The template could not be parsed or compiled

        Every error produced while turning a template
        string into a @ref uri_template is equivalent
        to this condition.
    */
    bad_template
};

//------------------------------------------------

/** Exception thrown when a placeholder has no value

    Component-aware generation (see @ref expand_uri)
    requires a value for every placeholder. When one
    is missing, this exception is thrown with the
    code @ref error::missing_value and the name of
    the placeholder.
*/
class BOOST_URIT_SYMBOL_VISIBLE
    missing_value_error
    : public system::system_error
{
    std::string name_;

public:
    /** Constructor

        @param name The placeholder without a value.
    */
    BOOST_URIT_DECL
    explicit
    missing_value_error(
        core::string_view name);

    /** Return the name of the placeholder without a value
    */
    core::string_view
    name() const noexcept
    {
        return name_;
    }
};

} // urit
} // boost

#include <boost/urit/impl/error.hpp>

#endif
