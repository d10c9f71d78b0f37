//
// Copyright (c) 2026 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#include <boost/urit/error.hpp>

namespace boost {
namespace urit {

namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "boost.urit";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::empty_template: return "empty template";
    case error::unclosed_placeholder: return "unclosed placeholder";
    case error::invalid_name: return "invalid placeholder name";
    case error::bad_constraint: return "bad placeholder constraint";
    case error::bad_pattern: return "bad pattern";
    case error::missing_value: return "missing placeholder value";
    case error::bad_escape: return "bad percent-escape";
    case error::duplicate_template: return "duplicate template";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "boost.urit.condition";
}

std::string
condition_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(ev))
    {
    case condition::bad_template: return "bad template";
    default:
        return "unknown";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int c) const noexcept
{
    if(ec.category() != error_cat)
        return false;
    switch(static_cast<condition>(c))
    {
    case condition::bad_template:
        switch(static_cast<error>(ec.value()))
        {
        case error::empty_template:
        case error::unclosed_placeholder:
        case error::invalid_name:
        case error::bad_constraint:
        case error::bad_pattern:
            return true;
        default:
            return false;
        }
    default:
        return false;
    }
}

//-----------------------------------------------

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

} // detail

//-----------------------------------------------

missing_value_error::
missing_value_error(
    core::string_view name)
    : system::system_error(
        make_error_code(error::missing_value),
        "no value for placeholder \"" +
            std::string(name.data(), name.size()) + "\"")
    , name_(name.data(), name.size())
{
}

} // urit
} // boost
