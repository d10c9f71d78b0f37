//
// Copyright (c) 2026 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_IMPL_ERROR_HPP
#define BOOST_URIT_IMPL_ERROR_HPP

#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <boost/system/is_error_condition_enum.hpp>
#include <system_error>

namespace boost {

namespace system {

template<>
struct is_error_code_enum<
    ::boost::urit::error>
{
    static bool const value = true;
};

template<>
struct is_error_condition_enum<
    ::boost::urit::condition>
{
    static bool const value = true;
};

} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::boost::urit::error>
    : std::true_type {};

template<>
struct is_error_condition_enum<
    ::boost::urit::condition>
    : std::true_type {};
} // std

namespace boost {

//-----------------------------------------------

namespace urit {

namespace detail {

struct BOOST_URIT_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    BOOST_URIT_DECL const char* name(
        ) const noexcept override;
    BOOST_URIT_DECL std::string message(
        int) const override;
    BOOST_URIT_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x5e1f0c7a93d24b61)
    {
    }
};

struct BOOST_URIT_SYMBOL_VISIBLE
    condition_cat_type
    : system::error_category
{
    BOOST_URIT_DECL const char* name(
        ) const noexcept override;
    BOOST_URIT_DECL std::string message(
        int) const override;
    BOOST_URIT_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_URIT_DECL bool equivalent(
        system::error_code const&, int
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR condition_cat_type()
        : error_category(0xc2b8e40d16f7a359)
    {
    }
};

BOOST_URIT_DECL extern
    error_cat_type error_cat;
BOOST_URIT_DECL extern
    condition_cat_type condition_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

inline
BOOST_SYSTEM_CONSTEXPR
system::error_condition
make_error_condition(
    condition c) noexcept
{
    return system::error_condition{
        static_cast<std::underlying_type<
            condition>::type>(c),
        detail::condition_cat};
}

} // urit
} // boost

#endif
