//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/urit
//

#ifndef BOOST_URIT_ROUTE_TABLE_HPP
#define BOOST_URIT_ROUTE_TABLE_HPP

#include <boost/urit/detail/config.hpp>
#include <boost/urit/detail/except.hpp>
#include <boost/urit/error.hpp>
#include <boost/urit/specificity.hpp>
#include <boost/urit/template_options.hpp>
#include <boost/urit/uri_template.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional/optional.hpp>
#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace boost {
namespace urit {

template<class Handler>
class route_table;

/** The result of a successful route lookup
*/
template<class Handler>
struct route_match
{
    /// The template which matched
    uri_template const* route;

    /// The handler registered with the template
    Handler const* handler;

    /// The placeholder values extracted from the path
    binding_map params;
};

//------------------------------------------------

/** A mutable collection of routes.

    Routes are added in any order. Once complete, the
    builder is moved into a @ref route_table, which
    cannot be modified.

    @tparam Handler The value associated with each
    route. It must be move constructible.
*/
template<class Handler>
class route_table_builder
{
public:
    /// A template and its handler
    struct entry
    {
        uri_template route;
        Handler handler;
    };

    /// Constructor
    route_table_builder() = default;

    /** Constructor

        @param opts The options used to compile
        every template added to the builder.
    */
    explicit
    route_table_builder(
        template_options const& opts)
        : opts_(opts)
    {
    }

    /** Add a route

        @param pattern The template string.

        @param h The handler for the route.

        @throws std::invalid_argument `pattern` is empty.

        @throws system::system_error The template is
        malformed, or an equal template was already
        added (@ref error::duplicate_template).
    */
    route_table_builder&
    add(
        core::string_view pattern,
        Handler h)
    {
        uri_template t(pattern, opts_);
        auto it = std::find_if(
            entries_.begin(), entries_.end(),
            [&t](entry const& e)
            {
                return e.route == t;
            });
        if(it != entries_.end())
            detail::throw_system_error(
                make_error_code(
                    error::duplicate_template));
        entries_.push_back(entry{
            std::move(t), std::move(h) });
        return *this;
    }

    /// Return the number of routes
    std::size_t
    size() const noexcept
    {
        return entries_.size();
    }

    /** Freeze the routes into a table

        The builder is left empty.
    */
    route_table<Handler>
    finalize() &&
    {
        return route_table<Handler>(
            std::move(*this));
    }

private:
    friend class route_table<Handler>;

    std::vector<entry> entries_;
    template_options opts_;
};

//------------------------------------------------

/** An immutable table of routes.

    The routes are held most specific first, as
    ordered by @ref more_specific. A lookup returns
    the first route whose template matches the whole
    path. The table has no mutating operations and
    may be searched from any number of threads.

    @par Example
    @code
    route_table_builder<int> b;
    b.add( "/users/{id}", 1 );
    b.add( "/users/me", 2 );
    route_table<int> t( std::move(b) );

    auto rv = t.find( "/users/me" );
    // *rv->handler == 2
    @endcode
*/
template<class Handler>
class route_table
{
public:
    using entry =
        typename route_table_builder<Handler>::entry;

    using const_iterator =
        typename std::vector<entry>::const_iterator;

    /** Constructor

        @param b The builder whose routes are taken.
        It is left empty.
    */
    explicit
    route_table(
        route_table_builder<Handler>&& b)
        : entries_(std::move(b.entries_))
    {
        b.entries_.clear();
        std::sort(
            entries_.begin(), entries_.end(),
            [](entry const& x, entry const& y)
            {
                return more_specific{}(
                    x.route, y.route);
            });
    }

    /** Find the most specific route matching a path

        @return The match, or an empty optional if no
        route matches.
    */
    optional<route_match<Handler>>
    find(core::string_view path) const
    {
        binding_map params;
        for(auto const& e : entries_)
        {
            if(! e.route.match(path, params))
                continue;
            return route_match<Handler>{
                &e.route, &e.handler, std::move(params) };
        }
        return none;
    }

    /// Return the number of routes
    std::size_t
    size() const noexcept
    {
        return entries_.size();
    }

    /// Return true if there are no routes
    bool
    empty() const noexcept
    {
        return entries_.empty();
    }

    /// Return an iterator to the most specific route
    const_iterator
    begin() const noexcept
    {
        return entries_.begin();
    }

    /// Return an iterator past the least specific route
    const_iterator
    end() const noexcept
    {
        return entries_.end();
    }

private:
    std::vector<entry> entries_;
};

} // urit
} // boost

#endif
