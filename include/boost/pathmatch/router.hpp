//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_PATHMATCH_ROUTER_HPP
#define BOOST_PATHMATCH_ROUTER_HPP

#include <boost/pathmatch/detail/config.hpp>
#include <boost/pathmatch/config.hpp>
#include <boost/pathmatch/error.hpp>
#include <boost/pathmatch/params.hpp>
#include <boost/pathmatch/validator.hpp>
#include <boost/pathmatch/detail/router_base.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <deque>
#include <utility>

namespace boost {
namespace pathmatch {

/** The result of a successful match.

    Refers to the payload stored in the router,
    which must outlive this object and must not
    be modified by further calls to `add`.
*/
template<class T>
class match_results
{
    match_params params_;
    T const* v_;

public:
    match_results(
        match_params params,
        T const& v) noexcept
        : params_(std::move(params))
        , v_(&v)
    {
    }

    /// Return the variables bound by the match.
    match_params const&
    params() const noexcept
    {
        return params_;
    }

    /// Return the payload registered with the pattern.
    T const&
    payload() const noexcept
    {
        return *v_;
    }
};

//-----------------------------------------------

/** A set of path patterns mapped to payloads.

    Patterns are sequences of segments separated by
    `'/'`. One leading and one trailing slash are
    ignored. Each segment is one of:

    @li `:name` matches exactly one segment and
        binds it to `name`,

    @li `:*name` matches one or more segments and
        binds them, in order, to `name`,

    @li anything else matches the identical segment,
        byte for byte.

    When several patterns match a path, literal
    segments take precedence over variables and
    variables over wildcards, deciding segment by
    segment from the left. Adjacent wildcards each
    take one segment and the rightmost takes the
    rest. Patterns that reach the same place are
    tried in the order they were added, and the
    first whose validators accept the captured
    values wins.

    If the path contains a `'%'`, each segment is
    percent-decoded after the path is split, so
    `"%2F"` yields a `'/'` inside one segment.

    @par Example
    @code
    router<std::string> r;
    r.add( "user/:id", "show-user",
        {{ "id", []( core::string_view s )
            {
                return ! s.empty() && s.find_first_not_of(
                    "0123456789" ) == core::string_view::npos;
            } }} );
    r.add( "static/:*path", "static" );

    auto rv = r.match( "/user/42" );
    assert( rv.has_value() );
    assert( rv->payload() == "show-user" );
    assert( std::get<std::string>( rv->params().at( "id" ) ) == "42" );
    @endcode

    @par Thread Safety

    Patterns must all be added before matching
    starts. After that, @ref match may be called
    concurrently from any number of threads.

    @tparam T The payload type.
*/
template<class T>
class router : public detail::router_base
{
    // stable references on push_back
    std::deque<T> values_;

public:
    /// The payload type
    using value_type = T;

    router(router const&) = delete;
    router& operator=(router const&) = delete;

    router(router&&) = default;
    router& operator=(router&&) = default;

    /** Constructor.

        @param options The configuration options to use.
    */
    explicit
    router(
        router_options options = {})
        : router_base(std::move(options))
    {
    }

    /** Add a pattern.

        @par Exception Safety
        Strong guarantee.

        @param pattern The pattern to add.

        @param value The payload returned when
        the pattern matches.

        @param validators Predicates for some or
        all of the variables in the pattern.
        Variables without one use the router's
        default validator.

        @throws system::system_error the pattern
        is malformed. The code is equivalent to
        @ref condition::pattern_error.
    */
    void
    add(
        core::string_view pattern,
        T value,
        validator_map const& validators = {})
    {
        values_.push_back(std::move(value));
        try
        {
            add_impl(pattern,
                values_.size() - 1, validators);
        }
        catch(...)
        {
            values_.pop_back();
            throw;
        }
    }

    /** Find the pattern matching a path.

        @return The bound variables and the payload,
        or an error equivalent to
        @ref condition::not_found if no pattern
        matches or the path is too deep, or
        @ref condition::decode_error if a segment
        holds a bad percent-escape or invalid UTF-8.

        @param path The path to match.
    */
    system::result<match_results<T>>
    match(core::string_view path) const
    {
        auto rv = match_impl(path);
        if(rv.has_error())
            return rv.error();
        return match_results<T>(
            std::move(rv->params),
            values_[rv->index]);
    }
};

} // pathmatch
} // boost

#endif
