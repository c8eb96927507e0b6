//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_PATHMATCH_CONFIG_HPP
#define BOOST_PATHMATCH_CONFIG_HPP

#include <boost/pathmatch/detail/config.hpp>
#include <boost/pathmatch/validator.hpp>

#include <cstddef>
#include <memory>

namespace spdlog {
class logger;
} // spdlog

namespace boost {
namespace pathmatch {

namespace detail {
class router_base;
} // detail

/** Configuration options for routers.

    @par Example
    @code
    router<int> r( router_options()
        .depth_limit( 8 )
        .default_validator( &is_default_value ) );
    @endcode
*/
struct router_options
{
    /** Constructor.

        The defaults are a depth limit of
        @ref default_depth_limit, @ref is_default_value
        as the default validator, and the spdlog
        default logger.
    */
    router_options() = default;

    /// The depth limit used when none is set.
    static constexpr std::size_t default_depth_limit = 40;

    /** Set the depth ceiling for wildcard patterns.

        A wildcard can absorb any number of segments,
        so once a wildcard pattern is registered the
        router accepts paths up to this depth (segment
        count minus one), or deeper only when a
        pattern without wildcards is deeper still.
        Wildcard patterns themselves never match a
        path deeper than this limit.

        @param n The depth limit.

        @return A reference to `*this` for chaining.
    */
    router_options&
    depth_limit(
        std::size_t n) noexcept
    {
        depth_limit_ = n;
        return *this;
    }

    /** Set the validator used for variables without one.

        An empty function restores @ref is_default_value.

        @param v The predicate.

        @return A reference to `*this` for chaining.
    */
    router_options&
    default_validator(
        validator v)
    {
        default_validator_ = std::move(v);
        return *this;
    }

    /** Set the logger receiving diagnostics.

        A null pointer selects `spdlog::default_logger()`
        at the time the router is constructed.

        @param log The logger.

        @return A reference to `*this` for chaining.
    */
    router_options&
    logger(
        std::shared_ptr<spdlog::logger> log) noexcept
    {
        log_ = std::move(log);
        return *this;
    }

private:
    friend class detail::router_base;

    std::size_t depth_limit_ = default_depth_limit;
    validator default_validator_;
    std::shared_ptr<spdlog::logger> log_;
};

} // pathmatch
} // boost

#endif
