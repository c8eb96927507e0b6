//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_PATHMATCH_DETAIL_ROUTER_BASE_HPP
#define BOOST_PATHMATCH_DETAIL_ROUTER_BASE_HPP

#include <boost/pathmatch/detail/config.hpp>
#include <boost/pathmatch/config.hpp>
#include <boost/pathmatch/params.hpp>
#include <boost/pathmatch/validator.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstddef>

namespace boost {
namespace pathmatch {

namespace detail {

// implementation for all routers
class BOOST_PATHMATCH_DECL
    router_base
{
    struct impl;
    impl* impl_;

protected:
    struct node;
    struct route_entry;

    // a match before the payload is looked up
    struct resolved
    {
        match_params params;
        std::size_t index;
    };

    ~router_base();
    explicit router_base(router_options);
    router_base(router_base&&) noexcept;
    router_base& operator=(router_base&&) noexcept;

    // throws system::system_error on a bad pattern,
    // leaving the router unchanged
    void add_impl(
        core::string_view pattern,
        std::size_t index,
        validator_map const& validators);

    system::result<resolved>
    match_impl(core::string_view path) const;

public:
    /** Return the deepest path the router will search.

        Paths whose depth (segment count minus one)
        exceeds this value fail without a search.
        The value only grows as patterns are added.
    */
    std::size_t max_depth() const noexcept;

    /** Return the number of registered patterns.
    */
    std::size_t size() const noexcept;
};

} // detail
} // pathmatch
} // boost

#endif
