//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_PATHMATCH_SRC_DETAIL_ROUTER_BASE_HPP
#define BOOST_PATHMATCH_SRC_DETAIL_ROUTER_BASE_HPP

#include <boost/pathmatch/detail/router_base.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace spdlog {
class logger;
} // spdlog

namespace boost {
namespace pathmatch {
namespace detail {

// A pattern that ends at a node.
struct router_base::route_entry
{
    // variable names in declaration order
    std::vector<std::string> names;

    // parallel to names, empty means the default
    std::vector<validator> checks;

    // index of the payload in the typed router
    std::size_t index = 0;

    // pattern contains a wildcard
    bool wild = false;
};

// A node in the segment graph. The three kinds of
// edge are kept apart, so a literal segment such as
// ":x" can never be confused with a variable edge.
struct router_base::node
{
    std::map<std::string,
        std::unique_ptr<node>,
        std::less<>> literals;
    std::unique_ptr<node> var;
    std::unique_ptr<node> wild;

    // tried in registration order
    std::vector<route_entry> routes;
};

struct router_base::impl
{
    node root;
    validator default_validator;
    std::shared_ptr<spdlog::logger> log;
    std::size_t depth_limit;
    std::size_t max_depth = 0;
    std::size_t size = 0;

    impl(
        validator v,
        std::shared_ptr<spdlog::logger> log_,
        std::size_t depth_limit_);

    // true if every captured value passes
    bool validate(
        route_entry const& re,
        match_params const& p) const;
};

} // detail
} // pathmatch
} // boost

#endif
