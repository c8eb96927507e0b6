//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_PATHMATCH_SRC_DETAIL_BIND_HPP
#define BOOST_PATHMATCH_SRC_DETAIL_BIND_HPP

#include <boost/pathmatch/detail/config.hpp>
#include <boost/pathmatch/params.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace boost {
namespace pathmatch {
namespace detail {

enum class capture_kind : unsigned char
{
    // single variable
    var,

    // wildcard, the group continues
    wild_more,

    // wildcard, last segment of the group
    wild_last
};

// One link of a capture chain. Links are never
// modified once added, so frames on the search
// stack share the tails of their chains.
struct capture
{
    core::string_view seg;
    std::size_t prev;
    capture_kind kind;
};

constexpr std::size_t no_capture = std::size_t(-1);

using capture_arena = std::vector<capture>;

// values of the chain ending at head, oldest first
BOOST_PATHMATCH_DECL
std::vector<param_value>
unwrap_captures(
    capture_arena const& arena,
    std::size_t head);

// zip declared names with the values of the chain
BOOST_PATHMATCH_DECL
match_params
bind_params(
    std::vector<std::string> const& names,
    capture_arena const& arena,
    std::size_t head);

} // detail
} // pathmatch
} // boost

#endif
