//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_PATHMATCH_SRC_DETAIL_PATH_HPP
#define BOOST_PATHMATCH_SRC_DETAIL_PATH_HPP

#include <boost/pathmatch/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <vector>

namespace boost {
namespace pathmatch {
namespace detail {

// remove one leading and one trailing slash
BOOST_PATHMATCH_DECL
core::string_view
normalize_path(
    core::string_view s) noexcept;

// split a normalized path on '/', failing with
// error::path_too_deep as soon as the depth
// (segment count minus one) exceeds max_depth
BOOST_PATHMATCH_DECL
system::result<std::vector<core::string_view>>
split_path(
    core::string_view s,
    std::size_t max_depth);

} // detail
} // pathmatch
} // boost

#endif
