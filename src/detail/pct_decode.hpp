//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_PATHMATCH_SRC_DETAIL_PCT_DECODE_HPP
#define BOOST_PATHMATCH_SRC_DETAIL_PCT_DECODE_HPP

#include <boost/pathmatch/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>

namespace boost {
namespace pathmatch {
namespace detail {

// true if s is well-formed UTF-8 with no
// overlong forms, surrogates, or code points
// above U+10FFFF
BOOST_PATHMATCH_DECL
bool
is_valid_utf8(
    core::string_view s) noexcept;

// decode one path segment, failing with
// error::bad_pct_escape or error::bad_utf8
BOOST_PATHMATCH_DECL
system::result<std::string>
decode_segment(
    core::string_view s);

} // detail
} // pathmatch
} // boost

#endif
