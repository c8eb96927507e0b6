//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include "src/detail/path.hpp"
#include <boost/pathmatch/error.hpp>

/*

input       normalized  segments
-------------------------------------
/a/b/       a/b         a, b
a/b         a/b         a, b
//a//       /a/         "", a, ""
/           (empty)     ""

*/

namespace boost {
namespace pathmatch {
namespace detail {

core::string_view
normalize_path(
    core::string_view s) noexcept
{
    if(s.starts_with('/'))
        s.remove_prefix(1);
    if(s.ends_with('/'))
        s.remove_suffix(1);
    return s;
}

system::result<std::vector<core::string_view>>
split_path(
    core::string_view s,
    std::size_t max_depth)
{
    std::vector<core::string_view> v;
    for(;;)
    {
        auto const pos = s.find('/');
        if(pos == core::string_view::npos)
        {
            v.push_back(s);
            break;
        }
        // one more segment follows this one
        if(v.size() >= max_depth)
            BOOST_PATHMATCH_RETURN_EC(
                error::path_too_deep);
        v.push_back(s.substr(0, pos));
        s.remove_prefix(pos + 1);
    }
    return v;
}

} // detail
} // pathmatch
} // boost
