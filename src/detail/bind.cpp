//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include "src/detail/bind.hpp"
#include <boost/assert.hpp>
#include <algorithm>

namespace boost {
namespace pathmatch {
namespace detail {

/*
    The chain is walked newest first. For the
    pattern ":*p1/:*p2/:*p3" and the path "a/b/c/d":

    link    kind        action
    ------------------------------------------
    d       wild_last   open group {d}
    c       wild_more   extend group {d, c}
    b       wild_last   emit (c, d), open {b}
    a       wild_last   emit (b), open {a}
    (end)               emit (a)
*/
std::vector<param_value>
unwrap_captures(
    capture_arena const& arena,
    std::size_t head)
{
    std::vector<param_value> rv;
    segment_list group;
    bool open = false;

    auto const close = [&]
    {
        if(! open)
            return;
        std::reverse(group.begin(), group.end());
        rv.emplace_back(std::move(group));
        group = segment_list();
        open = false;
    };

    for(auto i = head; i != no_capture; i = arena[i].prev)
    {
        auto const& c = arena[i];
        std::string seg(c.seg.data(), c.seg.size());
        switch(c.kind)
        {
        case capture_kind::var:
            close();
            rv.emplace_back(std::move(seg));
            break;

        case capture_kind::wild_last:
            close();
            group.push_back(std::move(seg));
            open = true;
            break;

        case capture_kind::wild_more:
            // a group always ends in wild_last
            BOOST_ASSERT(open);
            group.push_back(std::move(seg));
            break;
        }
    }
    close();
    std::reverse(rv.begin(), rv.end());
    return rv;
}

match_params
bind_params(
    std::vector<std::string> const& names,
    capture_arena const& arena,
    std::size_t head)
{
    auto values = unwrap_captures(arena, head);
    BOOST_ASSERT(values.size() == names.size());
    match_params p;
    for(std::size_t i = 0; i < names.size(); ++i)
        p.append(names[i], std::move(values[i]));
    return p;
}

} // detail
} // pathmatch
} // boost
