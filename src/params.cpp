//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/pathmatch/params.hpp>
#include <boost/pathmatch/detail/except.hpp>
#include <boost/assert.hpp>

namespace boost {
namespace pathmatch {

param_value const*
match_params::
find(core::string_view name) const noexcept
{
    // few entries, linear is fastest
    for(auto const& e : v_)
        if(core::string_view(e.name) == name)
            return &e.value;
    return nullptr;
}

param_value const&
match_params::
at(core::string_view name) const
{
    auto p = find(name);
    if(! p)
        detail::throw_out_of_range();
    return *p;
}

void
match_params::
append(
    std::string name,
    param_value value)
{
    BOOST_ASSERT(! contains(name));
    v_.push_back({
        std::move(name),
        std::move(value) });
}

} // pathmatch
} // boost
