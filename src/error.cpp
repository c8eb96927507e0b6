//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/pathmatch/error.hpp>

namespace boost {
namespace pathmatch {
namespace detail {

namespace {

// returns 0 for codes with no condition
int
condition_of(int ev) noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::empty_param_name:
    case error::duplicate_param:
    case error::unknown_param:
        return static_cast<int>(
            condition::pattern_error);

    case error::no_match:
    case error::path_too_deep:
        return static_cast<int>(
            condition::not_found);

    case error::bad_pct_escape:
    case error::bad_utf8:
        return static_cast<int>(
            condition::decode_error);

    default:
        return 0;
    }
}

} // (anon)

const char*
error_cat_type::
name() const noexcept
{
    return "boost.pathmatch";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::success: return "success";
    case error::empty_param_name: return "empty parameter name";
    case error::duplicate_param: return "duplicate parameter name";
    case error::unknown_param: return "validator names an undeclared parameter";
    case error::no_match: return "no matching route";
    case error::path_too_deep: return "path too deep";
    case error::bad_pct_escape: return "bad percent-escape";
    case error::bad_utf8: return "bad UTF-8 in path segment";
    default:
        return "unknown";
    }
}

system::error_condition
error_cat_type::
default_error_condition(
    int ev) const noexcept
{
    int const c = condition_of(ev);
    if(c == 0)
        return { ev, *this };
    return { c, condition_cat };
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "boost.pathmatch.condition";
}

std::string
condition_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(ev))
    {
    case condition::pattern_error: return "pattern error";
    case condition::not_found: return "not found";
    case condition::decode_error: return "decode error";
    default:
        return "unknown";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int c) const noexcept
{
    if(ec.category() != error_cat)
        return false;
    return condition_of(ec.value()) == c;
}

//-----------------------------------------------

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

} // detail
} // pathmatch
} // boost
