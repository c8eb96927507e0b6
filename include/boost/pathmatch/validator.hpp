//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_PATHMATCH_VALIDATOR_HPP
#define BOOST_PATHMATCH_VALIDATOR_HPP

#include <boost/pathmatch/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <functional>
#include <map>
#include <string>

namespace boost {
namespace pathmatch {

/** A predicate deciding whether a captured value is acceptable.

    The predicate receives one decoded path segment.
    For wildcard variables it is invoked once for each
    segment of the group, and the group is accepted only
    if every segment is.
*/
using validator = std::function<bool(core::string_view)>;

/** Validators for the variables of one pattern, by name.

    An empty function selects the router's default
    validator for that variable.
*/
using validator_map = std::map<
    std::string, validator, std::less<>>;

/** Return true if a value is acceptable without a registered validator.

    A value is accepted when every character is an
    ASCII letter, an ASCII digit, a space, or one of
    `'.'`, `'-'`, `'_'`. The empty string is accepted.

    Only ASCII is accepted, so a decoded segment
    holding any other UTF-8 character, such as
    `"café"`, is rejected. Routers that must accept
    such values can install a different predicate
    with @ref router_options::default_validator, or
    register a validator for the variable.

    @param s The decoded segment to check.
*/
BOOST_PATHMATCH_DECL
bool
is_default_value(
    core::string_view s) noexcept;

} // pathmatch
} // boost

#endif
