//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_PATHMATCH_ERROR_HPP
#define BOOST_PATHMATCH_ERROR_HPP

#include <boost/pathmatch/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace pathmatch {

/** Error codes returned by the router.

    Each code belongs to exactly one @ref condition,
    which callers should compare against instead of
    the individual codes.
*/
enum class error
{
    /// Success
    success = 0,

    /** A variable segment has no name.

        The pattern contains `":"` or `":*"` on its own.
    */
    empty_param_name,

    /** A variable name is declared twice in one pattern.
    */
    duplicate_param,

    /** A validator names a variable the pattern does not declare.
    */
    unknown_param,

    /** No registered pattern matches the path.
    */
    no_match,

    /** The path has more segments than any pattern can match.
    */
    path_too_deep,

    /** A percent-escape in the path is malformed.
    */
    bad_pct_escape,

    /** A decoded path segment is not valid UTF-8.
    */
    bad_utf8
};

//-----------------------------------------------

/** Error conditions corresponding to sets of error codes.
*/
enum class condition
{
    /** The pattern passed to `add` is malformed.
    */
    pattern_error = 1,

    /** No pattern matches the path.
    */
    not_found,

    /** The path could not be percent-decoded.
    */
    decode_error
};

} // pathmatch
} // boost

#include <boost/pathmatch/impl/error.hpp>

#endif
