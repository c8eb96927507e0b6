//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/pathmatch/validator.hpp>
#include <boost/url/grammar/alnum_chars.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/lut_chars.hpp>

namespace boost {
namespace pathmatch {

namespace {

constexpr grammar::lut_chars default_value_chars =
    grammar::lut_chars(grammar::alnum_chars) +
    grammar::lut_chars(" .-_");

} // (anon)

bool
is_default_value(
    core::string_view s) noexcept
{
    auto const end = s.data() + s.size();
    return grammar::find_if_not(
        s.data(), end, default_value_chars) == end;
}

} // pathmatch
} // boost
