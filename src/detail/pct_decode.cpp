//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include "src/detail/pct_decode.hpp"
#include <boost/pathmatch/error.hpp>
#include <boost/url/pct_string_view.hpp>

namespace boost {
namespace pathmatch {
namespace detail {

bool
is_valid_utf8(
    core::string_view s) noexcept
{
    auto p = reinterpret_cast<
        unsigned char const*>(s.data());
    auto const end = p + s.size();
    while(p != end)
    {
        unsigned char const c = *p;
        if(c < 0x80)
        {
            ++p;
            continue;
        }
        // n continuation bytes, the first
        // restricted to [lo, hi]
        std::size_t n;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if(c >= 0xC2 && c <= 0xDF)
        {
            n = 1;
        }
        else if(c == 0xE0)
        {
            n = 2;
            lo = 0xA0; // overlong
        }
        else if(c == 0xED)
        {
            n = 2;
            hi = 0x9F; // surrogates
        }
        else if(c >= 0xE1 && c <= 0xEF)
        {
            n = 2;
        }
        else if(c == 0xF0)
        {
            n = 3;
            lo = 0x90; // overlong
        }
        else if(c >= 0xF1 && c <= 0xF3)
        {
            n = 3;
        }
        else if(c == 0xF4)
        {
            n = 3;
            hi = 0x8F; // above U+10FFFF
        }
        else
        {
            return false;
        }
        if(static_cast<std::size_t>(end - p) <= n)
            return false;
        ++p;
        if(*p < lo || *p > hi)
            return false;
        ++p;
        while(--n)
        {
            if(*p < 0x80 || *p > 0xBF)
                return false;
            ++p;
        }
    }
    return true;
}

system::result<std::string>
decode_segment(
    core::string_view s)
{
    auto rv = urls::make_pct_string_view(s);
    if(rv.has_error())
        BOOST_PATHMATCH_RETURN_EC(
            error::bad_pct_escape);
    auto decoded = rv->decode();
    if(! is_valid_utf8(decoded))
        BOOST_PATHMATCH_RETURN_EC(
            error::bad_utf8);
    return decoded;
}

} // detail
} // pathmatch
} // boost
