//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <boost/pathmatch/validator.hpp>

#include <boost/core/lightweight_test.hpp>
#include <string_view>

namespace boost {
namespace pathmatch {

struct validator_test
{
    void
    testDefault()
    {
        BOOST_TEST(is_default_value(""));
        BOOST_TEST(is_default_value("abc"));
        BOOST_TEST(is_default_value("ABC123"));
        BOOST_TEST(is_default_value("photo.jpg"));
        BOOST_TEST(is_default_value("a-b_c d"));
        BOOST_TEST(is_default_value(" "));

        BOOST_TEST(! is_default_value("a/b"));
        BOOST_TEST(! is_default_value("a@b"));
        BOOST_TEST(! is_default_value("a%20b"));
        BOOST_TEST(! is_default_value("a\tb"));
        BOOST_TEST(! is_default_value("~"));
        BOOST_TEST(! is_default_value("caf\xC3\xA9"));
        BOOST_TEST(! is_default_value(
            core::string_view("a\0b", 3)));
    }

    void
    testMap()
    {
        validator_map m;
        m.emplace("id", &is_default_value);
        m.emplace("any", validator());

        // heterogeneous lookup
        auto it = m.find(std::string_view("id"));
        BOOST_TEST(it != m.end());
        BOOST_TEST(it->second("x"));
        BOOST_TEST(! it->second("x/y"));
        BOOST_TEST(! m.at("any"));
    }

    void
    run()
    {
        testDefault();
        testMap();
    }
};

} // pathmatch
} // boost

int
main()
{
    boost::pathmatch::validator_test().run();
    return boost::report_errors();
}
