//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <boost/pathmatch/error.hpp>

#include <boost/core/lightweight_test.hpp>
#include <cstring>

namespace boost {
namespace pathmatch {

struct error_test
{
    void
    check(
        condition c,
        error e)
    {
        {
            auto const ec = make_error_code(e);
            BOOST_TEST_EQ(
                std::strcmp(ec.category().name(),
                    "boost.pathmatch"), 0);
            BOOST_TEST(! ec.message().empty());
            BOOST_TEST(ec.message() != "unknown");
            BOOST_TEST(ec.category().equivalent(
                static_cast<int>(e),
                ec.category().default_error_condition(
                    static_cast<int>(e))));
            BOOST_TEST(ec.category().equivalent(
                ec, static_cast<int>(e)));
            BOOST_TEST(ec == e);
            BOOST_TEST(ec == c);
            BOOST_TEST(ec.default_error_condition() ==
                make_error_condition(c));
        }
        {
            auto const ec = make_error_condition(c);
            BOOST_TEST_EQ(
                std::strcmp(ec.category().name(),
                    "boost.pathmatch.condition"), 0);
            BOOST_TEST(! ec.message().empty());
            BOOST_TEST(ec.message() != "unknown");
        }
    }

    void
    testCodes()
    {
        check(condition::pattern_error, error::empty_param_name);
        check(condition::pattern_error, error::duplicate_param);
        check(condition::pattern_error, error::unknown_param);
        check(condition::not_found, error::no_match);
        check(condition::not_found, error::path_too_deep);
        check(condition::decode_error, error::bad_pct_escape);
        check(condition::decode_error, error::bad_utf8);
    }

    void
    testConditions()
    {
        auto const ec = make_error_code(error::no_match);
        BOOST_TEST(ec != condition::pattern_error);
        BOOST_TEST(ec != condition::decode_error);
        BOOST_TEST(make_error_code(error::bad_utf8) !=
            condition::not_found);

        // foreign codes are never equivalent
        system::error_code const other(
            static_cast<int>(error::no_match),
            system::generic_category());
        BOOST_TEST(other != condition::not_found);

        system::error_code const ok;
        BOOST_TEST(ok != condition::not_found);
        BOOST_TEST_EQ(
            make_error_code(error::success).message(),
            "success");
    }

    void
    run()
    {
        testCodes();
        testConditions();
    }
};

} // pathmatch
} // boost

int
main()
{
    boost::pathmatch::error_test().run();
    return boost::report_errors();
}
