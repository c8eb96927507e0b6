//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_PATHMATCH_HPP
#define BOOST_PATHMATCH_HPP

#include <boost/pathmatch/config.hpp>
#include <boost/pathmatch/error.hpp>
#include <boost/pathmatch/params.hpp>
#include <boost/pathmatch/router.hpp>
#include <boost/pathmatch/validator.hpp>

#endif
