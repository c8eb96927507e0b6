//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_PATHMATCH_PARAMS_HPP
#define BOOST_PATHMATCH_PARAMS_HPP

#include <boost/pathmatch/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>
#include <variant>
#include <vector>

namespace boost {
namespace pathmatch {

/** The segments captured by a wildcard variable, in path order.

    A captured group is never empty.
*/
using segment_list = std::vector<std::string>;

/** The value captured by a variable.

    Holds a `std::string` for a `:name` variable and
    a @ref segment_list for a `:*name` variable.
*/
using param_value = std::variant<std::string, segment_list>;

/** The variables bound by a successful match.

    Entries appear in the order the variables are
    declared in the matched pattern. Names are unique.

    @par Example
    @code
    auto rv = r.match( "static/css/site.css" );
    auto const& p = rv->params();
    segment_list const& dirs = std::get<segment_list>( p.at( "path" ) );
    @endcode
*/
class match_params
{
public:
    /** A single binding.
    */
    struct value_type
    {
        std::string name;
        param_value value;

        bool operator==(
            value_type const&) const = default;
    };

    using const_iterator =
        std::vector<value_type>::const_iterator;

    match_params() = default;

    /// Return the number of bindings.
    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    /// Return true if there are no bindings.
    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    const_iterator
    begin() const noexcept
    {
        return v_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return v_.end();
    }

    /** Return true if a variable with this name is bound.
    */
    bool
    contains(
        core::string_view name) const noexcept
    {
        return find(name) != nullptr;
    }

    /** Return the value bound to a name, or `nullptr`.
    */
    BOOST_PATHMATCH_DECL
    param_value const*
    find(core::string_view name) const noexcept;

    /** Return the value bound to a name.

        @throws std::out_of_range no variable
        has this name.
    */
    BOOST_PATHMATCH_DECL
    param_value const&
    at(core::string_view name) const;

    /** Append a binding.

        @par Preconditions
        No binding named `name` exists.
    */
    BOOST_PATHMATCH_DECL
    void
    append(
        std::string name,
        param_value value);

    bool operator==(
        match_params const&) const = default;

private:
    std::vector<value_type> v_;
};

} // pathmatch
} // boost

#endif
