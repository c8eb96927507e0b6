//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include "src/detail/router_base.hpp"
#include "src/detail/bind.hpp"
#include "src/detail/path.hpp"
#include "src/detail/pct_decode.hpp"
#include <boost/pathmatch/detail/except.hpp>
#include <boost/pathmatch/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

/*

Search order at each node, for the remaining
path "x/..." (the stack is LIFO, so the frames
are pushed in reverse):

push    edge        frame
--------------------------------------------------
1       wildcard    same node, wildcard edge only
2       wildcard    wildcard child, group closed
3       variable    variable child
4       literal     literal child "x"

Everything reachable through the literal edge
is explored before the variable edge is tried,
and the wildcard edge is tried last. Closing a
group is tried before extending it, so a group
takes as few segments as the rest of the
pattern allows.

*/

namespace boost {
namespace pathmatch {
namespace detail {

namespace {

bool
is_param(core::string_view seg) noexcept
{
    return seg.starts_with(':');
}

} // (anon)

router_base::
impl::
impl(
    validator v,
    std::shared_ptr<spdlog::logger> log_,
    std::size_t depth_limit_)
    : default_validator(v
        ? std::move(v)
        : validator(&is_default_value))
    , log(log_
        ? std::move(log_)
        : spdlog::default_logger())
    , depth_limit(depth_limit_)
{
}

bool
router_base::
impl::
validate(
    route_entry const& re,
    match_params const& p) const
{
    std::size_t i = 0;
    for(auto const& e : p)
    {
        auto const& check = re.checks[i]
            ? re.checks[i]
            : default_validator;
        ++i;
        if(auto s = std::get_if<std::string>(&e.value))
        {
            if(! check(*s))
                return false;
            continue;
        }
        for(auto const& seg :
                std::get<segment_list>(e.value))
            if(! check(seg))
                return false;
    }
    return true;
}

//------------------------------------------------

router_base::
~router_base()
{
    delete impl_;
}

router_base::
router_base(
    router_options opt)
    : impl_(new impl(
        std::move(opt.default_validator_),
        std::move(opt.log_),
        opt.depth_limit_))
{
}

router_base::
router_base(
    router_base&& other) noexcept
    : impl_(other.impl_)
{
    other.impl_ = nullptr;
}

router_base&
router_base::
operator=(
    router_base&& other) noexcept
{
    delete impl_;
    impl_ = other.impl_;
    other.impl_ = nullptr;
    return *this;
}

std::size_t
router_base::
max_depth() const noexcept
{
    return impl_->max_depth;
}

std::size_t
router_base::
size() const noexcept
{
    return impl_->size;
}

void
router_base::
add_impl(
    core::string_view pattern,
    std::size_t index,
    validator_map const& validators)
{
    auto const path = normalize_path(pattern);
    // cannot fail without a depth bound
    auto const segs = split_path(
        path, std::size_t(-1)).value();

    // check everything before touching the graph
    route_entry re;
    re.index = index;
    for(auto seg : segs)
    {
        if(! is_param(seg))
            continue;
        bool const wild = seg.starts_with(":*");
        auto const name = std::string_view(
            seg.substr(wild ? 2 : 1));
        if(name.empty())
            throw_system_error(BOOST_PATHMATCH_ERR(
                error::empty_param_name));
        if(std::find(re.names.begin(),
                re.names.end(), name) != re.names.end())
            throw_system_error(BOOST_PATHMATCH_ERR(
                error::duplicate_param));
        re.names.emplace_back(
            name.data(), name.size());
        re.wild = re.wild || wild;
    }
    re.checks.resize(re.names.size());
    for(auto const& kv : validators)
    {
        auto it = std::find(re.names.begin(),
            re.names.end(), kv.first);
        if(it == re.names.end())
        {
            impl_->log->debug(
                "pathmatch: \"{}\" has no parameter \"{}\"",
                std::string_view(pattern), kv.first);
            throw_system_error(BOOST_PATHMATCH_ERR(
                error::unknown_param));
        }
        re.checks[it - re.names.begin()] = kv.second;
    }

    node* n = &impl_->root;
    for(auto seg : segs)
    {
        std::unique_ptr<node>* next;
        if(seg.starts_with(":*"))
        {
            next = &n->wild;
        }
        else if(is_param(seg))
        {
            next = &n->var;
        }
        else
        {
            auto it = n->literals.find(
                std::string_view(seg));
            if(it == n->literals.end())
                it = n->literals.emplace(
                    std::string(seg.data(), seg.size()),
                    std::make_unique<node>()).first;
            n = it->second.get();
            continue;
        }
        if(! *next)
            *next = std::make_unique<node>();
        n = next->get();
    }

    auto const depth = segs.size() - 1;
    auto const wild = re.wild;
    auto const nparams = re.names.size();
    n->routes.push_back(std::move(re));
    ++impl_->size;

    // a wildcard makes the deepest pattern
    // meaningless, so the limit applies instead
    impl_->max_depth = (std::max)(
        impl_->max_depth,
        wild ? impl_->depth_limit : depth);

    impl_->log->debug(
        "pathmatch: added \"{}\" ({} params, max_depth {})",
        std::string_view(pattern), nparams,
        impl_->max_depth);
}

auto
router_base::
match_impl(
    core::string_view path) const ->
        system::result<resolved>
{
    auto const& im = *impl_;
    auto rv = split_path(
        normalize_path(path), im.max_depth);
    if(rv.has_error())
    {
        im.log->trace(
            "pathmatch: \"{}\" exceeds max_depth {}",
            std::string_view(path), im.max_depth);
        return rv.error();
    }
    auto& segs = *rv;

    // decode after splitting, so "%2F"
    // never becomes a separator
    std::vector<std::string> decoded;
    if(path.find('%') != core::string_view::npos)
    {
        decoded.reserve(segs.size());
        for(auto seg : segs)
        {
            auto d = decode_segment(seg);
            if(d.has_error())
            {
                im.log->debug(
                    "pathmatch: \"{}\": {}",
                    std::string_view(path),
                    d.error().message());
                return d.error();
            }
            decoded.push_back(std::move(*d));
        }
        for(std::size_t i = 0; i < segs.size(); ++i)
            segs[i] = decoded[i];
    }

    struct frame
    {
        node const* n;
        std::size_t chain;
        std::size_t depth;

        // only the wildcard edge of n, with
        // the current group still open
        bool wild_only;

        // arena size when pushed
        std::size_t mark;
    };

    auto const depth = segs.size() - 1;
    capture_arena arena;
    std::vector<frame> stack;
    stack.push_back({ &im.root, no_capture, 0, false, 0 });
    while(! stack.empty())
    {
        auto const f = stack.back();
        stack.pop_back();

        // links past the mark belong to
        // subtrees already explored
        arena.resize(f.mark);

        if(f.depth == segs.size())
        {
            if(f.wild_only)
                continue;
            for(auto const& re : f.n->routes)
            {
                if(re.wild && depth > im.depth_limit)
                    continue;
                auto p = bind_params(
                    re.names, arena, f.chain);
                if(! im.validate(re, p))
                    continue;
                return resolved{ std::move(p), re.index };
            }
            continue;
        }

        auto const part = segs[f.depth];
        if(f.n->wild)
        {
            arena.push_back({ part, f.chain,
                capture_kind::wild_more });
            stack.push_back({ f.n, arena.size() - 1,
                f.depth + 1, true, arena.size() });
            arena.push_back({ part, f.chain,
                capture_kind::wild_last });
            stack.push_back({ f.n->wild.get(), arena.size() - 1,
                f.depth + 1, false, arena.size() });
        }
        if(f.wild_only)
            continue;
        if(f.n->var)
        {
            arena.push_back({ part, f.chain,
                capture_kind::var });
            stack.push_back({ f.n->var.get(), arena.size() - 1,
                f.depth + 1, false, arena.size() });
        }
        auto it = f.n->literals.find(
            std::string_view(part));
        if(it != f.n->literals.end())
            stack.push_back({ it->second.get(), f.chain,
                f.depth + 1, false, arena.size() });
    }

    im.log->trace(
        "pathmatch: no route for \"{}\"",
        std::string_view(path));
    BOOST_PATHMATCH_RETURN_EC(
        error::no_match);
}

} // detail
} // pathmatch
} // boost
