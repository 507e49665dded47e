////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/socket4_addr.hpp"
#include <pfs/integer.hpp>
#include <algorithm>
#include <utility>

REDSUB__NAMESPACE_BEGIN

static pfs::optional<std::uint16_t> parse_port (char const * first, char const * last)
{
    if (first == last)
        return pfs::nullopt;

    if (!std::all_of(first, last, [] (char ch) { return ch >= '0' && ch <= '9'; }))
        return pfs::nullopt;

    std::error_code ec;
    auto port = pfs::to_integer(first, last, std::uint16_t{1}, std::uint16_t{65535}, ec);

    if (ec)
        return pfs::nullopt;

    return port;
}

pfs::optional<socket4_addr> socket4_addr::parse (char const * s, std::size_t n)
{
    auto delim_pos = std::find(s, s + n, ':');

    if (delim_pos == s + n)
        return pfs::nullopt;

    auto addr = inet4_addr::parse(s, delim_pos - s);

    if (!addr)
        return pfs::nullopt;

    auto port = parse_port(delim_pos + 1, s + n);

    if (!port)
        return pfs::nullopt;

    return socket4_addr{*addr, *port};
}

pfs::optional<socket4_addr> socket4_addr::parse (std::string const & s)
{
    return parse(s.c_str(), s.size());
}

pfs::optional<server_addr> server_addr::parse (std::string const & s)
{
    auto delim_pos = s.rfind(':');

    if (delim_pos == std::string::npos || delim_pos == 0)
        return pfs::nullopt;

    auto port = parse_port(s.data() + delim_pos + 1, s.data() + s.size());

    if (!port)
        return pfs::nullopt;

    return server_addr{s.substr(0, delim_pos), *port};
}

std::vector<socket4_addr> server_addr::resolve (error * perr) const
{
    auto addrs = inet4_addr::resolve(host, perr);
    std::vector<socket4_addr> result;

    result.reserve(addrs.size());

    for (auto const & a: addrs)
        result.push_back(socket4_addr{a, port});

    return result;
}

REDSUB__NAMESPACE_END
