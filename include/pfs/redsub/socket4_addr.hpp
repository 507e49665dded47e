////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "inet4_addr.hpp"
#include <pfs/optional.hpp>
#include <cstdint>
#include <string>
#include <vector>

REDSUB__NAMESPACE_BEGIN

class socket4_addr
{
public:
    inet4_addr    addr;
    std::uint16_t port {0};

public:
    /**
     * Parses socket address in form "%a.%b.%c.%d:PORT".
     */
    static REDSUB__EXPORT pfs::optional<socket4_addr> parse (char const * s, std::size_t n);

    static REDSUB__EXPORT pfs::optional<socket4_addr> parse (std::string const & s);
};

inline std::string to_string (socket4_addr const & saddr)
{
    return to_string(saddr.addr) + ':' + std::to_string(saddr.port);
}

inline bool operator == (socket4_addr const & a, socket4_addr const & b)
{
    return a.addr == b.addr && a.port == b.port;
}

inline bool operator != (socket4_addr const & a, socket4_addr const & b)
{
    return !(a == b);
}

/**
 * Server address as configured by user: host name (or dotted-decimal IPv4
 * address) and port. Host name is resolved on every connection attempt.
 */
class server_addr
{
public:
    std::string host;
    std::uint16_t port {0};

public:
    /**
     * Parses server address in form "HOST:PORT".
     */
    static REDSUB__EXPORT pfs::optional<server_addr> parse (std::string const & s);

    /**
     * Resolves host name into the list of socket addresses.
     */
    REDSUB__EXPORT std::vector<socket4_addr> resolve (error * perr = nullptr) const;
};

inline std::string to_string (server_addr const & a)
{
    return a.host + ':' + std::to_string(a.port);
}

REDSUB__NAMESPACE_END
