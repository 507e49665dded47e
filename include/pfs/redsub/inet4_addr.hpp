////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/optional.hpp>
#include <cstdint>
#include <string>
#include <vector>

REDSUB__NAMESPACE_BEGIN

/**
 * IPv4 address in host byte order.
 */
class inet4_addr
{
public:
    static constexpr std::uint32_t any_addr_value = 0x00000000;

private:
    std::uint32_t _addr {any_addr_value};

public:
    inet4_addr () = default;
    inet4_addr (inet4_addr const & x) = default;
    inet4_addr (inet4_addr && x) = default;
    inet4_addr & operator = (inet4_addr const & x) = default;
    inet4_addr & operator = (inet4_addr && x) = default;

    /**
     * Constructs inet4_addr from four octets, most significant first.
     */
    inet4_addr (std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d)
        : _addr(0)
    {
        _addr |= (static_cast<std::uint32_t>(a) << 24);
        _addr |= (static_cast<std::uint32_t>(b) << 16);
        _addr |= (static_cast<std::uint32_t>(c) << 8);
        _addr |= static_cast<std::uint32_t>(d);
    }

    inet4_addr (std::uint32_t a) : _addr(a)
    {}

    explicit operator std::uint32_t () const noexcept
    {
        return _addr;
    }

public: // static
    /**
     * Parses IPv4 address in dotted-decimal notation ("%a.%b.%c.%d").
     */
    static REDSUB__EXPORT pfs::optional<inet4_addr> parse (char const * s, std::size_t n);

    static REDSUB__EXPORT pfs::optional<inet4_addr> parse (std::string const & s);

    /**
     * Resolves @a hostname into the list of IPv4 addresses.
     *
     * @return Resolved addresses or empty list on failure (if @a perr is not null).
     * @throw redsub::error on failure if @a perr is null.
     */
    static REDSUB__EXPORT std::vector<inet4_addr> resolve (std::string const & hostname
        , error * perr = nullptr);
};

/**
 * Converts IPv4 address to string in dotted-decimal notation.
 */
REDSUB__EXPORT std::string to_string (inet4_addr const & addr);

inline bool operator == (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) == static_cast<std::uint32_t>(b);
}

inline bool operator != (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) != static_cast<std::uint32_t>(b);
}

inline bool operator < (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) < static_cast<std::uint32_t>(b);
}

inline bool is_loopback (inet4_addr const & addr)
{
    return addr == inet4_addr{127, 0, 0, 1};
}

REDSUB__NAMESPACE_END
