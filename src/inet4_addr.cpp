////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/inet4_addr.hpp"
#include <pfs/endian.hpp>
#include <pfs/i18n.hpp>
#include <pfs/integer.hpp>
#include <algorithm>
#include <array>
#include <cstring>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>

REDSUB__NAMESPACE_BEGIN

pfs::optional<inet4_addr> inet4_addr::parse (char const * s, std::size_t n)
{
    std::array<std::uint8_t, 4> octets;
    char const * first = s;
    char const * last = s + n;

    for (std::size_t i = 0; i < octets.size(); i++) {
        auto pos = (i < octets.size() - 1) ? std::find(first, last, '.') : last;

        // Missing delimiter or empty octet
        if (pos == last && i < octets.size() - 1)
            return pfs::nullopt;

        if (pos == first || pos - first > 3)
            return pfs::nullopt;

        if (!std::all_of(first, pos, [] (char ch) { return ch >= '0' && ch <= '9'; }))
            return pfs::nullopt;

        std::error_code ec;
        octets[i] = pfs::to_integer(first, pos, std::uint8_t{0}, std::uint8_t{255}, ec);

        if (ec)
            return pfs::nullopt;

        first = (pos == last) ? last : pos + 1;
    }

    return inet4_addr{octets[0], octets[1], octets[2], octets[3]};
}

pfs::optional<inet4_addr> inet4_addr::parse (std::string const & s)
{
    return parse(s.c_str(), s.size());
}

std::vector<inet4_addr> inet4_addr::resolve (std::string const & hostname, error * perr)
{
    // Dotted-decimal notation does not need a resolver round trip
    auto parsed = parse(hostname);

    if (parsed)
        return std::vector<inet4_addr>{*parsed};

    struct addrinfo hints;
    struct addrinfo * ai = nullptr;

    std::memset(& hints, 0, sizeof(hints));

    hints.ai_family = AF_INET; // Allow IPv4 only
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = 0;
    hints.ai_protocol = 0;     // Any protocol

    int rc = ::getaddrinfo(hostname.c_str(), nullptr, & hints, & ai);

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::resolve_error)
            , tr::f_("resolve host failure: {}: {}", hostname, gai_strerror(rc))
        });

        return std::vector<inet4_addr>{};
    }

    std::vector<inet4_addr> result;

    for (struct addrinfo * p = ai; p != nullptr; p = p->ai_next) {
        if (p->ai_family == AF_INET) {
            auto ipv4 = reinterpret_cast<struct sockaddr_in *>(p->ai_addr);
            inet4_addr addr {pfs::to_native_order(static_cast<std::uint32_t>(ipv4->sin_addr.s_addr))};

            if (std::find(result.begin(), result.end(), addr) == result.end())
                result.push_back(addr);
        }
    }

    ::freeaddrinfo(ai);

    if (result.empty()) {
        pfs::throw_or(perr, error {
              make_error_code(errc::resolve_error)
            , tr::f_("no IPv4 address found for host: {}", hostname)
        });
    }

    return result;
}

std::string to_string (inet4_addr const & addr)
{
    auto a = static_cast<std::uint32_t>(addr);

    return std::to_string((a >> 24) & 0xFF)
        + '.' + std::to_string((a >> 16) & 0xFF)
        + '.' + std::to_string((a >> 8) & 0xFF)
        + '.' + std::to_string(a & 0xFF);
}

REDSUB__NAMESPACE_END
