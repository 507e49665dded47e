////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/posix/tcp_listener.hpp"
#include <pfs/endian.hpp>
#include <pfs/i18n.hpp>
#include <cerrno>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>

REDSUB__NAMESPACE_BEGIN

namespace posix {

tcp_listener::tcp_listener () : inet_socket() {}

tcp_listener::tcp_listener (socket4_addr const & saddr, error * perr)
    : inet_socket()
{
    if (!init(inet_socket::type_enum::stream, perr))
        return;

    _saddr = saddr;
}

bool tcp_listener::listen (int backlog, error * perr)
{
    if (!bind(_socket, _saddr, perr))
        return false;

    auto rc = ::listen(_socket, backlog);

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("listen failure: {}", to_string(_saddr))
            , pfs::system_error_text()
        });

        return false;
    }

    return true;
}

tcp_socket tcp_listener::accept (error * perr)
{
    sockaddr_in sa;
    socklen_t addrlen = sizeof(sa);

    auto sock = ::accept4(_socket, reinterpret_cast<sockaddr *>(& sa), & addrlen
        , SOCK_NONBLOCK | SOCK_CLOEXEC);

    if (sock >= 0) {
        if (sa.sin_family == AF_INET) {
            auto addr = pfs::to_native_order(static_cast<std::uint32_t>(sa.sin_addr.s_addr));
            auto port = pfs::to_native_order(static_cast<std::uint16_t>(sa.sin_port));

            return tcp_socket{sock, socket4_addr{addr, port}};
        }

        // Wrap to close the descriptor
        tcp_socket unsupported {sock, socket4_addr{}};

        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("socket accept failure: unsupported sockaddr family: {}"
                " (AF_INET supported only)", sa.sin_family)
        });

        return tcp_socket{};
    }

    if (errno == EAGAIN || (EAGAIN != EWOULDBLOCK && errno == EWOULDBLOCK) || errno == EINTR)
        return tcp_socket{};

    pfs::throw_or(perr, error {
          make_error_code(errc::socket_error)
        , tr::_("socket accept failure")
        , pfs::system_error_text()
    });

    return tcp_socket{};
}

} // namespace posix

REDSUB__NAMESPACE_END
