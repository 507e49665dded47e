////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/posix/tcp_socket.hpp"
#include <pfs/endian.hpp>
#include <pfs/i18n.hpp>
#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>

REDSUB__NAMESPACE_BEGIN

namespace posix {

tcp_socket::tcp_socket () : inet_socket() {}

// Accepted socket
tcp_socket::tcp_socket (socket_id sock, socket4_addr const & saddr)
    : inet_socket(sock, saddr)
{}

tcp_socket::tcp_socket (tcp_socket && other) noexcept
    : inet_socket(std::move(other))
{}

tcp_socket & tcp_socket::operator = (tcp_socket && other) noexcept
{
    inet_socket::operator = (std::move(other));
    return *this;
}

tcp_socket::~tcp_socket () = default;

conn_status tcp_socket::connect (socket4_addr const & remote_saddr, error * perr)
{
    if (!init(type_enum::stream, perr))
        return conn_status::failure;

    sockaddr_in addr_in4;

    std::memset(& addr_in4, 0, sizeof(addr_in4));

    addr_in4.sin_family      = AF_INET;
    addr_in4.sin_port        = pfs::to_network_order(static_cast<std::uint16_t>(remote_saddr.port));
    addr_in4.sin_addr.s_addr = pfs::to_network_order(static_cast<std::uint32_t>(remote_saddr.addr));
    _saddr = remote_saddr;

    auto rc = ::connect(_socket, reinterpret_cast<sockaddr *>(& addr_in4), sizeof(addr_in4));

    if (rc < 0) {
        if (errno == EINPROGRESS || errno == EWOULDBLOCK || errno == EINTR)
            return conn_status::connecting;

        if (errno == ECONNREFUSED)
            return conn_status::refused;

        if (errno == ENETUNREACH || errno == ENETDOWN || errno == EHOSTUNREACH)
            return conn_status::unreachable;

        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("socket connect error: {}", to_string(remote_saddr))
            , pfs::system_error_text()
        });

        return conn_status::failure;
    }

    return conn_status::connected;
}

conn_status tcp_socket::check_connection (error * perr)
{
    int error_val = 0;
    socklen_t len = sizeof(error_val);
    auto rc = ::getsockopt(_socket, SOL_SOCKET, SO_ERROR, & error_val, & len);

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("get socket option failure (socket={})", _socket)
            , pfs::system_error_text()
        });

        return conn_status::failure;
    }

    switch (error_val) {
        case 0: // No error
            return conn_status::connected;

        case EINPROGRESS:
        case EALREADY:
            return conn_status::connecting;

        case ECONNREFUSED:
            return conn_status::refused;

        case ETIMEDOUT:
        case EHOSTUNREACH:
        case ENETUNREACH:
        case ENETDOWN:
            return conn_status::unreachable;

        default:
            pfs::throw_or(perr, error {
                  make_error_code(errc::socket_error)
                , tr::f_("unhandled error value returned by `getsockopt`: {} (socket={})"
                    , error_val, _socket)
            });

            break;
    }

    return conn_status::failure;
}

void tcp_socket::disconnect (error * perr)
{
    if (_socket != kINVALID_SOCKET) {
        auto rc = ::shutdown(_socket, SHUT_RDWR);

        if (rc != 0) {
            if (errno != ENOTCONN && errno != ECONNRESET) {
                pfs::throw_or(perr, error {
                      make_error_code(errc::socket_error)
                    , tr::_("socket shutdown error")
                    , pfs::system_error_text()
                });
            }
        }
    }
}

} // namespace posix

REDSUB__NAMESPACE_END
