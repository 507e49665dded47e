////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/posix/inet_socket.hpp"
#include "pfs/redsub/trace.hpp"
#include "pfs/redsub/tag.hpp"
#include <pfs/endian.hpp>
#include <pfs/i18n.hpp>
#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>

REDSUB__NAMESPACE_BEGIN

namespace posix {

inet_socket::inet_socket () = default;

inet_socket::inet_socket (socket_id sock, socket4_addr const & saddr)
    : _socket(sock)
    , _saddr(saddr)
{}

inet_socket::inet_socket (inet_socket && other) noexcept
    : _socket(other._socket)
    , _saddr(other._saddr)
{
    other._socket = kINVALID_SOCKET;
}

inet_socket & inet_socket::operator = (inet_socket && other) noexcept
{
    if (this != & other) {
        close();
        _socket = other._socket;
        _saddr  = other._saddr;
        other._socket = kINVALID_SOCKET;
    }

    return *this;
}

inet_socket::~inet_socket ()
{
    close();
}

bool inet_socket::init (type_enum socktype, error * perr)
{
    int ai_socktype = -1;

    switch (socktype) {
        case type_enum::stream:
            ai_socktype = SOCK_STREAM;
            break;
        default:
            break;
    }

    if (ai_socktype < 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::_("bad/unsupported socket type")
        });

        return false;
    }

    close();

    _socket = ::socket(AF_INET, ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);

    if (_socket < 0) {
        _socket = kINVALID_SOCKET;

        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::_("create INET socket failure")
            , pfs::system_error_text()
        });

        return false;
    }

    int yes = 1;
    int rc = 0;

#if defined(SO_REUSEADDR)
    if (rc == 0)
        rc = ::setsockopt(_socket, SOL_SOCKET, SO_REUSEADDR, & yes, sizeof(int));
#endif

#if defined(SO_KEEPALIVE)
    if (rc == 0)
        rc = ::setsockopt(_socket, SOL_SOCKET, SO_KEEPALIVE, & yes, sizeof(int));
#endif

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::_("set socket option failure")
            , pfs::system_error_text()
        });

        close();
        return false;
    }

    return true;
}

bool inet_socket::bind (socket_id sock, socket4_addr const & saddr, error * perr)
{
    sockaddr_in addr_in4;

    std::memset(& addr_in4, 0, sizeof(addr_in4));

    addr_in4.sin_family      = AF_INET;
    addr_in4.sin_port        = pfs::to_network_order(static_cast<std::uint16_t>(saddr.port));
    addr_in4.sin_addr.s_addr = pfs::to_network_order(static_cast<std::uint32_t>(saddr.addr));

    auto rc = ::bind(sock, reinterpret_cast<sockaddr *>(& addr_in4), sizeof(addr_in4));

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("bind name to socket failure: {}", to_string(saddr))
            , pfs::system_error_text()
        });

        return false;
    }

    return true;
}

inet_socket::operator bool () const noexcept
{
    return _socket != kINVALID_SOCKET;
}

inet_socket::socket_id inet_socket::id () const noexcept
{
    return _socket;
}

socket4_addr inet_socket::saddr () const noexcept
{
    return _saddr;
}

std::streamsize inet_socket::recv (char * data, std::streamsize len, error * perr)
{
    auto n = ::recv(_socket, data, static_cast<std::size_t>(len), MSG_DONTWAIT);

    if (n < 0) {
        if (errno == EAGAIN || (EAGAIN != EWOULDBLOCK && errno == EWOULDBLOCK) || errno == EINTR)
            return -1;

        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::_("receive data failure")
            , pfs::system_error_text()
        });

        return -1;
    }

    REDSUB__TRACE(REDSUB_TAG, "socket #{}: {} bytes received", _socket, n);

    return static_cast<std::streamsize>(n);
}

send_result inet_socket::send (char const * data, std::streamsize len, error * perr)
{
    std::streamsize total_sent = 0;

    while (len > 0) {
        // MSG_NOSIGNAL flag means:
        // requests not to send SIGPIPE on errors on stream oriented sockets
        // when the other end breaks the connection.
        // The EPIPE error is still returned.
        auto n = ::send(_socket, data + total_sent, static_cast<std::size_t>(len)
            , MSG_NOSIGNAL | MSG_DONTWAIT);

        if (n < 0) {
            if (errno == EINTR)
                continue;

            if (errno == ENOBUFS)
                return send_result{send_status::overflow, total_sent};

            if (errno == EAGAIN || (EAGAIN != EWOULDBLOCK && errno == EWOULDBLOCK))
                return send_result{send_status::again, total_sent};

            auto state = (errno == EPIPE || errno == ECONNRESET || errno == ENOTCONN)
                ? send_status::network
                : send_status::failure;

            pfs::throw_or(perr, error {
                  make_error_code(errc::socket_error)
                , tr::_("send failure")
                , pfs::system_error_text()
            });

            return send_result{state, total_sent};
        }

        total_sent += n;
        len -= n;
    }

    REDSUB__TRACE(REDSUB_TAG, "socket #{}: {} bytes sent", _socket, total_sent);

    return send_result{send_status::good, total_sent};
}

void inet_socket::close ()
{
    if (_socket != kINVALID_SOCKET) {
        ::shutdown(_socket, SHUT_RDWR);
        ::close(_socket);
        _socket = kINVALID_SOCKET;
    }
}

} // namespace posix

REDSUB__NAMESPACE_END
