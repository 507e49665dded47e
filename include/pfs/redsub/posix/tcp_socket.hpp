////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../conn_status.hpp"
#include "inet_socket.hpp"

REDSUB__NAMESPACE_BEGIN

namespace posix {

class tcp_listener;

/**
 * POSIX Inet TCP socket
 */
class tcp_socket: public inet_socket
{
    friend class tcp_listener;

protected:
    /**
     * Constructs POSIX TCP accepted socket.
     */
    tcp_socket (socket_id sock, socket4_addr const & saddr);

public:
    tcp_socket (tcp_socket const & s) = delete;
    tcp_socket & operator = (tcp_socket const & s) = delete;

    /**
     * Constructs uninitialized (invalid) TCP socket.
     */
    REDSUB__EXPORT tcp_socket ();

    REDSUB__EXPORT tcp_socket (tcp_socket && s) noexcept;
    REDSUB__EXPORT tcp_socket & operator = (tcp_socket && s) noexcept;
    REDSUB__EXPORT ~tcp_socket ();

    /**
     * Starts connecting to the TCP server @a remote_saddr.
     *
     * @return @c conn_status::failure if error occurred while connecting,
     *         @c conn_status::refused or @c conn_status::unreachable if the
     *         server rejected the connection immediately,
     *         @c conn_status::connected if connection established or
     *         @c conn_status::connecting if connection in progress.
     */
    REDSUB__EXPORT conn_status connect (socket4_addr const & remote_saddr, error * perr = nullptr);

    /**
     * Checks the result of the connection in progress. Must be called when
     * the socket becomes writable or reports an error.
     */
    REDSUB__EXPORT conn_status check_connection (error * perr = nullptr);

    /**
     * Shutdown connection.
     */
    REDSUB__EXPORT void disconnect (error * perr = nullptr);
};

} // namespace posix

REDSUB__NAMESPACE_END
