////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../error.hpp"
#include "../exports.hpp"
#include "tcp_socket.hpp"

REDSUB__NAMESPACE_BEGIN

namespace posix {

/**
 * POSIX Inet TCP listener
 */
class tcp_listener: public inet_socket
{
public:
    /**
     * Constructs invalid (uninitialized) TCP listener.
     */
    REDSUB__EXPORT tcp_listener ();

    /**
     * Constructs POSIX TCP listener for the address @a saddr.
     */
    REDSUB__EXPORT tcp_listener (socket4_addr const & saddr, error * perr = nullptr);

public:
    /**
     * Bind the socket to address and listen for connections on a socket.
     *
     * @param backlog The maximum length to which the queue of pending connections may grow.
     */
    REDSUB__EXPORT bool listen (int backlog, error * perr = nullptr);

    /**
     * Accept a connection on a listener socket.
     *
     * @return Accepted non-blocking socket or invalid socket if no pending
     *         connections or error occurred.
     */
    REDSUB__EXPORT tcp_socket accept (error * perr = nullptr);
};

} // namespace posix

REDSUB__NAMESPACE_END
