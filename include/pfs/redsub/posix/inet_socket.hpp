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
#include "../namespace.hpp"
#include "../send_result.hpp"
#include "../socket4_addr.hpp"
#include <ios>

REDSUB__NAMESPACE_BEGIN

namespace posix {

/**
 * POSIX inet socket
 */
class inet_socket
{
public:
    using socket_id = int;
    static socket_id constexpr kINVALID_SOCKET = -1;

protected:
    enum class type_enum {
          unknown
        , stream = 0x001
    };

protected:
    socket_id _socket {kINVALID_SOCKET};

    // Bound address for listener.
    // Server address for connected socket.
    socket4_addr _saddr;

protected:
    /**
     * Constructs invalid POSIX socket
     */
    inet_socket ();

    /**
     * Constructs POSIX socket from native socket.
     */
    inet_socket (socket_id sock, socket4_addr const & saddr);

    inet_socket (inet_socket const &) = delete;
    inet_socket & operator = (inet_socket const &) = delete;

    REDSUB__EXPORT inet_socket (inet_socket &&) noexcept;
    REDSUB__EXPORT inet_socket & operator = (inet_socket &&) noexcept;

    REDSUB__EXPORT ~inet_socket ();

protected:
    /**
     * Creates native non-blocking socket.
     */
    bool init (type_enum socktype, error * perr);

    static bool bind (socket_id sock, socket4_addr const & saddr, error * perr);

public:
    /**
     * Checks if socket is valid
     */
    REDSUB__EXPORT operator bool () const noexcept;

    REDSUB__EXPORT socket_id id () const noexcept;

    REDSUB__EXPORT socket4_addr saddr () const noexcept;

    /**
     * Receives at most @a len bytes into @a data.
     *
     * @return Number of bytes received, @c 0 if the peer has performed
     *         an orderly shutdown or @c -1 if no data available (nothing
     *         is stored into @a perr in this case) or error occurred.
     */
    REDSUB__EXPORT std::streamsize recv (char * data, std::streamsize len, error * perr = nullptr);

    /**
     * Sends @a data of @a len bytes on a socket.
     *
     * @return @c send_status::good if all data sent,
     *         @c send_status::again if the send buffer is full (the number of
     *         bytes sent so far is stored in the result),
     *         @c send_status::network if the connection is broken,
     *         @c send_status::failure on other errors.
     */
    REDSUB__EXPORT send_result send (char const * data, std::streamsize len, error * perr = nullptr);

    /**
     * Closes the native socket. The socket becomes invalid.
     */
    REDSUB__EXPORT void close ();
};

} // namespace posix

REDSUB__NAMESPACE_END
