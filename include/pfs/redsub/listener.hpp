////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "event.hpp"
#include "exports.hpp"
#include "interruptable.hpp"
#include "namespace.hpp"
#include "posix/tcp_socket.hpp"
#include "resp/decoder.hpp"
#include <pfs/optional.hpp>
#include <chrono>
#include <deque>
#include <random>
#include <vector>

REDSUB__NAMESPACE_BEGIN

class session;

//
//               +----------------------------------+
//               |                                  |
//               v                                  |
// disconnected --> connecting --> resubscribing --> streaming
//                     ^   |             |
//                     |   | backoff     | send failure
//                     +---+-------------+
//
/**
 * Endless sequence of the session events. Obtained by session::listen().
 */
class listener: public interruptable
{
    friend class session;

    enum class state_enum
    {
          disconnected
        , connecting
        , resubscribing
        , streaming
    };

private:
    session *  _session {nullptr};
    state_enum _state {state_enum::disconnected};
    posix::tcp_socket _socket;
    resp::decoder _decoder;
    std::deque<event> _queue;
    std::vector<char> _read_buffer;
    std::mt19937 _rng;
    std::chrono::steady_clock::time_point _last_read;

private:
    explicit listener (session * s);

public:
    listener (listener const &) = delete;
    listener & operator = (listener const &) = delete;
    listener & operator = (listener &&) = delete;

    REDSUB__EXPORT listener (listener && other);
    REDSUB__EXPORT ~listener ();

public:
    /**
     * Blocks until the next event is available.
     *
     * @return Next event or @c nullopt if the listener or its session is interrupted.
     */
    REDSUB__EXPORT pfs::optional<event> next ();

    /**
     * Delay before the connection retry number @a retry (starting from 1),
     * jitter is not included.
     */
    REDSUB__EXPORT std::chrono::milliseconds backoff_delay (int retry) const;

private:
    void init_callbacks ();
    bool cancelled () const;
    bool sleep_for (std::chrono::milliseconds timeout);
    bool connect ();
    bool connect_to (socket4_addr const & saddr, error * perr);
    bool resubscribe ();
    void step_streaming ();
    void drop_connection ();
    void disconnect (error && cause);
};

REDSUB__NAMESPACE_END
