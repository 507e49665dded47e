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
#include <chrono>
#include <vector>
#include <poll.h>

REDSUB__NAMESPACE_BEGIN

namespace posix {

class poll_poller
{
public:
    using socket_id = int;

public:
    std::vector<pollfd> events;
    short int oevents; // Observable events

public:
    REDSUB__EXPORT poll_poller (short int observable_events);
    REDSUB__EXPORT ~poll_poller ();

    REDSUB__EXPORT void add_socket (socket_id sock);

    /**
     * Waits for observable events at most @a millis.
     *
     * @return Number of sockets with events, @c 0 on timeout or interrupted
     *         by signal, negative value on error.
     */
    REDSUB__EXPORT int poll (std::chrono::milliseconds millis, error * perr = nullptr);
};

} // namespace posix

REDSUB__NAMESPACE_END
