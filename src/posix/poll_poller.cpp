////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/posix/poll_poller.hpp"
#include <pfs/i18n.hpp>
#include <algorithm>
#include <cerrno>

REDSUB__NAMESPACE_BEGIN

namespace posix {

poll_poller::poll_poller (short int observable_events)
    : oevents(observable_events)
{}

poll_poller::~poll_poller () = default;

void poll_poller::add_socket (socket_id sock)
{
    auto pos = std::find_if(events.begin(), events.end()
        , [& sock] (pollfd const & p) { return sock == p.fd;});

    // Already exists
    if (pos != events.end())
        return;

    events.push_back(pollfd{});
    auto & ev = events.back();
    ev.fd = sock;
    ev.revents = 0;
    ev.events = oevents;
}

int poll_poller::poll (std::chrono::milliseconds millis, error * perr)
{
    if (millis < std::chrono::milliseconds{0})
        millis = std::chrono::milliseconds{0};

    for (auto & ev: events)
        ev.revents = 0;

    auto n = ::poll(events.data(), static_cast<nfds_t>(events.size()), static_cast<int>(millis.count()));

    if (n < 0) {
        if (errno == EINTR) {
            // Is not a critical error, ignore it
            return 0;
        }

        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::_("poll failure")
            , pfs::system_error_text()
        });
    }

    return n;
}

} // namespace posix

REDSUB__NAMESPACE_END
