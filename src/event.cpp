////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.04 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/event.hpp"
#include <pfs/fmt.hpp>

REDSUB__NAMESPACE_BEGIN

std::string to_string (event const & ev)
{
    if (auto p = get_if<subscribed>(ev))
        return fmt::format("subscribed: channel={}, count={}", p->channel, p->count);

    if (auto p = get_if<unsubscribed>(ev))
        return fmt::format("unsubscribed: channel={}, count={}", p->channel, p->count);

    if (auto p = get_if<pattern_subscribed>(ev))
        return fmt::format("pattern subscribed: pattern={}, count={}", p->pattern, p->count);

    if (auto p = get_if<pattern_unsubscribed>(ev))
        return fmt::format("pattern unsubscribed: pattern={}, count={}", p->pattern, p->count);

    if (auto p = get_if<published>(ev))
        return fmt::format("message: channel={}, payload={}", p->channel, p->payload);

    if (auto p = get_if<pattern_published>(ev)) {
        return fmt::format("pattern message: pattern={}, channel={}, payload={}"
            , p->pattern, p->channel, p->payload);
    }

    if (auto p = get_if<connected>(ev))
        return fmt::format("connected: {}", to_string(p->saddr));

    if (auto p = get_if<disconnected>(ev))
        return fmt::format("disconnected: {}", p->cause.what());

    if (auto p = get_if<decode_error>(ev))
        return fmt::format("decode error: {}", p->cause.what());

    return std::string{};
}

REDSUB__NAMESPACE_END
