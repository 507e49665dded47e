////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.04 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "exports.hpp"
#include "namespace.hpp"
#include "socket4_addr.hpp"
#include <pfs/variant.hpp>
#include <cstdint>
#include <string>

REDSUB__NAMESPACE_BEGIN

/**
 * Subscription to the channel acknowledged by the server.
 */
struct subscribed
{
    std::string channel;
    std::int64_t count; // Number of active subscriptions of the connection
};

struct unsubscribed
{
    std::string channel;
    std::int64_t count;
};

struct pattern_subscribed
{
    std::string pattern;
    std::int64_t count;
};

struct pattern_unsubscribed
{
    std::string pattern;
    std::int64_t count;
};

/**
 * Message published to the subscribed channel.
 */
struct published
{
    std::string channel;
    std::string payload;
};

/**
 * Message published to the channel matching the subscribed pattern.
 */
struct pattern_published
{
    std::string pattern;
    std::string channel;
    std::string payload;
};

/**
 * Connection established and all subscriptions replayed.
 */
struct connected
{
    socket4_addr saddr;
};

struct disconnected
{
    error cause;
};

/**
 * Received fragment can not be decoded or mapped. The stream continues.
 */
struct decode_error
{
    error cause;
};

using event = pfs::variant<
      subscribed
    , unsubscribed
    , pattern_subscribed
    , pattern_unsubscribed
    , published
    , pattern_published
    , connected
    , disconnected
    , decode_error>;

template <typename T>
inline bool is (event const & ev)
{
    return pfs::get_if<T>(& ev) != nullptr;
}

template <typename T>
inline T const * get_if (event const & ev)
{
    return pfs::get_if<T>(& ev);
}

REDSUB__EXPORT std::string to_string (event const & ev);

REDSUB__NAMESPACE_END
