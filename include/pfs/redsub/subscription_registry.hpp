////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.04 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/synchronized.hpp>
#include <string>
#include <unordered_set>
#include <vector>

REDSUB__NAMESPACE_BEGIN

/**
 * Channels and patterns the user subscribed to. Replayed on every reconnection.
 */
class subscription_registry
{
    using set_type = std::unordered_set<std::string>;

private:
    pfs::synchronized<set_type> _channels;
    pfs::synchronized<set_type> _patterns;

public:
    subscription_registry () = default;
    subscription_registry (subscription_registry const &) = delete;
    subscription_registry & operator = (subscription_registry const &) = delete;

public:
    /**
     * @return @c true if @a channel was not in the registry.
     */
    REDSUB__EXPORT bool add_channel (std::string const & channel);

    /**
     * @return @c true if @a channel was in the registry.
     */
    REDSUB__EXPORT bool remove_channel (std::string const & channel);

    REDSUB__EXPORT bool add_pattern (std::string const & pattern);
    REDSUB__EXPORT bool remove_pattern (std::string const & pattern);

    REDSUB__EXPORT bool contains_channel (std::string const & channel) const;
    REDSUB__EXPORT bool contains_pattern (std::string const & pattern) const;

    /**
     * Snapshot of the channels in unspecified order.
     */
    REDSUB__EXPORT std::vector<std::string> channels () const;

    /**
     * Snapshot of the patterns in unspecified order.
     */
    REDSUB__EXPORT std::vector<std::string> patterns () const;

    /**
     * Total number of channels and patterns.
     */
    REDSUB__EXPORT std::size_t count () const;

    bool empty () const
    {
        return count() == 0;
    }
};

REDSUB__NAMESPACE_END
