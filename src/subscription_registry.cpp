////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.04 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/subscription_registry.hpp"

REDSUB__NAMESPACE_BEGIN

bool subscription_registry::add_channel (std::string const & channel)
{
    return _channels.wlock()->insert(channel).second;
}

bool subscription_registry::remove_channel (std::string const & channel)
{
    return _channels.wlock()->erase(channel) > 0;
}

bool subscription_registry::add_pattern (std::string const & pattern)
{
    return _patterns.wlock()->insert(pattern).second;
}

bool subscription_registry::remove_pattern (std::string const & pattern)
{
    return _patterns.wlock()->erase(pattern) > 0;
}

bool subscription_registry::contains_channel (std::string const & channel) const
{
    auto locked = _channels.rlock();
    return locked->find(channel) != locked->end();
}

bool subscription_registry::contains_pattern (std::string const & pattern) const
{
    auto locked = _patterns.rlock();
    return locked->find(pattern) != locked->end();
}

std::vector<std::string> subscription_registry::channels () const
{
    auto locked = _channels.rlock();
    return std::vector<std::string>(locked->begin(), locked->end());
}

std::vector<std::string> subscription_registry::patterns () const
{
    auto locked = _patterns.rlock();
    return std::vector<std::string>(locked->begin(), locked->end());
}

std::size_t subscription_registry::count () const
{
    return _channels.rlock()->size() + _patterns.rlock()->size();
}

REDSUB__NAMESPACE_END
