////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <atomic>

REDSUB__NAMESPACE_BEGIN

class interruptable
{
private:
    std::atomic_bool _interrupted {false};

public:
    void interrupt ()
    {
        _interrupted.store(true);
    }

    bool interrupted () const noexcept
    {
        return _interrupted.load();
    }

    void clear_interrupted ()
    {
        _interrupted.store(false);
    }
};

REDSUB__NAMESPACE_END
