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
#include <cstdint>

REDSUB__NAMESPACE_BEGIN

enum class send_status {
      failure   = -1
    , good      =  0
    , again     =  1
    , overflow  =  2

    // Connection reset by peer (ECONNRESET)
    // Broken pipe (EPIPE)
    , network   =  3
};

struct send_result
{
    send_status state;
    std::int64_t n; // Bytes sent before the status was detected
};

REDSUB__NAMESPACE_END
