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

REDSUB__NAMESPACE_BEGIN

enum class conn_status {
      failure     = -1
    , unreachable = -2
    , refused     = -3
    , connected   =  0
    , connecting  =  1
};

REDSUB__NAMESPACE_END
