////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#if REDSUB__TRACE_ENABLED
#   include <pfs/log.hpp>
#   define REDSUB__TRACE(t, f, ...) {                                          \
        fmt::print(stdout, "[T] {}: " f "\n", t , ##__VA_ARGS__); fflush(stdout);}
#else // REDSUB__TRACE_ENABLED
#   define REDSUB__TRACE(t, f, ...)
#endif // !REDSUB__TRACE_ENABLED
