////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#ifndef REDSUB__STATIC
#   ifndef REDSUB__EXPORT
#       if _MSC_VER
#           if defined(REDSUB__EXPORTS)
#               define REDSUB__EXPORT __declspec(dllexport)
#           else
#               define REDSUB__EXPORT __declspec(dllimport)
#           endif
#       else
#           define REDSUB__EXPORT
#       endif
#   endif
#else
#   define REDSUB__EXPORT
#endif // !REDSUB__STATIC
