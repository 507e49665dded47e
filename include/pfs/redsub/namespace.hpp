////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef REDSUB__NAMESPACE_NAME
#   define REDSUB__NAMESPACE_NAME redsub
#   define REDSUB__NAMESPACE_BEGIN namespace REDSUB__NAMESPACE_NAME {
#   define REDSUB__NAMESPACE_END }
#endif
