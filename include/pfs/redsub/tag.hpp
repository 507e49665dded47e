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

constexpr char const * REDSUB_TAG = "redsub";

REDSUB__NAMESPACE_END
