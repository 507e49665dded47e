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
#include <functional>

REDSUB__NAMESPACE_BEGIN

template <typename T>
using callback_t = std::function<T>;

REDSUB__NAMESPACE_END
