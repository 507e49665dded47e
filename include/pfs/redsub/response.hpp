////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.04 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "event.hpp"
#include "exports.hpp"
#include "namespace.hpp"
#include "resp/value.hpp"
#include <pfs/optional.hpp>

REDSUB__NAMESPACE_BEGIN

/**
 * Converts the server push @a v into the event.
 *
 * Expected responses (kind is case-insensitive):
 *      ["subscribe", channel, count]
 *      ["unsubscribe", channel, count]
 *      ["psubscribe", pattern, count]
 *      ["punsubscribe", pattern, count]
 *      ["message", channel, payload]
 *      ["pmessage", pattern, channel, payload]
 *
 * @return Event on success or @c nullopt on failure if @a perr is not @c nullptr.
 *
 * @throw redsub::error {errc::malformed_response} if @a v is not an array or
 *        its first element is not a string.
 * @throw redsub::error {errc::unknown_type} if kind is not one of the listed above.
 * @throw redsub::error {errc::invalid_channel, errc::invalid_pattern,
 *        errc::invalid_count, errc::invalid_payload} if the corresponding
 *        element is missing or has unexpected type.
 */
REDSUB__EXPORT pfs::optional<event> from_response (resp::value const & v, error * perr = nullptr);

REDSUB__NAMESPACE_END
