////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/error.hpp>
#include <string>
#include <system_error>

REDSUB__NAMESPACE_BEGIN

using error_code = std::error_code;

enum class errc
{
      success = 0

    // Usage errors
    , not_subscribed       // Unsubscribe from the channel/pattern never subscribed
    , listener_busy        // Session already has an active listener
    , bad_address          // Server address is not in `host:port` form
    , bad_name             // Channel/pattern name can not be sent as inline command argument

    // Transport errors
    , resolve_error        // Host name resolution failure
    , socket_error
    , connection_refused
    , zero_bytes_read      // Peer closed the connection
    , read_timeout         // No data received within the read timeout
    , interrupted

    // Decode errors
    , encoding_error       // Received bytes are not valid UTF-8
    , protocol_error       // Bytes can never be parsed as a RESP value
    , malformed_response   // Response is not an array or its kind is not textual
    , unknown_type         // Response kind is not one of the pub/sub kinds
    , invalid_channel
    , invalid_pattern
    , invalid_count
    , invalid_payload
};

class error_category : public std::error_category
{
public:
    REDSUB__EXPORT virtual char const * name () const noexcept override;
    REDSUB__EXPORT virtual std::string message (int ev) const override;
};

inline std::error_category const & get_error_category ()
{
    static error_category instance;
    return instance;
}

inline std::error_code make_error_code (errc e)
{
    return std::error_code(static_cast<int>(e), get_error_category());
}

class error: public pfs::error
{
public:
    using pfs::error::error;
};

REDSUB__NAMESPACE_END
