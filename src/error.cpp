////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.02 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/error.hpp"
#include <pfs/i18n.hpp>

REDSUB__NAMESPACE_BEGIN

char const * error_category::name () const noexcept
{
    return "redsub::category";
}

std::string error_category::message (int ev) const
{
    switch (static_cast<errc>(ev)) {
        case errc::success:
            return tr::_("no error");
        case errc::not_subscribed:
            return tr::_("not subscribed");
        case errc::listener_busy:
            return tr::_("session already has an active listener");
        case errc::bad_address:
            return tr::_("bad server address");
        case errc::bad_name:
            return tr::_("bad channel or pattern name");
        case errc::resolve_error:
            return tr::_("host name resolution failure");
        case errc::socket_error:
            return tr::_("socket error");
        case errc::connection_refused:
            return tr::_("connection refused");
        case errc::zero_bytes_read:
            return tr::_("zero bytes read: connection closed by peer");
        case errc::read_timeout:
            return tr::_("read timeout");
        case errc::interrupted:
            return tr::_("interrupted");
        case errc::encoding_error:
            return tr::_("invalid UTF-8 sequence");
        case errc::protocol_error:
            return tr::_("RESP protocol error");
        case errc::malformed_response:
            return tr::_("malformed response");
        case errc::unknown_type:
            return tr::_("unknown response type");
        case errc::invalid_channel:
            return tr::_("invalid channel");
        case errc::invalid_pattern:
            return tr::_("invalid pattern");
        case errc::invalid_count:
            return tr::_("invalid subscription count");
        case errc::invalid_payload:
            return tr::_("invalid message payload");

        default: return tr::_("unknown redsub error");
    }
}

REDSUB__NAMESPACE_END
