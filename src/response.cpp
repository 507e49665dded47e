////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.04 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/response.hpp"
#include <pfs/i18n.hpp>
#include <algorithm>
#include <cctype>

REDSUB__NAMESPACE_BEGIN

namespace {

class field_reader
{
    std::vector<resp::value> const & _items;
    std::string const & _kind;

public:
    field_reader (std::vector<resp::value> const & items, std::string const & kind)
        : _items(items)
        , _kind(kind)
    {}

public:
    bool text (std::size_t index, errc ec, char const * name, std::string & result, error * perr
        , bool null_as_empty = false) const
    {
        if (index < _items.size()) {
            auto const & item = _items[index];

            if (item.is_text()) {
                result = item.text();
                return true;
            }

            if (null_as_empty && item.is_null()) {
                result.clear();
                return true;
            }
        }

        return fail(index, ec, name, perr);
    }

    bool integer (std::size_t index, errc ec, char const * name, std::int64_t & result, error * perr) const
    {
        if (index < _items.size() && _items[index].is_integer()) {
            result = _items[index].integer();
            return true;
        }

        return fail(index, ec, name, perr);
    }

private:
    bool fail (std::size_t index, errc ec, char const * name, error * perr) const
    {
        if (index < _items.size()) {
            pfs::throw_or(perr, error {
                  make_error_code(ec)
                , tr::f_("'{}' response: {} expected at position {}, got {}"
                    , _kind, name, index, resp::to_string(_items[index].type()))
            });
        } else {
            pfs::throw_or(perr, error {
                  make_error_code(ec)
                , tr::f_("'{}' response: {} is missing at position {}", _kind, name, index)
            });
        }

        return false;
    }
};

} // namespace

pfs::optional<event> from_response (resp::value const & v, error * perr)
{
    if (!v.is_array()) {
        pfs::throw_or(perr, error {
              make_error_code(errc::malformed_response)
            , tr::f_("array expected, got {}", resp::to_string(v.type()))
        });

        return pfs::nullopt;
    }

    auto const & items = v.items();

    if (items.empty() || !items[0].is_text()) {
        pfs::throw_or(perr, error {
              make_error_code(errc::malformed_response)
            , items.empty()
                ? tr::_("response kind is missing")
                : tr::f_("response kind must be a string, got {}", resp::to_string(items[0].type()))
        });

        return pfs::nullopt;
    }

    std::string kind = items[0].text();

    std::transform(kind.begin(), kind.end(), kind.begin(), [] (char ch) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    });

    field_reader in {items, kind};

    if (kind == "message") {
        published ev;

        if (!in.text(1, errc::invalid_channel, "channel", ev.channel, perr))
            return pfs::nullopt;

        if (!in.text(2, errc::invalid_payload, "payload", ev.payload, perr))
            return pfs::nullopt;

        return event{std::move(ev)};
    }

    if (kind == "pmessage") {
        pattern_published ev;

        if (!in.text(1, errc::invalid_pattern, "pattern", ev.pattern, perr))
            return pfs::nullopt;

        if (!in.text(2, errc::invalid_channel, "channel", ev.channel, perr))
            return pfs::nullopt;

        if (!in.text(3, errc::invalid_payload, "payload", ev.payload, perr))
            return pfs::nullopt;

        return event{std::move(ev)};
    }

    if (kind == "subscribe") {
        subscribed ev;

        if (!in.text(1, errc::invalid_channel, "channel", ev.channel, perr))
            return pfs::nullopt;

        if (!in.integer(2, errc::invalid_count, "count", ev.count, perr))
            return pfs::nullopt;

        return event{std::move(ev)};
    }

    if (kind == "unsubscribe") {
        unsubscribed ev;

        // Server replies with null channel when unsubscribing with no subscriptions left
        if (!in.text(1, errc::invalid_channel, "channel", ev.channel, perr, true))
            return pfs::nullopt;

        if (!in.integer(2, errc::invalid_count, "count", ev.count, perr))
            return pfs::nullopt;

        return event{std::move(ev)};
    }

    if (kind == "psubscribe") {
        pattern_subscribed ev;

        if (!in.text(1, errc::invalid_pattern, "pattern", ev.pattern, perr))
            return pfs::nullopt;

        if (!in.integer(2, errc::invalid_count, "count", ev.count, perr))
            return pfs::nullopt;

        return event{std::move(ev)};
    }

    if (kind == "punsubscribe") {
        pattern_unsubscribed ev;

        if (!in.text(1, errc::invalid_pattern, "pattern", ev.pattern, perr, true))
            return pfs::nullopt;

        if (!in.integer(2, errc::invalid_count, "count", ev.count, perr))
            return pfs::nullopt;

        return event{std::move(ev)};
    }

    pfs::throw_or(perr, error {
          make_error_code(errc::unknown_type)
        , tr::f_("unknown response type: {}", items[0].text())
    });

    return pfs::nullopt;
}

REDSUB__NAMESPACE_END
