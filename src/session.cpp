////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/session.hpp"
#include "pfs/redsub/posix/poll_poller.hpp"
#include <pfs/countdown_timer.hpp>
#include <pfs/i18n.hpp>
#include <algorithm>

REDSUB__NAMESPACE_BEGIN

session::session (std::string const & address)
    : session(options{address})
{}

session::session (options opts)
    : interruptable()
    , _opts(std::move(opts))
{
    auto saddr = server_addr::parse(_opts.address);

    if (!saddr) {
        throw error {
              make_error_code(errc::bad_address)
            , tr::f_("expected `host:port`, got: {}", _opts.address)
        };
    }

    _server_addr = std::move(*saddr);

    if (_opts.read_buffer_size == 0)
        _opts.read_buffer_size = 64 * 1024;

    if (_opts.poll_interval <= std::chrono::milliseconds{0})
        _opts.poll_interval = std::chrono::milliseconds{1};
}

session::~session () = default;

bool session::is_connected () const
{
    std::lock_guard<std::mutex> locker {_writer_mtx};
    return _writer != nullptr;
}

bool session::check_name (std::string const & name, error * perr)
{
    if (!is_valid_name(name)) {
        pfs::throw_or(perr, error {
              make_error_code(errc::bad_name)
            , tr::f_("name must be non-empty and must not contain whitespaces or quotes: \"{}\"", name)
        });

        return false;
    }

    return true;
}

bool session::subscribe (std::string const & channel, error * perr)
{
    if (!check_name(channel, perr))
        return false;

    std::lock_guard<std::mutex> locker {_subscription_mtx};
    _registry.add_channel(channel);
    return send_command(command{command_type::subscribe, channel}, perr);
}

bool session::unsubscribe (std::string const & channel, error * perr)
{
    if (!check_name(channel, perr))
        return false;

    std::lock_guard<std::mutex> locker {_subscription_mtx};

    if (!_registry.remove_channel(channel)) {
        pfs::throw_or(perr, error {
              make_error_code(errc::not_subscribed)
            , tr::f_("channel is not subscribed: {}", channel)
        });

        return false;
    }

    return send_command(command{command_type::unsubscribe, channel}, perr);
}

bool session::psubscribe (std::string const & pattern, error * perr)
{
    if (!check_name(pattern, perr))
        return false;

    std::lock_guard<std::mutex> locker {_subscription_mtx};
    _registry.add_pattern(pattern);
    return send_command(command{command_type::psubscribe, pattern}, perr);
}

bool session::punsubscribe (std::string const & pattern, error * perr)
{
    if (!check_name(pattern, perr))
        return false;

    std::lock_guard<std::mutex> locker {_subscription_mtx};

    if (!_registry.remove_pattern(pattern)) {
        pfs::throw_or(perr, error {
              make_error_code(errc::not_subscribed)
            , tr::f_("pattern is not subscribed: {}", pattern)
        });

        return false;
    }

    return send_command(command{command_type::punsubscribe, pattern}, perr);
}

listener session::listen ()
{
    bool expected = false;

    if (!_listening.compare_exchange_strong(expected, true)) {
        throw error {
              make_error_code(errc::listener_busy)
            , tr::f_("session already has an active listener: {}", to_string(_server_addr))
        };
    }

    return listener{this};
}

bool session::send_command (command const & cmd, error * perr)
{
    std::lock_guard<std::mutex> locker {_writer_mtx};

    if (_writer == nullptr) {
        _on_debug(tr::f_("not connected, command deferred: {} {}", verb(cmd.type), cmd.name));
        return true;
    }

    error err;

    if (!write_command(cmd, err)) {
        // Command may be partially written, the stream is no longer usable.
        // Listener detects the shutdown, reconnects and replays the registry.
        error shutdown_err;
        _writer->disconnect(& shutdown_err);

        if (shutdown_err)
            _on_warn(tr::f_("connection shutdown failure: {}", shutdown_err.what()));

        pfs::throw_or(perr, std::move(err));
        return false;
    }

    _on_debug(tr::f_("command sent: {} {}", verb(cmd.type), cmd.name));
    return true;
}

bool session::write_command (command const & cmd, error & err)
{
    auto data = cmd.to_string();
    char const * p = data.data();
    auto remain = static_cast<std::streamsize>(data.size());

    pfs::countdown_timer<std::milli> timer {_opts.write_timeout};
    posix::poll_poller poller {POLLOUT};
    poller.add_socket(_writer->id());

    while (remain > 0) {
        auto res = _writer->send(p, remain, & err);

        switch (res.state) {
            case send_status::good:
                remain = 0;
                break;

            case send_status::again:
            case send_status::overflow: {
                p += res.n;
                remain -= res.n;

                if (timer.remain_count() == 0) {
                    err = error {
                          make_error_code(errc::socket_error)
                        , tr::f_("send timeout: {} {}", verb(cmd.type), cmd.name)
                    };

                    return false;
                }

                auto timeout = (std::min)(_opts.poll_interval
                    , std::chrono::duration_cast<std::chrono::milliseconds>(timer.remain()));

                if (poller.poll(timeout, & err) < 0)
                    return false;

                break;
            }

            case send_status::network:
            case send_status::failure:
            default:
                // Error already set by send()
                return false;
        }
    }

    return true;
}

void session::set_writer (posix::tcp_socket * writer)
{
    std::lock_guard<std::mutex> locker {_writer_mtx};
    _writer = writer;
}

REDSUB__NAMESPACE_END
