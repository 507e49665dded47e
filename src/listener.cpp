////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/listener.hpp"
#include "pfs/redsub/response.hpp"
#include "pfs/redsub/session.hpp"
#include "pfs/redsub/tag.hpp"
#include "pfs/redsub/trace.hpp"
#include "pfs/redsub/posix/poll_poller.hpp"
#include <pfs/assert.hpp>
#include <pfs/countdown_timer.hpp>
#include <pfs/i18n.hpp>
#include <algorithm>
#include <mutex>
#include <thread>

REDSUB__NAMESPACE_BEGIN

using std::chrono::milliseconds;

listener::listener (session * s)
    : interruptable()
    , _session(s)
    , _read_buffer(s->_opts.read_buffer_size)
    , _rng(std::random_device{}())
{
    init_callbacks();
}

listener::listener (listener && other)
    : interruptable()
    , _session(other._session)
    , _state(other._state)
    , _socket(std::move(other._socket))
    , _decoder(std::move(other._decoder))
    , _queue(std::move(other._queue))
    , _read_buffer(std::move(other._read_buffer))
    , _rng(other._rng)
    , _last_read(other._last_read)
{
    if (other.interrupted())
        interrupt();

    other._session = nullptr;
    other._state = state_enum::disconnected;

    init_callbacks();

    // Writer must refer to the socket owned by this instance
    if (_session != nullptr
            && (_state == state_enum::resubscribing || _state == state_enum::streaming)) {
        _session->set_writer(& _socket);
    }
}

listener::~listener ()
{
    if (_session != nullptr) {
        drop_connection();
        _session->_listening.store(false);
    }
}

void listener::init_callbacks ()
{
    _decoder.on_value = [this] (resp::value && v) {
        error err;
        auto ev = from_response(v, & err);

        if (ev) {
            _queue.push_back(std::move(*ev));
        } else {
            _session->_on_debug(tr::f_("bad response: {}: {}", resp::to_string(v), err.what()));
            _queue.push_back(decode_error{std::move(err)});
        }
    };

    _decoder.on_failure = [this] (error const & err) {
        _session->_on_warn(tr::f_("input data discarded: {}", err.what()));
        _queue.push_back(decode_error{err});
    };
}

bool listener::cancelled () const
{
    return interrupted() || (_session != nullptr && _session->interrupted());
}

milliseconds listener::backoff_delay (int retry) const
{
    auto const & opts = _session->_opts;
    auto units = static_cast<std::int64_t>(retry) * retry;

    units = (std::min)(units, static_cast<std::int64_t>(opts.backoff_limit));

    return milliseconds{opts.backoff_unit.count() * units};
}

bool listener::sleep_for (milliseconds timeout)
{
    pfs::countdown_timer<std::milli> timer {timeout};

    while (timer.remain_count() > 0) {
        if (cancelled())
            return false;

        auto slice = (std::min)(_session->_opts.poll_interval
            , std::chrono::duration_cast<milliseconds>(timer.remain()));

        std::this_thread::sleep_for(slice);
    }

    return !cancelled();
}

bool listener::connect_to (socket4_addr const & saddr, error * perr)
{
    auto const & opts = _session->_opts;
    posix::tcp_socket sock;

    auto status = sock.connect(saddr, perr);

    if (status == conn_status::connecting) {
        posix::poll_poller poller {POLLOUT};
        pfs::countdown_timer<std::milli> timer {opts.connect_timeout};

        poller.add_socket(sock.id());

        while (status == conn_status::connecting) {
            if (cancelled()) {
                pfs::throw_or(perr, error {
                      make_error_code(errc::interrupted)
                    , tr::f_("connection interrupted: {}", to_string(saddr))
                });

                return false;
            }

            if (timer.remain_count() == 0) {
                pfs::throw_or(perr, error {
                      make_error_code(errc::socket_error)
                    , tr::f_("connection timed out: {}", to_string(saddr))
                });

                return false;
            }

            auto timeout = (std::min)(opts.poll_interval
                , std::chrono::duration_cast<milliseconds>(timer.remain()));

            auto n = poller.poll(timeout, perr);

            if (n < 0)
                return false;

            if (n > 0)
                status = sock.check_connection(perr);
        }
    }

    switch (status) {
        case conn_status::connected:
            REDSUB__TRACE(REDSUB_TAG, "socket #{} connected to {}", sock.id(), to_string(saddr));
            _socket = std::move(sock);
            return true;

        case conn_status::refused:
            pfs::throw_or(perr, error {
                  make_error_code(errc::connection_refused)
                , tr::f_("connection refused: {}", to_string(saddr))
            });
            break;

        case conn_status::unreachable:
            pfs::throw_or(perr, error {
                  make_error_code(errc::socket_error)
                , tr::f_("server unreachable: {}", to_string(saddr))
            });
            break;

        default:
            // Error already reported
            break;
    }

    return false;
}

bool listener::connect ()
{
    auto const & opts = _session->_opts;
    int retry = 0;

    for (;;) {
        if (cancelled())
            return false;

        error err;
        auto saddrs = _session->_server_addr.resolve(& err);

        for (auto const & saddr: saddrs) {
            if (connect_to(saddr, & err)) {
                _session->_on_debug(tr::f_("connected to server: {} ({})"
                    , to_string(_session->_server_addr), to_string(saddr)));
                return true;
            }

            if (cancelled())
                return false;
        }

        if (retry >= opts.max_connect_retries) {
            _session->_on_warn(tr::f_("failed to connect to server: {}: {}"
                , to_string(_session->_server_addr), err.what()));
            return false;
        }

        ++retry;

        auto delay = backoff_delay(retry);

        if (opts.max_jitter.count() > 0) {
            std::uniform_int_distribution<std::int64_t> jitter {0
                , static_cast<std::int64_t>(opts.max_jitter.count()) - 1};
            delay += milliseconds{jitter(_rng)};
        }

        _session->_on_debug(tr::f_("connection failure: {}: {}; retry #{} in {} ms"
            , to_string(_session->_server_addr), err.what(), retry, delay.count()));

        if (!sleep_for(delay))
            return false;
    }
}

bool listener::resubscribe ()
{
    std::lock_guard<std::mutex> locker {_session->_subscription_mtx};

    _session->set_writer(& _socket);

    for (auto const & channel: _session->_registry.channels()) {
        error err;

        if (!_session->send_command(command{command_type::subscribe, channel}, & err)) {
            _session->_on_warn(tr::f_("failed to subscribe to stored channels on connection"
                ", trying connection again: {}", err.what()));
            return false;
        }
    }

    for (auto const & pattern: _session->_registry.patterns()) {
        error err;

        if (!_session->send_command(command{command_type::psubscribe, pattern}, & err)) {
            _session->_on_warn(tr::f_("failed to subscribe to stored patterns on connection"
                ", trying connection again: {}", err.what()));
            return false;
        }
    }

    return true;
}

void listener::step_streaming ()
{
    auto const & opts = _session->_opts;
    posix::poll_poller poller {POLLIN};
    error err;

    poller.add_socket(_socket.id());

    auto n = poller.poll(opts.poll_interval, & err);

    if (n < 0) {
        disconnect(std::move(err));
        return;
    }

    if (n == 0) {
        if (opts.read_timeout > milliseconds{0}
                && std::chrono::steady_clock::now() - _last_read >= opts.read_timeout) {
            disconnect(error {
                  make_error_code(errc::read_timeout)
                , tr::f_("no data received within {} ms from {}"
                    , opts.read_timeout.count(), to_string(_socket.saddr()))
            });
        }

        return;
    }

    auto rc = _socket.recv(_read_buffer.data(), static_cast<std::streamsize>(_read_buffer.size()), & err);

    if (rc > 0) {
        _last_read = std::chrono::steady_clock::now();
        _decoder.process_input(_read_buffer.data(), static_cast<std::size_t>(rc));
        return;
    }

    if (rc == 0) {
        disconnect(error {
              make_error_code(errc::zero_bytes_read)
            , tr::f_("connection closed by server: {}", to_string(_socket.saddr()))
        });

        return;
    }

    // No data available otherwise
    if (err)
        disconnect(std::move(err));
}

void listener::drop_connection ()
{
    _session->set_writer(nullptr);
    _socket.close();
}

void listener::disconnect (error && cause)
{
    drop_connection();
    _session->_on_debug(tr::f_("disconnected from server: {}: {}"
        , to_string(_session->_server_addr), cause.what()));
    _queue.push_back(disconnected{std::move(cause)});
    _state = state_enum::connecting;
}

pfs::optional<event> listener::next ()
{
    PFS__THROW_UNEXPECTED(_session != nullptr, "Listener is moved");

    for (;;) {
        if (cancelled()) {
            // Keep `disconnected` before the next `connected`
            if (_state == state_enum::streaming) {
                disconnect(error {
                      make_error_code(errc::interrupted)
                    , tr::_("listener interrupted")
                });
            } else {
                drop_connection();
            }

            _state = state_enum::disconnected;
            return pfs::nullopt;
        }

        if (!_queue.empty()) {
            event ev = std::move(_queue.front());
            _queue.pop_front();
            return ev;
        }

        switch (_state) {
            case state_enum::disconnected:
            case state_enum::connecting:
                _state = state_enum::connecting;

                if (connect())
                    _state = state_enum::resubscribing;

                break;

            case state_enum::resubscribing:
                if (resubscribe()) {
                    _decoder.reset();
                    _last_read = std::chrono::steady_clock::now();
                    _queue.push_back(connected{_socket.saddr()});
                    _state = state_enum::streaming;
                } else {
                    drop_connection();
                    _state = state_enum::connecting;
                }

                break;

            case state_enum::streaming:
                step_streaming();
                break;
        }
    }
}

REDSUB__NAMESPACE_END
