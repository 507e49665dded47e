////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "callback.hpp"
#include "command.hpp"
#include "error.hpp"
#include "event.hpp"
#include "exports.hpp"
#include "interruptable.hpp"
#include "listener.hpp"
#include "namespace.hpp"
#include "socket4_addr.hpp"
#include "subscription_registry.hpp"
#include "tag.hpp"
#include <pfs/log.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <utility>

REDSUB__NAMESPACE_BEGIN

/**
 * Subscription session to the Redis server. Keeps the subscriptions
 * and replays them on every reconnection.
 *
 * Subscription methods can be called from any thread, the listener
 * (see listen()) is driven by a single thread.
 */
class session: public interruptable
{
    friend class listener;

public:
    struct options
    {
        // Server address in form "host:port"
        std::string address;

        // Time limit for single connection attempt
        std::chrono::milliseconds connect_timeout {10000};

        // Connection considered broken if no data received during this time,
        // zero value disables the timeout
        std::chrono::milliseconds read_timeout {0};

        // Time limit for sending single command
        std::chrono::milliseconds write_timeout {10000};

        // Number of connection retries before the connection attempt is
        // considered failed and started from scratch
        int max_connect_retries {8};

        // Backoff delay is min(retry^2, backoff_limit) * backoff_unit + jitter
        std::chrono::milliseconds backoff_unit {1000};
        int backoff_limit {64};

        // Jitter is uniformly distributed in range [0, max_jitter)
        std::chrono::milliseconds max_jitter {1000};

        std::size_t read_buffer_size {64 * 1024};

        // Period of checking the interruption while waiting
        std::chrono::milliseconds poll_interval {100};
    };

private:
    options _opts;
    server_addr _server_addr;
    subscription_registry _registry;

    // Serializes registry changes and replay with the corresponding commands
    std::mutex _subscription_mtx;

    // Socket owned by the active listener, null if disconnected
    mutable std::mutex _writer_mtx;
    posix::tcp_socket * _writer {nullptr};

    std::atomic_bool _listening {false};

private:
    callback_t<void (std::string const &)> _on_warn
        = [] (std::string const & msg) { LOGW(REDSUB_TAG, "{}", msg); };

    callback_t<void (std::string const &)> _on_debug
        = [] (std::string const & msg) { LOGD(REDSUB_TAG, "{}", msg); };

public:
    /**
     * Constructs session with default options.
     *
     * @throw redsub::error {errc::bad_address} if @a address is not in form "host:port".
     */
    REDSUB__EXPORT explicit session (std::string const & address);

    /**
     * @throw redsub::error {errc::bad_address} if @a opts.address is not in form "host:port".
     */
    REDSUB__EXPORT explicit session (options opts);

    session (session const &) = delete;
    session (session &&) = delete;
    session & operator = (session const &) = delete;
    session & operator = (session &&) = delete;

    REDSUB__EXPORT ~session ();

public: // Set callbacks
    /**
     * Sets warning callback (connection failures, resubscription failures).
     *
     * @details Callback @a f signature must match:
     *          void (std::string const &)
     */
    template <typename F>
    session & on_warn (F && f)
    {
        _on_warn = std::forward<F>(f);
        return *this;
    }

    /**
     * Sets debug callback (sent commands, connection steps).
     *
     * @details Callback @a f signature must match:
     *          void (std::string const &)
     */
    template <typename F>
    session & on_debug (F && f)
    {
        _on_debug = std::forward<F>(f);
        return *this;
    }

public:
    server_addr const & address () const noexcept
    {
        return _server_addr;
    }

    options const & opts () const noexcept
    {
        return _opts;
    }

    subscription_registry const & registry () const noexcept
    {
        return _registry;
    }

    /**
     * Checks if the session has a live connection.
     */
    REDSUB__EXPORT bool is_connected () const;

    /**
     * Subscribes to @a channel. Subscription is stored and the command is
     * sent immediately if connected, or on the next connection otherwise.
     *
     * @return @c false if @a channel is not a valid name (errc::bad_name)
     *         or sending the command failed (errc::socket_error), and @a perr
     *         is not @c nullptr. On send failure the subscription is stored
     *         anyway and the connection is reset to replay it.
     */
    REDSUB__EXPORT bool subscribe (std::string const & channel, error * perr = nullptr);

    /**
     * Unsubscribes from @a channel.
     *
     * @return @c false if @a channel is not subscribed (errc::not_subscribed),
     *         is not a valid name (errc::bad_name) or sending the command
     *         failed, and @a perr is not @c nullptr.
     */
    REDSUB__EXPORT bool unsubscribe (std::string const & channel, error * perr = nullptr);

    REDSUB__EXPORT bool psubscribe (std::string const & pattern, error * perr = nullptr);
    REDSUB__EXPORT bool punsubscribe (std::string const & pattern, error * perr = nullptr);

    /**
     * Starts listening. Connection is established by the first call of
     * listener::next().
     *
     * @throw redsub::error {errc::listener_busy} if the session already has
     *        an active listener.
     */
    REDSUB__EXPORT listener listen ();

    /**
     * Listens and calls @a f for each event until interrupted.
     *
     * @details Callback @a f signature must match:
     *          void (event &&)
     */
    template <typename F>
    void run (F && f)
    {
        auto l = listen();

        for (;;) {
            auto ev = l.next();

            if (!ev)
                break;

            f(std::move(*ev));
        }
    }

private:
    bool check_name (std::string const & name, error * perr);
    bool send_command (command const & cmd, error * perr);
    bool write_command (command const & cmd, error & err);
    void set_writer (posix::tcp_socket * writer);
};

REDSUB__NAMESPACE_END
