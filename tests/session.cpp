////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.06 Initial version.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "tools.hpp"
#include "pfs/redsub/resp/value.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>

using redsub::resp::value;
using std::chrono::milliseconds;

static constexpr char const * TAG = "session-test";

static redsub::session::options make_options (std::uint16_t port)
{
    redsub::session::options opts;
    opts.address = "127.0.0.1:" + std::to_string(port);
    opts.connect_timeout = milliseconds{1000};
    opts.backoff_unit = milliseconds{10};
    opts.max_jitter = milliseconds{0};
    opts.poll_interval = milliseconds{10};
    return opts;
}

static std::string push (std::initializer_list<char const *> items)
{
    std::vector<value> values;

    for (auto s: items)
        values.push_back(value::make_bulk(s));

    return redsub::resp::encode(value::make_array(std::move(values)));
}

static std::string ack (char const * kind, char const * name, std::int64_t count)
{
    return redsub::resp::encode(value::make_array({
          value::make_bulk(kind)
        , value::make_bulk(name)
        , value::make_integer(count)
    }));
}

// Last command sent for every name
static std::map<std::string, std::string> last_commands (std::string const & received)
{
    std::map<std::string, std::string> result;
    std::size_t pos = 0;

    for (auto eol = received.find("\r\n"); eol != std::string::npos; eol = received.find("\r\n", pos)) {
        auto line = received.substr(pos, eol - pos);
        auto space = line.find(' ');

        if (space != std::string::npos)
            result[line.substr(space + 1)] = line.substr(0, space);

        pos = eol + 2;
    }

    return result;
}

static bool replayed (std::string const & received)
{
    return tools::count_occurrences(received, "SUBSCRIBE a\r\n") >= 1
        && tools::count_occurrences(received, "SUBSCRIBE b\r\n") >= 1
        && tools::count_occurrences(received, "PSUBSCRIBE p.*\r\n") >= 1;
}

static bool replayed_exactly_once (std::string const & received)
{
    // "PSUBSCRIBE p.*" does not contain "SUBSCRIBE a" or "SUBSCRIBE b"
    auto pattern_pos = received.find("PSUBSCRIBE p.*\r\n");

    return tools::count_occurrences(received, "SUBSCRIBE a\r\n") == 1
        && tools::count_occurrences(received, "SUBSCRIBE b\r\n") == 1
        && tools::count_occurrences(received, "PSUBSCRIBE p.*\r\n") == 1
        && received.find("SUBSCRIBE a\r\n") < pattern_pos // channels before patterns
        && received.find("SUBSCRIBE b\r\n") < pattern_pos
        && received.size() == std::string{"SUBSCRIBE a\r\nSUBSCRIBE b\r\nPSUBSCRIBE p.*\r\n"}.size();
}

TEST_CASE("bad address") {
    CHECK_THROWS_AS(redsub::session{"localhost"}, redsub::error);
    CHECK_THROWS_AS(redsub::session{"localhost:"}, redsub::error);
    CHECK_THROWS_AS(redsub::session{":6379"}, redsub::error);

    try {
        redsub::session s {"localhost:port"};
        CHECK(false);
    } catch (redsub::error const & ex) {
        CHECK_EQ(ex.code(), make_error_code(redsub::errc::bad_address));
    }

    redsub::session s {"localhost:6379"};

    CHECK_EQ(s.address().host, std::string{"localhost"});
    CHECK_EQ(s.address().port, 6379);
}

TEST_CASE("subscriptions without connection") {
    redsub::session s {"127.0.0.1:42401"};
    redsub::error err;

    CHECK_FALSE(s.is_connected());

    CHECK_FALSE(s.unsubscribe("x", & err));
    CHECK_EQ(err.code(), make_error_code(redsub::errc::not_subscribed));
    CHECK_THROWS_AS(s.punsubscribe("x"), redsub::error);

    // Deferred until connected
    CHECK(s.subscribe("a"));
    CHECK(s.psubscribe("a.*"));
    CHECK(s.registry().contains_channel("a"));
    CHECK(s.registry().contains_pattern("a.*"));
    CHECK_FALSE(s.registry().contains_pattern("a"));

    CHECK(s.unsubscribe("a"));
    CHECK(s.punsubscribe("a.*"));
    CHECK(s.registry().empty());

    // Names that can not be sent as a single inline argument
    CHECK_FALSE(s.subscribe("a\r\nFLUSHALL", & err));
    CHECK_EQ(err.code(), make_error_code(redsub::errc::bad_name));
    CHECK_FALSE(s.psubscribe("", & err));
    CHECK_EQ(err.code(), make_error_code(redsub::errc::bad_name));
    CHECK_FALSE(s.unsubscribe("a b", & err));
    CHECK_EQ(err.code(), make_error_code(redsub::errc::bad_name));
    CHECK_THROWS_AS(s.punsubscribe("\"a\""), redsub::error);
    CHECK(s.registry().empty());
}

TEST_CASE("single listener") {
    redsub::session s {"127.0.0.1:42402"};

    {
        auto l = s.listen();

        try {
            s.listen();
            CHECK(false);
        } catch (redsub::error const & ex) {
            CHECK_EQ(ex.code(), make_error_code(redsub::errc::listener_busy));
        }

        CHECK(l.backoff_delay(1) == milliseconds{1000});
        CHECK(l.backoff_delay(2) == milliseconds{4000});
        CHECK(l.backoff_delay(7) == milliseconds{49000});
        CHECK(l.backoff_delay(8) == milliseconds{64000});
        CHECK(l.backoff_delay(9) == milliseconds{64000});
    }

    // Listener released
    CHECK_NOTHROW(s.listen());
}

TEST_CASE("interrupted listener returns no event") {
    redsub::session s {"127.0.0.1:42403"};
    auto l = s.listen();

    l.interrupt();
    CHECK_FALSE(l.next());

    l.clear_interrupted();
    s.interrupt();
    CHECK_FALSE(l.next());
}

TEST_CASE("replay, events and reconnection") {
    std::uint16_t const port = 42404;
    tools::fake_server server {port};
    redsub::session s {make_options(port)};

    REQUIRE(s.subscribe("a"));
    REQUIRE(s.subscribe("b"));
    REQUIRE(s.psubscribe("p.*"));

    tools::session_runner runner {s};

    REQUIRE(server.accept());
    REQUIRE(server.wait_received(replayed));
    CHECK(replayed_exactly_once(server.received()));

    REQUIRE(runner.wait_events(1));
    CHECK(redsub::is<redsub::connected>(runner.events()[0]));
    CHECK_EQ(redsub::get_if<redsub::connected>(runner.events()[0])->saddr
        , redsub::socket4_addr{redsub::inet4_addr{127, 0, 0, 1}, port});
    CHECK(s.is_connected());

    // Acknowledgements, messages and a push of unknown type, split into two writes
    std::string data = ack("subscribe", "a", 1)
        + ack("subscribe", "b", 2)
        + ack("psubscribe", "p.*", 3)
        + push({"message", "a", "hello"})
        + push({"foobar", "a", "x"})
        + push({"pmessage", "p.*", "p.1", "world"});

    server.send(data.substr(0, 40));
    tools::sleep_ms(50);
    server.send(data.substr(40));

    REQUIRE(runner.wait_events(7));

    auto events = runner.events();

    CHECK(redsub::is<redsub::subscribed>(events[1]));
    CHECK(redsub::is<redsub::subscribed>(events[2]));
    CHECK_EQ(redsub::get_if<redsub::subscribed>(events[2])->count, 2);
    CHECK(redsub::is<redsub::pattern_subscribed>(events[3]));
    REQUIRE(redsub::is<redsub::published>(events[4]));
    CHECK_EQ(redsub::get_if<redsub::published>(events[4])->payload, std::string{"hello"});
    REQUIRE(redsub::is<redsub::decode_error>(events[5]));
    CHECK_EQ(redsub::get_if<redsub::decode_error>(events[5])->cause.code()
        , make_error_code(redsub::errc::unknown_type));
    REQUIRE(redsub::is<redsub::pattern_published>(events[6]));
    CHECK_EQ(redsub::get_if<redsub::pattern_published>(events[6])->channel, std::string{"p.1"});

    // Live commands
    server.clear_received();

    redsub::error err;

    CHECK(s.subscribe("c"));
    CHECK_FALSE(s.unsubscribe("never", & err));
    CHECK_EQ(err.code(), make_error_code(redsub::errc::not_subscribed));
    CHECK(s.unsubscribe("c"));

    CHECK_EQ(server.drain(milliseconds{200}), std::string{"SUBSCRIBE c\r\nUNSUBSCRIBE c\r\n"});

    // Connection lost
    server.clear_received();
    server.close_peer();

    REQUIRE(runner.wait_events(8));

    events = runner.events();

    REQUIRE(redsub::is<redsub::disconnected>(events[7]));
    CHECK_EQ(redsub::get_if<redsub::disconnected>(events[7])->cause.code()
        , make_error_code(redsub::errc::zero_bytes_read));

    // Reconnection replays every subscription exactly once
    REQUIRE(server.accept());
    REQUIRE(runner.wait_events(9));
    CHECK(redsub::is<redsub::connected>(runner.events()[8]));
    CHECK(replayed_exactly_once(server.drain(milliseconds{200})));

    auto channels = s.registry().channels();
    std::sort(channels.begin(), channels.end());

    CHECK_EQ(channels, std::vector<std::string>{"a", "b"});
    CHECK_EQ(s.registry().patterns(), std::vector<std::string>{"p.*"});

    runner.stop();

    CHECK_FALSE(s.is_connected());

    // Registry survives interruption
    CHECK_EQ(s.registry().count(), 3);
}

TEST_CASE("malformed input does not drop the connection") {
    std::uint16_t const port = 42405;
    tools::fake_server server {port};
    redsub::session s {make_options(port)};

    tools::session_runner runner {s};

    REQUIRE(server.accept());
    REQUIRE(runner.wait_events(1));

    server.send("?junk\r\n");
    REQUIRE(runner.wait_events(2));

    // Invalid UTF-8
    server.send("+\xFF\xFE\r\n");
    REQUIRE(runner.wait_events(3));

    server.send(push({"message", "chan", "ok"}));
    REQUIRE(runner.wait_events(4));

    auto events = runner.events();

    REQUIRE(redsub::is<redsub::decode_error>(events[1]));
    CHECK_EQ(redsub::get_if<redsub::decode_error>(events[1])->cause.code()
        , make_error_code(redsub::errc::protocol_error));
    REQUIRE(redsub::is<redsub::decode_error>(events[2]));
    CHECK_EQ(redsub::get_if<redsub::decode_error>(events[2])->cause.code()
        , make_error_code(redsub::errc::encoding_error));
    CHECK(redsub::is<redsub::published>(events[3]));
    CHECK(s.is_connected());
}

TEST_CASE("reconnect with backoff") {
    std::uint16_t const port = 42406;
    auto opts = make_options(port);
    opts.max_connect_retries = 2;

    std::atomic_int warnings {0};
    redsub::session s {opts};

    s.on_warn([& warnings] (std::string const & msg) {
        LOGW(TAG, "{}", msg);
        ++warnings;
    });

    s.subscribe("a");

    tools::session_runner runner {s};

    // Connection attempts given up at least once
    CHECK(tools::wait_until([& warnings] () { return warnings.load() > 0; }));
    CHECK_EQ(runner.count(), 0);

    tools::fake_server server {port};

    REQUIRE(server.accept());
    CHECK(server.wait_received([] (std::string const & r) { return r == "SUBSCRIBE a\r\n"; }));
    REQUIRE(runner.wait_events(1));
    CHECK(redsub::is<redsub::connected>(runner.events()[0]));
}

TEST_CASE("read timeout") {
    std::uint16_t const port = 42407;
    auto opts = make_options(port);
    opts.read_timeout = milliseconds{200};

    tools::fake_server server {port};
    redsub::session s {opts};
    tools::session_runner runner {s};

    REQUIRE(server.accept());
    REQUIRE(runner.wait_events(2));

    auto events = runner.events();

    CHECK(redsub::is<redsub::connected>(events[0]));
    REQUIRE(redsub::is<redsub::disconnected>(events[1]));
    CHECK_EQ(redsub::get_if<redsub::disconnected>(events[1])->cause.code()
        , make_error_code(redsub::errc::read_timeout));
}

TEST_CASE("interrupt unwinds backoff") {
    // Nobody listens on this port, default backoff is seconds long
    redsub::session s {"127.0.0.1:42408"};
    s.on_debug([] (std::string const &) {});

    auto start = std::chrono::steady_clock::now();

    {
        tools::session_runner runner {s};
        tools::sleep_ms(300);
    }

    auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(elapsed < std::chrono::seconds{2});
    CHECK_FALSE(s.is_connected());
}

TEST_CASE("unsubscribe during replay") {
    std::uint16_t const port = 42409;
    int const count = 2000;

    tools::fake_server server {port};
    redsub::session s {make_options(port)};
    s.on_debug([] (std::string const &) {});

    for (int i = 0; i < count; i++)
        REQUIRE(s.subscribe("ch-" + std::to_string(i)));

    tools::session_runner runner {s};

    REQUIRE(server.accept());

    // Replay is started
    REQUIRE(server.wait_received([] (std::string const & r) { return !r.empty(); }));

    for (int i = 0; i < count; i++)
        REQUIRE(s.unsubscribe("ch-" + std::to_string(i)));

    CHECK(s.registry().empty());

    REQUIRE(server.wait_received([count] (std::string const & r) {
        return tools::count_occurrences(r, "UNSUBSCRIBE ") == static_cast<std::size_t>(count);
    }));

    auto commands = last_commands(server.received());

    REQUIRE_EQ(commands.size(), static_cast<std::size_t>(count));

    for (auto const & x: commands)
        CHECK_EQ(x.second, std::string{"UNSUBSCRIBE"});

    REQUIRE(runner.wait_events(1));
    CHECK(redsub::is<redsub::connected>(runner.events()[0]));
}

TEST_CASE("send failure") {
    std::uint16_t const port = 42410;
    auto opts = make_options(port);
    opts.write_timeout = milliseconds{200};

    tools::fake_server server {port};
    redsub::session s {opts};
    s.on_debug([] (std::string const &) {});
    s.on_warn([] (std::string const &) {});

    tools::session_runner runner {s};

    REQUIRE(server.accept());
    REQUIRE(runner.wait_events(1));
    REQUIRE(s.is_connected());

    // Server does not read, the command does not fit into the socket buffers
    std::string huge (16 * 1024 * 1024, 'x');
    redsub::error err;

    CHECK_FALSE(s.subscribe(huge, & err));
    CHECK_EQ(err.code(), make_error_code(redsub::errc::socket_error));
    CHECK(s.registry().contains_channel(huge));

    // Connection is reset for replay
    REQUIRE(runner.wait_events(2));

    auto events = runner.events();

    CHECK(redsub::is<redsub::connected>(events[0]));
    CHECK(redsub::is<redsub::disconnected>(events[1]));
}
