////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.06 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include <pfs/redsub/session.hpp>
#include <pfs/argvapi.hpp>
#include <pfs/countdown_timer.hpp>
#include <pfs/filesystem.hpp>
#include <pfs/integer.hpp>
#include <pfs/log.hpp>
#include <atomic>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>

namespace fs = pfs::filesystem;

static constexpr char const * TAG = "subscriber";

static std::atomic_bool s_quit_flag {false};

static void sigterm_handler (int /*sig*/)
{
    s_quit_flag.store(true);
}

static void print_usage (fs::path const & programName, std::string const & errorString = std::string{})
{
    if (!errorString.empty())
        LOGE(TAG, "{}", errorString);

    fmt::println("Usage:\n\n"
        "{0} --help | -h\n"
        "{0} [--server=HOST:PORT] [--unsubscribe-after=SECONDS] [--verbose]\n"
        "\t[--channel=NAME]... [--pattern=PATTERN]...\n\n"
        "Default server is localhost:6379.\n"
        "With --unsubscribe-after the first channel is unsubscribed after SECONDS."
        , programName);
}

int main (int argc, char * argv[])
{
    signal(SIGINT, sigterm_handler);
    signal(SIGTERM, sigterm_handler);

    std::string server {"localhost:6379"};
    std::vector<std::string> channels;
    std::vector<std::string> patterns;
    int unsubscribe_after = -1;
    bool verbose = false;

    auto commandLine = pfs::make_argvapi(argc, argv);
    auto programName = commandLine.program_name();
    auto commandLineIterator = commandLine.begin();

    while (commandLineIterator.has_more()) {
        auto x = commandLineIterator.next();

        if (x.is_option("help") || x.is_option("h")) {
            print_usage(programName);
            return EXIT_SUCCESS;
        } else if (x.is_option("server")) {
            if (!x.has_arg()) {
                print_usage(programName, "Expected server address");
                return EXIT_FAILURE;
            }

            server = pfs::to_string(x.arg());
        } else if (x.is_option("channel")) {
            if (!x.has_arg()) {
                print_usage(programName, "Expected channel name");
                return EXIT_FAILURE;
            }

            channels.push_back(pfs::to_string(x.arg()));
        } else if (x.is_option("pattern")) {
            if (!x.has_arg()) {
                print_usage(programName, "Expected pattern");
                return EXIT_FAILURE;
            }

            patterns.push_back(pfs::to_string(x.arg()));
        } else if (x.is_option("unsubscribe-after")) {
            std::error_code ec;

            if (x.has_arg()) {
                unsubscribe_after = pfs::to_integer(x.arg().begin(), x.arg().end()
                    , int{0}, int{3600}, ec);
            }

            if (!x.has_arg() || ec) {
                print_usage(programName, "Expected number of seconds");
                return EXIT_FAILURE;
            }
        } else if (x.is_option("verbose")) {
            verbose = true;
        } else {
            print_usage(programName, "Bad option");
            return EXIT_FAILURE;
        }
    }

    if (channels.empty() && patterns.empty()) {
        channels = {"channel1", "channel2", "channel3", "channel4"};
    }

    try {
        redsub::session session {server};

        if (!verbose)
            session.on_debug([] (std::string const &) {});

        for (auto const & channel: channels)
            session.subscribe(channel);

        for (auto const & pattern: patterns)
            session.psubscribe(pattern);

        std::thread listener_thread {[& session] () {
            session.run([] (redsub::event && ev) {
                fmt::println("{}", redsub::to_string(ev));
            });
        }};

        pfs::countdown_timer<std::milli> unsubscribe_timer {
            std::chrono::seconds{unsubscribe_after < 0 ? 0 : unsubscribe_after}};

        while (!s_quit_flag.load()) {
            if (unsubscribe_after >= 0 && unsubscribe_timer.remain_count() == 0 && !channels.empty()) {
                redsub::error err;

                if (!session.unsubscribe(channels.front(), & err))
                    LOGE(TAG, "unsubscribe failure: {}", err.what());

                unsubscribe_after = -1;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }

        session.interrupt();
        listener_thread.join();
    } catch (redsub::error const & ex) {
        LOGE(TAG, "{}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
