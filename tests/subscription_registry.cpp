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
#include "pfs/redsub/subscription_registry.hpp"
#include <algorithm>
#include <string>
#include <thread>
#include <vector>

TEST_CASE("channels and patterns") {
    redsub::subscription_registry reg;

    CHECK(reg.empty());

    CHECK(reg.add_channel("a"));
    CHECK(reg.add_channel("b"));
    CHECK_FALSE(reg.add_channel("a"));
    CHECK(reg.add_pattern("a"));
    CHECK(reg.add_pattern("news.*"));

    CHECK_EQ(reg.count(), 4);
    CHECK(reg.contains_channel("a"));
    CHECK(reg.contains_pattern("a"));
    CHECK_FALSE(reg.contains_channel("news.*"));

    auto channels = reg.channels();
    std::sort(channels.begin(), channels.end());
    CHECK_EQ(channels, std::vector<std::string>{"a", "b"});

    auto patterns = reg.patterns();
    std::sort(patterns.begin(), patterns.end());
    CHECK_EQ(patterns, std::vector<std::string>{"a", "news.*"});

    CHECK(reg.remove_channel("a"));
    CHECK_FALSE(reg.remove_channel("a"));
    CHECK_FALSE(reg.remove_pattern("b"));
    CHECK(reg.contains_pattern("a"));

    CHECK(reg.remove_channel("b"));
    CHECK(reg.remove_pattern("a"));
    CHECK(reg.remove_pattern("news.*"));
    CHECK(reg.empty());
}

TEST_CASE("concurrent mutation") {
    redsub::subscription_registry reg;
    int const n = 1000;

    auto add_range = [& reg] (int from, int to) {
        for (int i = from; i < to; i++) {
            reg.add_channel(std::to_string(i));
            reg.add_pattern(std::to_string(i) + ".*");
        }
    };

    std::thread t1 {add_range, 0, n};
    std::thread t2 {add_range, n / 2, n + n / 2};

    t1.join();
    t2.join();

    CHECK_EQ(reg.channels().size(), n + n / 2);
    CHECK_EQ(reg.patterns().size(), n + n / 2);
}
