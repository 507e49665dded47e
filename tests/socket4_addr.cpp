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
#include "pfs/redsub/socket4_addr.hpp"

TEST_CASE("socket4_addr") {
    auto saddr = redsub::socket4_addr::parse("192.168.0.10:6379");

    REQUIRE(saddr);
    CHECK_EQ(saddr->addr, redsub::inet4_addr(192, 168, 0, 10));
    CHECK_EQ(saddr->port, 6379);
    CHECK_EQ(to_string(*saddr), std::string{"192.168.0.10:6379"});

    CHECK_FALSE(redsub::socket4_addr::parse("192.168.0.10"));
    CHECK_FALSE(redsub::socket4_addr::parse("192.168.0.10:"));
    CHECK_FALSE(redsub::socket4_addr::parse("192.168.0.10:0"));
    CHECK_FALSE(redsub::socket4_addr::parse("192.168.0.10:65536"));
    CHECK_FALSE(redsub::socket4_addr::parse("localhost:6379"));
}

TEST_CASE("server_addr") {
    auto a = redsub::server_addr::parse("localhost:6379");

    REQUIRE(a);
    CHECK_EQ(a->host, std::string{"localhost"});
    CHECK_EQ(a->port, 6379);
    CHECK_EQ(to_string(*a), std::string{"localhost:6379"});

    a = redsub::server_addr::parse("10.0.0.1:1");

    REQUIRE(a);
    CHECK_EQ(a->host, std::string{"10.0.0.1"});
    CHECK_EQ(a->port, 1);

    CHECK_FALSE(redsub::server_addr::parse(""));
    CHECK_FALSE(redsub::server_addr::parse("localhost"));
    CHECK_FALSE(redsub::server_addr::parse(":6379"));
    CHECK_FALSE(redsub::server_addr::parse("localhost:"));
    CHECK_FALSE(redsub::server_addr::parse("localhost:port"));
    CHECK_FALSE(redsub::server_addr::parse("localhost:70000"));
}

TEST_CASE("server_addr resolve") {
    auto a = redsub::server_addr::parse("127.0.0.1:6379");

    REQUIRE(a);

    auto saddrs = a->resolve();

    REQUIRE_EQ(saddrs.size(), 1);
    CHECK_EQ(saddrs[0], redsub::socket4_addr{redsub::inet4_addr{127, 0, 0, 1}, 6379});
}
