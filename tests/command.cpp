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
#include "pfs/redsub/command.hpp"

using redsub::command;
using redsub::command_type;

TEST_CASE("command") {
    CHECK_EQ(command{command_type::subscribe, "news"}.to_string(), std::string{"SUBSCRIBE news\r\n"});
    CHECK_EQ(command{command_type::unsubscribe, "news"}.to_string(), std::string{"UNSUBSCRIBE news\r\n"});
    CHECK_EQ(command{command_type::psubscribe, "news.*"}.to_string(), std::string{"PSUBSCRIBE news.*\r\n"});
    CHECK_EQ(command{command_type::punsubscribe, "news.*"}.to_string(), std::string{"PUNSUBSCRIBE news.*\r\n"});

    // Name is sent verbatim
    CHECK_EQ(command{command_type::subscribe, "канал"}.to_string(), std::string{"SUBSCRIBE канал\r\n"});
    CHECK_EQ(command{command_type::subscribe, ""}.to_string(), std::string{"SUBSCRIBE \r\n"});
}

TEST_CASE("valid name") {
    CHECK(redsub::is_valid_name("news"));
    CHECK(redsub::is_valid_name("news.*"));
    CHECK(redsub::is_valid_name("канал"));

    CHECK_FALSE(redsub::is_valid_name(""));
    CHECK_FALSE(redsub::is_valid_name("a b"));
    CHECK_FALSE(redsub::is_valid_name("a\tb"));
    CHECK_FALSE(redsub::is_valid_name("a\r\nFLUSHALL"));
    CHECK_FALSE(redsub::is_valid_name("a\nb"));
    CHECK_FALSE(redsub::is_valid_name("\"a\""));
    CHECK_FALSE(redsub::is_valid_name("it's"));
    CHECK_FALSE(redsub::is_valid_name(std::string{"a\0b", 3}));
}
