////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.03 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <string>
#include <utility>

REDSUB__NAMESPACE_BEGIN

enum class command_type
{
      subscribe
    , unsubscribe
    , psubscribe
    , punsubscribe
};

inline char const * verb (command_type t) noexcept
{
    switch (t) {
        case command_type::subscribe: return "SUBSCRIBE";
        case command_type::unsubscribe: return "UNSUBSCRIBE";
        case command_type::psubscribe: return "PSUBSCRIBE";
        case command_type::punsubscribe: return "PUNSUBSCRIBE";
    }

    return "";
}

/**
 * Checks whether @a name can be sent as a single inline command argument: it must
 * not be empty and must not contain separators or quotes.
 */
inline bool is_valid_name (std::string const & name) noexcept
{
    if (name.empty())
        return false;

    // Terminating NUL is a forbidden character too
    static char const forbidden[] = " \t\r\n\"'";

    return name.find_first_of(forbidden, 0, sizeof(forbidden)) == std::string::npos;
}

/**
 * Subscription command sent as inline command: "<VERB> <name>\r\n".
 */
struct command
{
    command_type type;
    std::string name;

    std::string to_string () const
    {
        std::string result {verb(type)};
        result.reserve(result.size() + name.size() + 3);
        result += ' ';
        result += name;
        result += "\r\n";
        return result;
    }
};

REDSUB__NAMESPACE_END
