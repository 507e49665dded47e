////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.03 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/resp/value.hpp"
#include <pfs/fmt.hpp>

REDSUB__NAMESPACE_BEGIN

namespace resp {

std::string to_string (value_type t)
{
    switch (t) {
        case value_type::null: return "null";
        case value_type::simple_string: return "simple string";
        case value_type::error_text: return "error";
        case value_type::integer: return "integer";
        case value_type::bulk: return "bulk";
        case value_type::array: return "array";
    }

    return "unknown";
}

std::string to_string (value const & v)
{
    switch (v.type()) {
        case value_type::null:
            return "(nil)";
        case value_type::simple_string:
            return v.text();
        case value_type::error_text:
            return fmt::format("(error) {}", v.text());
        case value_type::integer:
            return fmt::format("(integer) {}", v.integer());
        case value_type::bulk:
            return fmt::format("\"{}\"", v.text());
        case value_type::array: {
            std::string result {"["};
            bool first = true;

            for (auto const & item: v.items()) {
                if (!first)
                    result += ", ";

                result += to_string(item);
                first = false;
            }

            result += ']';
            return result;
        }
    }

    return std::string{};
}

static void encode_to (std::string & out, value const & v)
{
    switch (v.type()) {
        case value_type::null:
            out += "$-1\r\n";
            break;
        case value_type::simple_string:
            out += '+';
            out += v.text();
            out += "\r\n";
            break;
        case value_type::error_text:
            out += '-';
            out += v.text();
            out += "\r\n";
            break;
        case value_type::integer:
            out += ':';
            out += std::to_string(v.integer());
            out += "\r\n";
            break;
        case value_type::bulk:
            out += '$';
            out += std::to_string(v.text().size());
            out += "\r\n";
            out += v.text();
            out += "\r\n";
            break;
        case value_type::array:
            out += '*';
            out += std::to_string(v.items().size());
            out += "\r\n";

            for (auto const & item: v.items())
                encode_to(out, item);

            break;
    }
}

std::string encode (value const & v)
{
    std::string out;
    encode_to(out, v);
    return out;
}

} // namespace resp

REDSUB__NAMESPACE_END
