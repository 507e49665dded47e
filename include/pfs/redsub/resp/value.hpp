////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.03 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../exports.hpp"
#include "../namespace.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

REDSUB__NAMESPACE_BEGIN

namespace resp {

enum class value_type
{
      null = 0
    , simple_string
    , error_text
    , integer
    , bulk
    , array
};

/**
 * Decoded RESP value.
 */
class value
{
private:
    value_type _type {value_type::null};
    std::int64_t _integer {0};
    std::string _text;
    std::vector<value> _items;

private:
    value (value_type t, std::string && text)
        : _type(t)
        , _text(std::move(text))
    {}

public:
    /**
     * Constructs null value.
     */
    value () = default;

    value (value const &) = default;
    value (value &&) = default;
    value & operator = (value const &) = default;
    value & operator = (value &&) = default;

public: // static
    static value make_null ()
    {
        return value{};
    }

    static value make_simple_string (std::string text)
    {
        return value{value_type::simple_string, std::move(text)};
    }

    static value make_error_text (std::string text)
    {
        return value{value_type::error_text, std::move(text)};
    }

    static value make_integer (std::int64_t n)
    {
        value v;
        v._type = value_type::integer;
        v._integer = n;
        return v;
    }

    static value make_bulk (std::string text)
    {
        return value{value_type::bulk, std::move(text)};
    }

    static value make_array (std::vector<value> items)
    {
        value v;
        v._type = value_type::array;
        v._items = std::move(items);
        return v;
    }

public:
    value_type type () const noexcept
    {
        return _type;
    }

    bool is_null () const noexcept { return _type == value_type::null; }
    bool is_integer () const noexcept { return _type == value_type::integer; }
    bool is_bulk () const noexcept { return _type == value_type::bulk; }
    bool is_array () const noexcept { return _type == value_type::array; }

    /**
     * Checks if value is a bulk or a simple string.
     */
    bool is_text () const noexcept
    {
        return _type == value_type::bulk || _type == value_type::simple_string;
    }

    /**
     * Text of the simple string, error text or bulk, empty string for other types.
     */
    std::string const & text () const noexcept
    {
        return _text;
    }

    std::int64_t integer () const noexcept
    {
        return _integer;
    }

    /**
     * Array elements, empty for other types.
     */
    std::vector<value> const & items () const noexcept
    {
        return _items;
    }

    friend bool operator == (value const & a, value const & b)
    {
        return a._type == b._type
            && a._integer == b._integer
            && a._text == b._text
            && a._items == b._items;
    }

    friend bool operator != (value const & a, value const & b)
    {
        return !(a == b);
    }
};

REDSUB__EXPORT std::string to_string (value_type t);

/**
 * Human-readable representation of the value for diagnostics.
 */
REDSUB__EXPORT std::string to_string (value const & v);

/**
 * Canonical RESP encoding of the value.
 */
REDSUB__EXPORT std::string encode (value const & v);

} // namespace resp

REDSUB__NAMESPACE_END
