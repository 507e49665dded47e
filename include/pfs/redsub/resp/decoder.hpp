////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.03 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../callback.hpp"
#include "../error.hpp"
#include "../exports.hpp"
#include "../namespace.hpp"
#include "value.hpp"
#include <cstddef>
#include <string>
#include <vector>

REDSUB__NAMESPACE_BEGIN

namespace resp {

//
// RESP grammar
//
// +<text>\r\n                  - simple string
// -<text>\r\n                  - error
// :<signed integer>\r\n        - integer
// $-1\r\n                      - null
// $<len>\r\n<len bytes>\r\n    - bulk string
// *<count>\r\n<count values>   - array
//
enum class parse_status
{
      success = 0
    , incomplete   // Buffer contains a prefix of a valid encoding
    , malformed    // Buffer can never be parsed
};

/**
 * Parses one value from the front of the range [@a first, @a last).
 *
 * @param out Parsed value on success.
 * @param consumed Number of bytes the parsed value occupies on success.
 * @param reason Description of the failure when the result is @c parse_status::malformed.
 */
REDSUB__EXPORT parse_status parse (char const * first, char const * last, value & out
    , std::size_t & consumed, std::string * reason = nullptr);

/**
 * Parses as many complete values as possible from the front of @a buffer,
 * removes them from the buffer and returns them in order. An incomplete tail
 * remains in the buffer.
 *
 * @throw redsub::error {errc::protocol_error} if the buffer contains data that
 *        can never be parsed and @a perr is @c nullptr. The buffer is left
 *        untouched in this case.
 *
 * If @a perr is not @c nullptr the values parsed before the malformed one are
 * returned and removed from the buffer; the buffer starts with the malformed
 * data.
 */
REDSUB__EXPORT std::vector<value> decode (std::string & buffer, error * perr = nullptr);

/**
 * Returns the length of the longest prefix of [@a data, @a data + @a n) that
 * is a sequence of complete valid UTF-8 characters. Sets @a invalid to @c true
 * if an invalid sequence is found (as opposed to a sequence truncated by the
 * end of the range).
 */
REDSUB__EXPORT std::size_t utf8_valid_prefix (char const * data, std::size_t n, bool & invalid);

/**
 * Incremental stream decoder. Accumulates received chunks, validates them
 * as UTF-8 and emits complete values.
 */
class decoder
{
private:
    std::string _buffer;

    // Incomplete UTF-8 sequence at the end of the previous chunk
    std::string _pending;

public:
    mutable callback_t<void (value &&)> on_value = [] (value &&) {};

    /**
     * Called with errc::encoding_error when the chunk and the value in progress
     * are discarded due to invalid UTF-8 sequence, or with errc::protocol_error
     * when the accumulated buffer is discarded due to malformed data.
     */
    mutable callback_t<void (error const &)> on_failure = [] (error const &) {};

public:
    decoder () = default;
    decoder (decoder const &) = delete;
    decoder & operator = (decoder const &) = delete;
    decoder (decoder &&) = default;
    decoder & operator = (decoder &&) = default;

public:
    REDSUB__EXPORT void process_input (char const * data, std::size_t n);

    /**
     * Number of bytes waiting for completion.
     */
    std::size_t buffered () const noexcept
    {
        return _buffer.size() + _pending.size();
    }

    /**
     * Drops all accumulated data, e.g. before reading from a new connection.
     */
    void reset ()
    {
        _buffer.clear();
        _pending.clear();
    }
};

} // namespace resp

REDSUB__NAMESPACE_END
