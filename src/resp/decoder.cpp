////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `redsub-lib`.
//
// Changelog:
//      2026.10.03 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/redsub/resp/decoder.hpp"
#include <pfs/i18n.hpp>
#include <pfs/integer.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>

REDSUB__NAMESPACE_BEGIN

namespace resp {

// Same as the default `proto-max-bulk-len` of the Redis server
static constexpr std::int64_t kMAX_BULK_LENGTH = 512 * 1024 * 1024;

// Upper bound for the preallocated array storage
static constexpr std::int64_t kMAX_ARRAY_RESERVE = 1024;

static parse_status malformed (std::string * reason, std::string && text)
{
    if (reason != nullptr)
        *reason = std::move(text);

    return parse_status::malformed;
}

// Finds CRLF terminating the line starting at `p`.
static parse_status read_line (char const * p, char const * last, char const * & line_end
    , std::string * reason)
{
    for (auto q = p; q != last; ++q) {
        if (*q == '\r') {
            if (q + 1 == last)
                return parse_status::incomplete;

            if (q[1] != '\n')
                return malformed(reason, tr::_("CR is not followed by LF"));

            line_end = q;
            return parse_status::success;
        }

        if (*q == '\n')
            return malformed(reason, tr::_("LF is not preceded by CR"));
    }

    return parse_status::incomplete;
}

static bool parse_int64 (char const * first, char const * last, std::int64_t & result)
{
    bool negative = false;

    if (first != last && *first == '-') {
        negative = true;
        ++first;
    }

    if (first == last)
        return false;

    if (!std::all_of(first, last, [] (char ch) { return ch >= '0' && ch <= '9'; }))
        return false;

    std::uint64_t const max_magnitude = static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)()) + 1;
    std::error_code ec;
    auto magnitude = pfs::to_integer(first, last, std::uint64_t{0}, max_magnitude, ec);

    if (ec)
        return false;

    if (negative) {
        result = magnitude == max_magnitude
            ? (std::numeric_limits<std::int64_t>::min)()
            : -static_cast<std::int64_t>(magnitude);
    } else {
        if (magnitude == max_magnitude)
            return false;

        result = static_cast<std::int64_t>(magnitude);
    }

    return true;
}

parse_status parse (char const * first, char const * last, value & out
    , std::size_t & consumed, std::string * reason)
{
    // Arrays under construction
    struct frame
    {
        std::size_t remaining;
        std::vector<value> items;
    };

    std::vector<frame> stack;
    char const * p = first;

    for (;;) {
        if (p == last)
            return parse_status::incomplete;

        char prefix = *p;

        switch (prefix) {
            case '+': case '-': case ':': case '$': case '*':
                break;
            default:
                return malformed(reason, tr::f_("unexpected leading byte: 0x{:02X}"
                    , static_cast<unsigned int>(static_cast<unsigned char>(prefix))));
        }

        char const * line_end = nullptr;
        auto status = read_line(p + 1, last, line_end, reason);

        if (status != parse_status::success)
            return status;

        char const * next = line_end + 2;
        value v;

        switch (prefix) {
            case '+':
                v = value::make_simple_string(std::string(p + 1, line_end));
                break;

            case '-':
                v = value::make_error_text(std::string(p + 1, line_end));
                break;

            case ':': {
                std::int64_t n = 0;

                if (!parse_int64(p + 1, line_end, n))
                    return malformed(reason, tr::f_("bad integer: {}", std::string(p + 1, line_end)));

                v = value::make_integer(n);
                break;
            }

            case '$': {
                std::int64_t len = 0;

                if (!parse_int64(p + 1, line_end, len))
                    return malformed(reason, tr::f_("bad bulk length: {}", std::string(p + 1, line_end)));

                if (len == -1)
                    break; // null

                if (len < 0)
                    return malformed(reason, tr::f_("negative bulk length: {}", len));

                if (len > kMAX_BULK_LENGTH)
                    return malformed(reason, tr::f_("bulk length too large: {}", len));

                if (last - next < len + 2)
                    return parse_status::incomplete;

                if (next[len] != '\r' || next[len + 1] != '\n')
                    return malformed(reason, tr::_("bulk string is not terminated by CRLF"));

                v = value::make_bulk(std::string(next, next + len));
                next += len + 2;
                break;
            }

            case '*': {
                std::int64_t count = 0;

                if (!parse_int64(p + 1, line_end, count))
                    return malformed(reason, tr::f_("bad array length: {}", std::string(p + 1, line_end)));

                if (count < 0)
                    return malformed(reason, tr::f_("negative array length: {}", count));

                if (count > 0) {
                    stack.push_back(frame{static_cast<std::size_t>(count), std::vector<value>{}});
                    stack.back().items.reserve(static_cast<std::size_t>((std::min)(count, kMAX_ARRAY_RESERVE)));
                    p = next;
                    continue;
                }

                v = value::make_array(std::vector<value>{});
                break;
            }
        }

        p = next;

        // Attach the complete value to the enclosing arrays
        for (;;) {
            if (stack.empty()) {
                out = std::move(v);
                consumed = static_cast<std::size_t>(p - first);
                return parse_status::success;
            }

            auto & top = stack.back();
            top.items.push_back(std::move(v));

            if (--top.remaining > 0)
                break;

            v = value::make_array(std::move(top.items));
            stack.pop_back();
        }
    }
}

std::vector<value> decode (std::string & buffer, error * perr)
{
    std::vector<value> result;
    std::size_t offset = 0;
    char const * last = buffer.data() + buffer.size();

    while (offset < buffer.size()) {
        value v;
        std::size_t consumed = 0;
        std::string reason;

        auto status = parse(buffer.data() + offset, last, v, consumed, & reason);

        if (status == parse_status::incomplete)
            break;

        if (status == parse_status::malformed) {
            error err {
                  make_error_code(errc::protocol_error)
                , tr::f_("malformed data at offset {}", offset)
                , reason
            };

            if (perr == nullptr)
                throw err;

            *perr = std::move(err);
            break;
        }

        result.push_back(std::move(v));
        offset += consumed;
    }

    buffer.erase(0, offset);
    return result;
}

std::size_t utf8_valid_prefix (char const * data, std::size_t n, bool & invalid)
{
    auto s = reinterpret_cast<unsigned char const *>(data);
    std::size_t i = 0;

    invalid = false;

    while (i < n) {
        unsigned char c = s[i];

        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;

        // Valid range of the second byte (excludes overlongs, surrogates and
        // code points above U+10FFFF)
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;

        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3;
            lo = 0xA0;
        } else if (c >= 0xE1 && c <= 0xEC) {
            len = 3;
        } else if (c == 0xED) {
            len = 3;
            hi = 0x9F;
        } else if (c >= 0xEE && c <= 0xEF) {
            len = 3;
        } else if (c == 0xF0) {
            len = 4;
            lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4;
            hi = 0x8F;
        } else {
            invalid = true;
            return i;
        }

        for (std::size_t k = 1; k < len; k++) {
            // Truncated sequence
            if (i + k == n)
                return i;

            unsigned char cc = s[i + k];
            unsigned char l = k == 1 ? lo : 0x80;
            unsigned char h = k == 1 ? hi : 0xBF;

            if (cc < l || cc > h) {
                invalid = true;
                return i;
            }
        }

        i += len;
    }

    return n;
}

void decoder::process_input (char const * data, std::size_t n)
{
    std::string chunk;
    chunk.reserve(_pending.size() + n);
    chunk.append(_pending);
    chunk.append(data, n);
    _pending.clear();

    bool invalid = false;
    auto valid_size = utf8_valid_prefix(chunk.data(), chunk.size(), invalid);

    if (invalid) {
        // Value in progress can not be completed anymore
        auto discarded = _buffer.size() + chunk.size();
        _buffer.clear();

        on_failure(error {
              make_error_code(errc::encoding_error)
            , tr::f_("invalid UTF-8 sequence at offset {}, {} bytes discarded", valid_size, discarded)
        });

        return;
    }

    _buffer.append(chunk, 0, valid_size);
    _pending.assign(chunk, valid_size, std::string::npos);

    error err;
    auto values = decode(_buffer, & err);

    for (auto & v: values)
        on_value(std::move(v));

    if (err) {
        _buffer.clear();
        on_failure(err);
    }
}

} // namespace resp

REDSUB__NAMESPACE_END
