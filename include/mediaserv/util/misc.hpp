#pragma once
#include "mediaserv/config.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mediaserv::util {
/**
 * Convert a hex value to a decimal value.
 *
 * @param c The hexadecimal input.
 * @return The decimal output.
 */
static inline std::uint8_t hex2dec(std::uint8_t c)
{
    if (c >= '0' && c <= '9')
        c -= '0';

    else if (c >= 'a' && c <= 'f')
        c -= 'a' - 10;

    else if (c >= 'A' && c <= 'F')
        c -= 'A' - 10;

    return c;
}

static inline bool is_hex(char c)
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

/**
 * Decodes an URL.
 *
 * @details This function replaces %<hex> with the corresponding characters.
 *          See https://en.wikipedia.org/wiki/Percent-encoding
 *          A '%' that is not followed by two hex digits is kept as is.
 *
 * @param str The string to decode.
 */
static inline void url_decode(std::string& str)
{
    size_t w = 0;
    for (size_t r = 0; r < str.size(); ++r) {
        uint8_t v = str[r];
        if (str[r] == '%' && r + 2 < str.size() && is_hex(str[r + 1]) && is_hex(str[r + 2])) {
            v = hex2dec(str[r + 1]) << 4;
            v |= hex2dec(str[r + 2]);
            r += 2;
        }
        str[w++] = v;
    }
    str.resize(w);
}
static inline std::string url_decode(std::string_view str)
{
    std::string decode_str(str);
    url_decode(decode_str);
    return decode_str;
}

// Splits on delimiter and trims every part. Empty parts are kept so callers can
// decide whether an empty list element is meaningful.
static inline std::vector<std::string_view> split(std::string_view str, std::string_view delimiter)
{
    if (str.empty())
        return {};

    if (delimiter.empty())
        return {str};

    std::vector<std::string_view> parts;
    std::string_view::size_type pos = 0;
    for (;;) {
        const auto pos_found = str.find(delimiter, pos);
        parts.emplace_back(boost::trim_copy(str.substr(pos, pos_found - pos)));
        if (pos_found == std::string_view::npos)
            break;
        pos = pos_found + delimiter.size();
    }
    return parts;
}

} // namespace mediaserv::util
