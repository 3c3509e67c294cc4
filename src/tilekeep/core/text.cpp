#include "text.hpp"
#include <cstdint>

namespace tilekeep::text {

namespace {

constexpr std::string_view REPLACEMENT = "\xEF\xBF\xBD";

// Length of the valid sequence starting at s[i], or 0 if it is invalid
size_t valid_sequence_length(std::string_view s, size_t i)
{
    auto byte = [&](size_t k) { return static_cast<uint8_t>(s[k]); };
    auto continuation = [&](size_t k) { return k < s.size() && (byte(k) & 0xC0) == 0x80; };

    uint8_t lead = byte(i);
    if (lead < 0x80)
        return 1;

    if (lead >= 0xC2 && lead <= 0xDF)
        return continuation(i + 1) ? 2 : 0;

    if (lead >= 0xE0 && lead <= 0xEF)
    {
        if (!continuation(i + 1) || !continuation(i + 2))
            return 0;
        uint8_t second = byte(i + 1);
        if (lead == 0xE0 && second < 0xA0) // overlong
            return 0;
        if (lead == 0xED && second > 0x9F) // UTF-16 surrogates
            return 0;
        return 3;
    }

    if (lead >= 0xF0 && lead <= 0xF4)
    {
        if (!continuation(i + 1) || !continuation(i + 2) || !continuation(i + 3))
            return 0;
        uint8_t second = byte(i + 1);
        if (lead == 0xF0 && second < 0x90) // overlong
            return 0;
        if (lead == 0xF4 && second > 0x8F) // above U+10FFFF
            return 0;
        return 4;
    }

    return 0;
}

}

std::string latin1_to_utf8(std::string_view latin1)
{
    std::string result;
    result.reserve(latin1.size());
    for (char c : latin1)
    {
        auto b = static_cast<uint8_t>(c);
        if (b < 0x80)
        {
            result.push_back(c);
        }
        else
        {
            result.push_back(static_cast<char>(0xC0 | (b >> 6)));
            result.push_back(static_cast<char>(0x80 | (b & 0x3F)));
        }
    }
    return result;
}

std::string sanitize_utf8(std::string_view s)
{
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size())
    {
        size_t len = valid_sequence_length(s, i);
        if (len == 0)
        {
            result += REPLACEMENT;
            ++i;
            continue;
        }
        result.append(s.substr(i, len));
        i += len;
    }
    return result;
}

} // namespace tilekeep::text
