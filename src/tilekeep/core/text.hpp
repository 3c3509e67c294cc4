#pragma once

#include <string>
#include <string_view>

namespace tilekeep::text {

/// ISO-8859-1 bytes (ICCCM STRING) re-encoded as UTF-8.
std::string latin1_to_utf8(std::string_view latin1);

/**
 * @brief Copy of s with each byte that does not start a valid UTF-8
 * sequence replaced by U+FFFD.
 *
 * Overlong encodings, surrogates and code points above U+10FFFF count as
 * invalid. Valid input is returned unchanged.
 */
std::string sanitize_utf8(std::string_view s);

} // namespace tilekeep::text
