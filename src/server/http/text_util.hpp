#pragma once

#include <string>
#include <string_view>

namespace text {

// Strips ASCII whitespace from both ends.
std::string_view trim(std::string_view s);

// Strips Unicode whitespace (NBSP, ideographic space, line separators, ...)
// from both ends of valid UTF-8 text.
std::string_view trim_unicode(std::string_view utf8);

// Decodes bytes as UTF-8, replacing each maximal invalid subsequence with U+FFFD.
std::string utf8_replace_invalid(std::string_view bytes);

bool starts_with_icase(std::string_view s, std::string_view prefix);

} // namespace text
