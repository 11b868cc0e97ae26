#ifndef UTIL_TEXT_HPP
#define UTIL_TEXT_HPP

#include <string>

namespace util {

// Separator placed between the head and the tail of a trimmed text.
static const constexpr char* kTrimMarker = "\n...\n";

// Returns text unchanged if it is at most limit bytes long, otherwise keeps
// its first limit/2 and last limit - limit/2 bytes joined by kTrimMarker.
std::string TrimMiddle(const std::string& text, size_t limit);

// Returns the first limit bytes of text.
std::string Truncate(const std::string& text, size_t limit);

// Replaces every occurrence of from in text with to.
std::string ReplaceAll(std::string text, const std::string& from,
                       const std::string& to);

}  // namespace util

#endif
