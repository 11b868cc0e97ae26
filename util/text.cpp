#include "util/text.hpp"

namespace util {

std::string TrimMiddle(const std::string& text, size_t limit) {
  if (text.size() <= limit) return text;
  size_t head = limit / 2;
  size_t tail = limit - head;
  return text.substr(0, head) + kTrimMarker + text.substr(text.size() - tail);
}

std::string Truncate(const std::string& text, size_t limit) {
  if (text.size() <= limit) return text;
  return text.substr(0, limit);
}

std::string ReplaceAll(std::string text, const std::string& from,
                       const std::string& to) {
  if (from.empty()) return text;
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

}  // namespace util
