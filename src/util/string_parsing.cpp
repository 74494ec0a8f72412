#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace nodeguard {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  // Reject empty or whitespace-leading strings
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long value = std::stol(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }
    if (value < min || value > max) {
      return std::nullopt;
    }
    return static_cast<int>(value);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::vector<std::string> SplitList(const std::string& str, char sep) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(sep, pos);
    if (next == std::string::npos) {
      next = str.size();
    }
    if (next > pos) {
      items.push_back(str.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return items;
}

} // namespace util
} // namespace nodeguard
