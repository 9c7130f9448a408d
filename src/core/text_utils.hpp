#ifndef ROWGUARD_CORE_TEXT_UTILS_HPP_
#define ROWGUARD_CORE_TEXT_UTILS_HPP_

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace rowguard::core {

inline std::string_view TrimView(std::string_view raw) {
  std::size_t begin = 0;
  while (begin < raw.size() && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
    ++begin;
  }

  std::size_t end = raw.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])) != 0) {
    --end;
  }
  return raw.substr(begin, end - begin);
}

inline std::string Trim(std::string_view raw) {
  return std::string(TrimView(raw));
}

inline std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

inline std::string Join(const std::vector<std::string>& parts, std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i != 0U) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

} // namespace rowguard::core

#endif // ROWGUARD_CORE_TEXT_UTILS_HPP_
