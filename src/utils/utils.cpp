#include "utils.hpp"

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace Utils {

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::string join_strings(const std::vector<std::string> &parts,
                         std::string_view separator) {
  std::string joined;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      joined.append(separator);
    joined.append(parts[i]);
  }
  return joined;
}

} // namespace Utils
