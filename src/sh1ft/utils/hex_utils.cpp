#include "hex_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace sh1ft::utils {

namespace {

std::string strip_comments(const std::string& pattern) {
  std::string result;
  std::istringstream stream(pattern);
  std::string line;

  while (std::getline(stream, line)) {
    size_t comment_pos = std::min(line.find("//"), line.find('#'));
    if (comment_pos != std::string::npos) {
      line = line.substr(0, comment_pos);
    }

    if (!result.empty() && !line.empty()) {
      result += " ";
    }
    result += line;
  }

  return result;
}

} // namespace

bool is_hex_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

uint8_t parse_hex_digit(char c) {
  if (std::isdigit(static_cast<unsigned char>(c))) {
    return static_cast<uint8_t>(c - '0');
  } else if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  } else if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return 0; // invalid
}

std::string normalize_hex_pattern(const std::string& pattern) {
  std::string stripped = strip_comments(pattern);

  std::string result;
  result.reserve(stripped.length());

  for (char c : stripped) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      continue;
    }
    result.push_back(static_cast<char>(std::tolower(uc)));
  }

  return result;
}

bool is_valid_hex_pattern(const std::string& pattern) {
  std::string normalized = normalize_hex_pattern(pattern);

  // each byte needs exactly two hex digits
  if (normalized.empty() || normalized.length() % 2 != 0) {
    return false;
  }

  return std::all_of(normalized.begin(), normalized.end(), is_hex_digit);
}

std::string format_bytes(const std::vector<uint8_t>& bytes) {
  std::ostringstream oss;
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0) {
      oss << " ";
    }
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
  }
  return oss.str();
}

} // namespace sh1ft::utils
