#include "env_config.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace sh1ft::utils {

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? std::string(value) : std::string();
}

void env_config::warn_unparsed(const std::string& name, const std::string& value, const char* expected) const {
  auto log = redlog::get_logger("sh1ft.config");
  log.wrn(
      "ignoring unparsable setting", redlog::field("name", build_env_name(name)), redlog::field("value", value),
      redlog::field("expected", expected)
  );
}

std::string env_config::to_lower(const std::string& str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return result;
}

std::string env_config::trim(const std::string& str) {
  size_t first = str.find_first_not_of(' ');
  if (std::string::npos == first) {
    return str;
  }
  size_t last = str.find_last_not_of(' ');
  return str.substr(first, (last - first + 1));
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(trim(value));
  if (lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on") {
    return true;
  }
  if (lower_value == "0" || lower_value == "false" || lower_value == "no" || lower_value == "off") {
    return false;
  }

  warn_unparsed(name, value, "bool");
  return default_value;
}

template <> uint32_t env_config::get<uint32_t>(const std::string& name, uint32_t default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    // stoul accepts a leading minus sign, which would wrap
    if (trim(value).front() == '-') {
      throw std::invalid_argument("negative value");
    }
    unsigned long parsed = std::stoul(value);
    if (parsed > UINT32_MAX) {
      throw std::out_of_range("value exceeds uint32_t");
    }
    return static_cast<uint32_t>(parsed);
  } catch (const std::exception&) {
    warn_unparsed(name, value, "uint32_t");
    return default_value;
  }
}

} // namespace sh1ft::utils
