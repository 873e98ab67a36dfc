#pragma once

#include <cstdint>
#include <string>

namespace sh1ft::utils {

// reads typed settings from prefixed environment variables (prefix "SH1FT" -> SH1FT_<NAME>)
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  std::string env_name(const std::string& name) const { return build_env_name(name); }

private:
  std::string prefix_;
  std::string build_env_name(const std::string& name) const;
  std::string get_env_value(const std::string& name) const;
  void warn_unparsed(const std::string& name, const std::string& value, const char* expected) const;
  static std::string to_lower(const std::string& value);
  static std::string trim(const std::string& value);
};

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> uint32_t env_config::get<uint32_t>(const std::string& name, uint32_t default_value) const;

} // namespace sh1ft::utils
