#include "env.hpp"

#include <cstring>

extern char** environ;

namespace ferry::util {

EnvMap CaptureProcessEnvironment() {
  EnvMap env;
  if (environ == nullptr) {
    return env;
  }
  for (char** entry = environ; *entry != nullptr; ++entry) {
    const char* eq = std::strchr(*entry, '=');
    if (eq == nullptr) {
      continue;
    }
    env.emplace(std::string(*entry, eq - *entry), std::string(eq + 1));
  }
  return env;
}

EnvMap Overlay(EnvMap base, const EnvMap& overlay) {
  for (const auto& [key, value] : overlay) {
    base[key] = value;
  }
  return base;
}

EnvMap EnvLayers::Merge() const {
  return Overlay(Overlay(process, spec), step);
}

std::vector<std::string> ToEnvStrings(const EnvMap& env) {
  std::vector<std::string> out;
  out.reserve(env.size());
  for (const auto& [key, value] : env) {
    out.push_back(key + "=" + value);
  }
  return out;
}

std::string GetOr(const EnvMap& env, const std::string& key, const std::string& fallback) {
  auto it = env.find(key);
  return it == env.end() ? fallback : it->second;
}

} // namespace ferry::util
