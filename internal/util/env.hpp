#pragma once

#include <map>
#include <string>
#include <vector>

namespace ferry::util {

/*
  Environment layering.

  Environments are passed by value through the call chain and merged
  explicitly; nothing here mutates the global process environment.

    process env  <  document env  <  step env
*/

using EnvMap = std::map<std::string, std::string>;

// Snapshot of the current process environment.
EnvMap CaptureProcessEnvironment();

// Returns `base` with every entry of `overlay` applied on top.
EnvMap Overlay(EnvMap base, const EnvMap& overlay);

struct EnvLayers {
  EnvMap process;
  EnvMap spec;
  EnvMap step;

  EnvMap Merge() const;
};

// "KEY=VALUE" strings suitable for execve.
std::vector<std::string> ToEnvStrings(const EnvMap& env);

// Lookup with fallback.
std::string GetOr(const EnvMap& env, const std::string& key, const std::string& fallback);

} // namespace ferry::util
