#pragma once

#include <string>
#include <vector>

#include "internal/model/step.hpp"
#include "internal/util/env.hpp"

namespace ferry::model {

/*
  Ordered list of steps. Step order is execution order.
*/
struct Pipeline {
  std::vector<Step> steps;
  util::EnvMap      env;

  // When set, the engine runs this file directly.
  std::string file_path;

  // Throws ConfigurationError.
  void Validate() const;
};

} // namespace ferry::model
