#include "pipeline.hpp"

#include "internal/util/errors.hpp"

namespace ferry::model {

void Pipeline::Validate() const {
  if (!file_path.empty()) return;
  if (steps.empty()) {
    throw ferry::util::ConfigurationError("pipeline has no steps");
  }
}

} // namespace ferry::model
