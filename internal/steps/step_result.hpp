#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/step.hpp"
#include "internal/util/errors.hpp"

namespace ferry::steps {

enum class StepStatus {
  kSucceeded,
  kFailed,
  kSkipped,
};

std::string ToString(StepStatus status);

struct StepResult {
  std::size_t                    index{0};
  std::string                    id;
  model::StepType                type{model::StepType::kLog};
  StepStatus                     status{StepStatus::kSucceeded};
  std::string                    output;
  std::optional<util::StepError> error;
  std::chrono::milliseconds      duration{0};
  std::vector<StepResult>        children; // group steps
};

/*
  Results of the steps that ran (or were skipped), in order. A step
  that failed with on_failure=abort is the last entry and sets
  failed_index.
*/
struct PipelineResult {
  std::vector<StepResult>    steps;
  std::optional<std::size_t> failed_index;

  bool ok() const {
    return !failed_index.has_value();
  }

  // Throws the StepError of the aborting step.
  void ThrowIfFailed() const;

  const StepResult* Find(const std::string& id) const;
};

} // namespace ferry::steps
