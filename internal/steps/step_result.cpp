#include "step_result.hpp"

namespace ferry::steps {

std::string ToString(StepStatus status) {
  switch (status) {
    case StepStatus::kSucceeded:
      return "succeeded";
    case StepStatus::kFailed:
      return "failed";
    case StepStatus::kSkipped:
      return "skipped";
  }
  return "unknown";
}

void PipelineResult::ThrowIfFailed() const {
  if (!failed_index) return;
  for (const auto& step : steps) {
    if (step.index == *failed_index && step.error) throw *step.error;
  }
  throw util::StepError(*failed_index, "unknown", util::ErrorKind::kOther, "step failed", nullptr);
}

const StepResult* PipelineResult::Find(const std::string& id) const {
  for (const auto& step : steps) {
    if (step.id == id) return &step;
  }
  return nullptr;
}

} // namespace ferry::steps
