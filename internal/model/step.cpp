#include "step.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "internal/util/errors.hpp"

namespace ferry::model {

namespace {

constexpr std::array<std::pair<StepType, std::string_view>, 14> kStepTypes{{
    {StepType::kLog, "log"},
    {StepType::kCopy, "copy"},
    {StepType::kReplication, "replication"},
    {StepType::kHttp, "http"},
    {StepType::kCommand, "command"},
    {StepType::kWrite, "write"},
    {StepType::kRead, "read"},
    {StepType::kDelete, "delete"},
    {StepType::kGroup, "group"},
    {StepType::kStore, "store"},
    {StepType::kQuery, "query"},
    {StepType::kCheck, "check"},
    {StepType::kInspect, "inspect"},
    {StepType::kList, "list"},
}};

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

} // namespace

std::string ToString(StepType type) {
  for (const auto& [value, name] : kStepTypes) {
    if (value == type) return std::string(name);
  }
  return "log";
}

std::optional<StepType> ParseStepType(std::string_view text) {
  const auto normalized = Lower(text);
  for (const auto& [value, name] : kStepTypes) {
    if (name == normalized) return value;
  }
  return std::nullopt;
}

std::string ToString(OnFailure policy) {
  switch (policy) {
    case OnFailure::kAbort:
      return "abort";
    case OnFailure::kWarn:
      return "warn";
    case OnFailure::kQuiet:
      return "quiet";
  }
  return "abort";
}

OnFailure ParseOnFailure(std::string_view text) {
  const auto normalized = Lower(text);
  if (normalized.empty() || normalized == "abort") return OnFailure::kAbort;
  if (normalized == "warn") return OnFailure::kWarn;
  if (normalized == "quiet") return OnFailure::kQuiet;
  throw ferry::util::ConfigurationError("unknown on_failure policy: " + std::string(text));
}

StepType Step::type() const {
  struct Visitor {
    StepType operator()(const LogStep&) const {
      return StepType::kLog;
    }
    StepType operator()(const CopyStep&) const {
      return StepType::kCopy;
    }
    StepType operator()(const ReplicationStep&) const {
      return StepType::kReplication;
    }
    StepType operator()(const HttpStep&) const {
      return StepType::kHttp;
    }
    StepType operator()(const CommandStep&) const {
      return StepType::kCommand;
    }
    StepType operator()(const WriteStep&) const {
      return StepType::kWrite;
    }
    StepType operator()(const ReadStep&) const {
      return StepType::kRead;
    }
    StepType operator()(const DeleteStep&) const {
      return StepType::kDelete;
    }
    StepType operator()(const GroupStep&) const {
      return StepType::kGroup;
    }
    StepType operator()(const StoreStep&) const {
      return StepType::kStore;
    }
    StepType operator()(const EngineStep& step) const {
      return step.type;
    }
  };
  return std::visit(Visitor{}, body);
}

} // namespace ferry::model
