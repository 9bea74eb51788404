#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "internal/model/enums.hpp"
#include "internal/util/env.hpp"

namespace ferry::model {

/*
  Step / hook kinds.

  The first group is executed by the in-process interpreter. The second
  group (query, check, inspect, list) needs connector access and is only
  meaningful inside documents handed to the engine (replication hooks,
  engine-run pipelines).
*/
enum class StepType : std::uint8_t {
  kLog,
  kCopy,
  kReplication,
  kHttp,
  kCommand,
  kWrite,
  kRead,
  kDelete,
  kGroup,
  kStore,

  kQuery,
  kCheck,
  kInspect,
  kList,
};

std::string             ToString(StepType type);
std::optional<StepType> ParseStepType(std::string_view text);

constexpr bool IsEngineOnly(StepType type) {
  return type == StepType::kQuery || type == StepType::kCheck || type == StepType::kInspect ||
         type == StepType::kList;
}

enum class OnFailure : std::uint8_t {
  kAbort, // halt the pipeline
  kWarn,  // log and continue
  kQuiet, // continue silently
};

std::string ToString(OnFailure policy);

// Throws ConfigurationError.
OnFailure ParseOnFailure(std::string_view text);

struct StepCommon {
  std::string                id;
  std::optional<std::string> condition; // "if"
  OnFailure                  on_failure = OnFailure::kAbort;
};

struct Step;

struct LogStep {
  std::string message;
  std::string level = "info";
};

struct CopyStep {
  std::string from;
  std::string to;
  bool        recursive = false;
};

// Runs a replication file through the engine.
struct ReplicationStep {
  std::string              path;
  std::string              working_dir;
  std::string              range;
  std::optional<Mode>      mode;
  std::vector<std::string> streams;
  util::EnvMap             env;
};

struct HttpStep {
  std::string                        url;
  std::string                        method; // empty: GET, or POST with a payload
  std::string                        payload;
  std::map<std::string, std::string> headers;
};

struct CommandStep {
  std::vector<std::string> command;
  bool                     shell = false; // command[0] is run through /bin/sh -c
  bool                     print = false;
  bool                     capture = false;
  std::string              working_dir;
  util::EnvMap             env;
};

struct WriteStep {
  std::string to;
  std::string content;
};

struct ReadStep {
  std::string from;
  std::string into; // store key; empty keeps the content in the step output only
};

struct DeleteStep {
  std::string location;
  bool        recursive = false;
};

struct GroupStep {
  std::vector<Step>                      steps;
  util::EnvMap                           env;
  std::optional<google::protobuf::Value> loop;
};

struct StoreStep {
  std::string             key;
  google::protobuf::Value value;
  bool                    remove = false; // "delete"
};

// Engine-only hook, carried verbatim.
struct EngineStep {
  StepType                 type = StepType::kQuery;
  google::protobuf::Struct fields;
};

using StepBody = std::variant<LogStep, CopyStep, ReplicationStep, HttpStep, CommandStep, WriteStep, ReadStep,
                              DeleteStep, GroupStep, StoreStep, EngineStep>;

struct Step {
  StepCommon common;
  StepBody   body;

  StepType type() const;

  template <typename Body>
  static Step Make(Body body, StepCommon common = {}) {
    return Step{std::move(common), StepBody(std::move(body))};
  }
};

// Replication-level and stream-level hook slots.
struct HookMap {
  std::vector<Step> start;
  std::vector<Step> end;
  std::vector<Step> pre;
  std::vector<Step> post;

  bool empty() const {
    return start.empty() && end.empty() && pre.empty() && post.empty();
  }
};

} // namespace ferry::model
