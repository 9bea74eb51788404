#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/command/command_builder.hpp"
#include "internal/model/pipeline.hpp"
#include "internal/model/step.hpp"
#include "internal/steps/http_client.hpp"
#include "internal/steps/step_result.hpp"
#include "internal/steps/substitution.hpp"
#include "internal/transport/executor.hpp"

namespace ferry::steps {

/*
  Runs a pipeline's steps one after another in this process.

  Steps are checked up front: engine-only kinds and steps missing a
  required field raise ConfigurationError before anything runs. At run
  time a failing step with on_failure=abort ends the pipeline; warn and
  quiet record the failure and move on.

  replication and copy steps go through the engine; command steps spawn
  their own process; http steps use the HttpClient.
*/
class Interpreter {
 public:
  Interpreter(const command::CommandBuilder& builder, const transport::Executor& executor, const HttpClient& http);

  static void Validate(const std::vector<model::Step>& steps);

  PipelineResult Run(const model::Pipeline& pipeline);

  // `env` overlays the process environment.
  PipelineResult Run(const std::vector<model::Step>& steps, const util::EnvMap& env = {});

  // Values kept by store and read steps during the last Run.
  const Store& store() const {
    return store_;
  }

 private:
  PipelineResult RunSteps(const std::vector<model::Step>& steps, const Scope& scope);
  StepResult     RunStep(std::size_t index, const model::Step& step, const Scope& scope);

  std::string Execute(const model::LogStep& step, const Scope& scope);
  std::string Execute(const model::CopyStep& step, const Scope& scope);
  std::string Execute(const model::ReplicationStep& step, const Scope& scope);
  std::string Execute(const model::HttpStep& step, const Scope& scope);
  std::string Execute(const model::CommandStep& step, const Scope& scope);
  std::string Execute(const model::WriteStep& step, const Scope& scope);
  std::string Execute(const model::ReadStep& step, const Scope& scope);
  std::string Execute(const model::DeleteStep& step, const Scope& scope);
  std::string Execute(const model::GroupStep& step, const Scope& scope, std::vector<StepResult>* children);
  std::string Execute(const model::StoreStep& step, const Scope& scope);

  // Runs the invocation to completion; returns stdout when captured.
  std::string RunProcess(command::Invocation invocation, bool capture, bool print);

  const command::CommandBuilder& builder_;
  const transport::Executor&     executor_;
  const HttpClient&              http_;
  Store                          store_;
};

} // namespace ferry::steps
