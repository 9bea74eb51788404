#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/command/command_builder.hpp"
#include "internal/decode/record_stream.hpp"
#include "internal/model/enums.hpp"
#include "internal/model/pipeline.hpp"
#include "internal/model/replication.hpp"
#include "internal/model/run_spec.hpp"
#include "internal/observability/spans.hpp"
#include "internal/process/process_handle.hpp"
#include "internal/steps/http_client.hpp"
#include "internal/steps/step_result.hpp"
#include "internal/transport/executor.hpp"
#include "internal/util/env.hpp"

namespace ferry::client {

struct RunResult {
  std::vector<std::string> argv;
  process::ExitResult      exit;
  std::vector<std::string> output; // engine stdout, when captured
};

/*
  Entry point for embedding the bridge.

  Every call builds the invocation first (ConfigurationError never
  launches anything), then owns the engine process until it returns or,
  for the streaming calls, until the returned stream is finished,
  closed or destroyed.
*/
class FerryClient {
 public:
  explicit FerryClient(const ferry::runtime::config::RuntimeConfig& config);
  FerryClient(const ferry::runtime::config::RuntimeConfig& config, util::EnvMap process_env);

  // Direct mode without output streaming. Throws ProcessError on failure.
  RunResult Run(const model::RunSpec& spec, bool capture_output = false) const;

  // Direct mode with the engine's stdout decoded row by row.
  decode::RecordStream Stream(const model::RunSpec& spec, model::StreamFormat format = model::StreamFormat::kCsv) const;

  // Direct mode with Arrow IPC output, batch by batch.
  decode::BatchStream StreamBatches(const model::RunSpec& spec) const;

  RunResult RunTask(const model::AdaptedTask& task, bool capture_output = false) const;

  // Task document with the engine's stdout decoded row by row. The document is a temp artifact.
  decode::RecordStream StreamTask(const model::AdaptedTask& task,
                                  model::StreamFormat format = model::StreamFormat::kCsv) const;

  RunResult RunReplication(const model::Replication& replication, const command::ReplicationSelection& selection = {},
                           bool capture_output = false) const;

  // The engine runs the pipeline.
  RunResult RunPipeline(const model::Pipeline& pipeline, bool capture_output = false) const;

  // This process runs the pipeline. A pipeline given only as a file is loaded first.
  steps::PipelineResult Interpret(const model::Pipeline& pipeline) const;

  // Engine binary with raw arguments.
  RunResult Cli(const std::vector<std::string>& args, bool capture_output = false) const;

  const ferry::runtime::config::RuntimeConfig& config() const {
    return config_;
  }

  const command::CommandBuilder& builder() const {
    return builder_;
  }

 private:
  RunResult Execute(command::Invocation invocation, const transport::ExecuteOptions& options,
                    bool capture_output) const;

  std::unique_ptr<process::ProcessHandle> Launch(command::Invocation invocation, const model::RunSpec& spec,
                                                 observability::SpanScope* span) const;

  ferry::runtime::config::RuntimeConfig config_;
  command::CommandBuilder               builder_;
  transport::Executor                   executor_;
  steps::HttpClient                     http_;
};

} // namespace ferry::client
