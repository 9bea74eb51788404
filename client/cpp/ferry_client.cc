#include "client/cpp/ferry_client.h"

#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/model/document.hpp"
#include "internal/model/options.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/steps/interpreter.hpp"

namespace ferry::client {

using ferry::observability::IntField;
using ferry::observability::StringField;

FerryClient::FerryClient(const ferry::runtime::config::RuntimeConfig& config)
    : FerryClient(config, util::CaptureProcessEnvironment()) {
}

FerryClient::FerryClient(const ferry::runtime::config::RuntimeConfig& config, util::EnvMap process_env)
    : config_(config), builder_(config.engine(), std::move(process_env)), executor_(config.engine()),
      http_(config.http()) {
}

RunResult FerryClient::Run(const model::RunSpec& spec, bool capture_output) const {
  auto invocation = builder_.BuildRun(spec);

  transport::ExecuteOptions options;
  options.input        = spec.input;
  options.input_format = spec.input_format;
  options.echo_stderr  = !capture_output;
  return Execute(std::move(invocation), options, capture_output);
}

std::unique_ptr<process::ProcessHandle> FerryClient::Launch(command::Invocation invocation, const model::RunSpec& spec,
                                                            observability::SpanScope* span) const {
  span->SetAttribute("transfer.verb", invocation.verb());
  span->SetAttribute("transfer.streaming", std::string_view("output"));

  transport::ExecuteOptions options;
  options.input        = spec.input;
  options.input_format = spec.input_format;

  try {
    auto handle = executor_.Execute(std::move(invocation), options);
    span->SetAttribute("transfer.pid", static_cast<std::int64_t>(handle->pid()));
    // The stream ends the span; it may outlive the caller's active context.
    span->Deactivate();
    return handle;
  } catch (const std::exception& e) {
    span->RecordError(e);
    throw;
  }
}

decode::RecordStream FerryClient::Stream(const model::RunSpec& spec, model::StreamFormat format) const {
  auto invocation = builder_.BuildRun(spec, format);

  observability::SpanScope span(observability::kTransferSpan);
  auto                     handle = Launch(std::move(invocation), spec, &span);
  return decode::RecordStream(std::move(handle), format, std::move(span));
}

decode::RecordStream FerryClient::StreamTask(const model::AdaptedTask& task, model::StreamFormat format) const {
  auto spec = task.spec;
  model::SetString(&spec.tgt_options, "format", model::ToString(format));
  auto invocation = builder_.BuildTask(spec, true);

  observability::SpanScope span(observability::kTransferSpan);
  auto                     handle = Launch(std::move(invocation), spec, &span);
  return decode::RecordStream(std::move(handle), format, std::move(span));
}

decode::BatchStream FerryClient::StreamBatches(const model::RunSpec& spec) const {
  auto invocation = builder_.BuildRun(spec, model::StreamFormat::kArrow);

  observability::SpanScope span(observability::kTransferSpan);
  auto                     handle = Launch(std::move(invocation), spec, &span);
  return decode::BatchStream(std::move(handle), std::move(span));
}

RunResult FerryClient::RunTask(const model::AdaptedTask& task, bool capture_output) const {
  auto invocation = builder_.BuildTask(task.spec, task.to_stdout);

  transport::ExecuteOptions options;
  options.input        = task.spec.input;
  options.input_format = task.spec.input_format;
  options.echo_stderr  = !capture_output;
  return Execute(std::move(invocation), options, capture_output);
}

RunResult FerryClient::RunReplication(const model::Replication& replication,
                                      const command::ReplicationSelection& selection, bool capture_output) const {
  transport::ExecuteOptions options;
  options.echo_stderr = !capture_output;
  return Execute(builder_.BuildReplication(replication, selection), options, capture_output);
}

RunResult FerryClient::RunPipeline(const model::Pipeline& pipeline, bool capture_output) const {
  transport::ExecuteOptions options;
  options.echo_stderr = !capture_output;
  return Execute(builder_.BuildPipeline(pipeline), options, capture_output);
}

steps::PipelineResult FerryClient::Interpret(const model::Pipeline& pipeline) const {
  steps::Interpreter interpreter(builder_, executor_, http_);
  if (!pipeline.steps.empty() || pipeline.file_path.empty()) {
    return interpreter.Run(pipeline);
  }

  auto loaded = model::PipelineFromDocument(config::ConfigLoader::LoadDocument(pipeline.file_path));
  loaded.env  = util::Overlay(std::move(loaded.env), pipeline.env);
  return interpreter.Run(loaded);
}

RunResult FerryClient::Cli(const std::vector<std::string>& args, bool capture_output) const {
  transport::ExecuteOptions options;
  options.echo_stderr = !capture_output;
  return Execute(builder_.BuildCli(args), options, capture_output);
}

RunResult FerryClient::Execute(command::Invocation invocation, const transport::ExecuteOptions& options,
                               bool capture_output) const {
  observability::SpanScope span(observability::kTransferSpan);
  span.SetAttribute("transfer.verb", invocation.verb());

  RunResult result;
  result.argv = invocation.argv;

  FERRY_LOG_DEBUG("starting engine", {StringField("verb", invocation.verb()),
                                      StringField("binary", result.argv.front())});

  auto blocking        = options;
  blocking.full_stderr = true;

  try {
    auto handle   = executor_.Execute(std::move(invocation), blocking);
    auto output   = transport::RunToCompletion(*handle, capture_output);
    result.exit   = std::move(output.exit);
    result.output = std::move(output.lines);
  } catch (const std::exception& e) {
    span.RecordError(e);
    throw;
  }

  span.SetAttribute("transfer.exit_code", static_cast<std::int64_t>(result.exit.exit_code));
  FERRY_LOG_DEBUG("engine finished", {IntField("exit_code", result.exit.exit_code),
                                      IntField("lines", static_cast<int64_t>(result.output.size()))});
  return result;
}

} // namespace ferry::client
