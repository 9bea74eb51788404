#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/command/command_builder.hpp"
#include "internal/model/enums.hpp"
#include "internal/model/record_source.hpp"
#include "internal/process/process_handle.hpp"

namespace ferry::transport {

struct ExecuteOptions {
  // Records fed to the engine's stdin; stdin is not wired when null.
  std::shared_ptr<model::RecordSource> input;
  model::StreamFormat                  input_format{model::StreamFormat::kCsv};

  // Log engine stderr lines as they arrive.
  bool echo_stderr{false};

  // Keep all of stderr rather than the configured tail (no-streaming runs).
  bool full_stderr{false};
};

/*
  Spawns the engine for one invocation.

  stdout is always piped; the caller either hands the handle to a
  decoder (output streaming) or to RunToCompletion.
*/
class Executor {
 public:
  explicit Executor(const ferry::runtime::config::EngineConfig& engine);

  std::unique_ptr<process::ProcessHandle> Execute(command::Invocation invocation,
                                                  const ExecuteOptions& options = {}) const;

  const ferry::runtime::config::EngineConfig& engine() const {
    return engine_;
  }

 private:
  ferry::runtime::config::EngineConfig engine_;
};

struct RunOutput {
  process::ExitResult      exit;
  std::vector<std::string> lines; // stdout, only when captured
};

/*
  No-streaming mode: consumes stdout line by line, either logging each
  line or keeping it, then waits. Throws like ProcessHandle::Wait().
*/
RunOutput RunToCompletion(process::ProcessHandle& handle, bool capture_output);

} // namespace ferry::transport
