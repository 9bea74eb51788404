#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/command/temp_artifact.hpp"
#include "internal/model/enums.hpp"
#include "internal/model/pipeline.hpp"
#include "internal/model/replication.hpp"
#include "internal/model/run_spec.hpp"
#include "internal/util/env.hpp"

namespace ferry::command {

/*
  Everything needed to spawn one engine process.

  argv[0] is the engine binary. The temp artifact, when present, is the
  document argv refers to; whoever ends up owning the Invocation owns
  the file.
*/
struct Invocation {
  std::vector<std::string>      argv;
  util::EnvMap                  env;
  std::unique_ptr<TempArtifact> temp_artifact;
  std::string                   working_dir;

  // "run", "copy", ... or empty for a bare binary.
  std::string verb() const {
    return argv.size() > 1 ? argv[1] : std::string();
  }
};

// Narrows a replication run to part of its streams.
struct ReplicationSelection {
  std::vector<std::string>   streams;
  std::optional<model::Mode> mode;
  std::string                range;
};

/*
  Maps configuration objects to engine invocations.

  Every Build* call validates first and throws ConfigurationError before
  anything touches the filesystem. Environment layers merge as
  process < document < step; argv order is fixed for a given input.
*/
class CommandBuilder {
 public:
  explicit CommandBuilder(const ferry::runtime::config::EngineConfig& engine,
                          util::EnvMap process_env = util::CaptureProcessEnvironment());

  /*
    Direct mode: `run` with discrete flags.

    `output` requests the engine's stdout as a record stream in that
    format; it cannot be combined with a target. When the RunSpec carries
    `input`, the engine reads stdin in spec.input_format.
  */
  Invocation BuildRun(const model::RunSpec& spec, std::optional<model::StreamFormat> output = std::nullopt,
                      const util::EnvMap& step_env = {}) const;

  // Task document: `run -c <file>`.
  Invocation BuildTask(const model::RunSpec& spec, bool to_stdout = false, const util::EnvMap& step_env = {}) const;

  // `run -r <file>`, writing the replication to a temp document unless it has a file path.
  Invocation BuildReplication(const model::Replication& replication, const ReplicationSelection& selection = {},
                              const util::EnvMap& step_env = {}) const;

  // `run -p <file>`.
  Invocation BuildPipeline(const model::Pipeline& pipeline, const util::EnvMap& step_env = {}) const;

  Invocation BuildCopy(const std::string& from, const std::string& to, bool recursive,
                       const util::EnvMap& step_env = {}) const;

  // Raw pass-through: engine binary followed by `args`.
  Invocation BuildCli(const std::vector<std::string>& args, const util::EnvMap& step_env = {}) const;

  const ferry::runtime::config::EngineConfig& engine() const {
    return engine_;
  }

  const util::EnvMap& process_env() const {
    return process_env_;
  }

 private:
  Invocation Start(const std::string& verb, const util::EnvMap& spec_env, const util::EnvMap& step_env,
                   bool debug) const;

  ferry::runtime::config::EngineConfig engine_;
  util::EnvMap                         process_env_;
};

// "a,b,c"
std::string JoinColumns(const std::vector<std::string>& columns);

} // namespace ferry::command
