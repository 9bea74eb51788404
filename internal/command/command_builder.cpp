#include "command_builder.hpp"

#include "internal/model/document.hpp"
#include "internal/model/options.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ferry::command {

using ferry::observability::StringField;
using ferry::util::ConfigurationError;

namespace {

constexpr const char* kPackageVariable = "FERRY_PACKAGE";

// The format named by an options blob, if any, as a pipe format.
std::optional<model::StreamFormat> DeclaredFormat(const model::Options& options, const std::string& side) {
  auto text = model::GetString(options, "format");
  if (!text || text->empty()) return std::nullopt;

  auto format = model::ParseFormat(*text);
  if (!format) {
    throw ConfigurationError(side + " format is not recognised: " + *text);
  }
  return model::ToStreamFormat(*format);
}

void ValidateRun(const model::RunSpec& spec, const std::optional<model::StreamFormat>& output) {
  if (output && spec.HasTarget()) {
    throw ConfigurationError(model::IsBatchFormat(*output)
                                 ? "batch streaming cannot be used with a target object"
                                 : "output streaming cannot be used with a target object");
  }

  if (!spec.input && spec.src_conn.empty() && spec.src_stream.empty()) {
    throw ConfigurationError("run requires a source connection, a source stream or input records");
  }

  if (spec.input) {
    auto declared = DeclaredFormat(spec.src_options, "source");
    if (declared && *declared != spec.input_format) {
      throw ConfigurationError("source format " + model::ToString(*declared) + " conflicts with input format " +
                               model::ToString(spec.input_format));
    }
  }

  if (output) {
    auto declared = DeclaredFormat(spec.tgt_options, "target");
    if (declared && *declared != *output) {
      if (model::IsBatchFormat(*output)) {
        throw ConfigurationError("batch streaming requires arrow output, target format is " +
                                 model::ToString(*declared));
      }
      throw ConfigurationError("output streaming in " + model::ToString(*output) + " conflicts with target format " +
                               model::ToString(*declared));
    }
  }
}

void AppendFlag(std::vector<std::string>* argv, const char* flag, const std::string& value) {
  if (value.empty()) return;
  argv->emplace_back(flag);
  argv->push_back(value);
}

} // namespace

std::string JoinColumns(const std::vector<std::string>& columns) {
  std::string joined;
  for (const auto& column : columns) {
    if (!joined.empty()) joined += ',';
    joined += column;
  }
  return joined;
}

CommandBuilder::CommandBuilder(const ferry::runtime::config::EngineConfig& engine, util::EnvMap process_env)
    : engine_(engine), process_env_(std::move(process_env)) {
  if (engine_.binary().empty()) {
    throw ConfigurationError("engine binary is not configured");
  }
}

Invocation CommandBuilder::Start(const std::string& verb, const util::EnvMap& spec_env, const util::EnvMap& step_env,
                                 bool debug) const {
  Invocation invocation;
  invocation.argv.push_back(engine_.binary());
  invocation.argv.push_back(verb);
  if (debug || engine_.debug()) {
    invocation.argv.emplace_back("-d");
  }

  invocation.env = util::EnvLayers{process_env_, spec_env, step_env}.Merge();
  if (invocation.env.find(kPackageVariable) == invocation.env.end()) {
    invocation.env[kPackageVariable] = engine_.package().empty() ? "cpp" : engine_.package();
  }
  return invocation;
}

Invocation CommandBuilder::BuildRun(const model::RunSpec& spec, std::optional<model::StreamFormat> output,
                                    const util::EnvMap& step_env) const {
  ValidateRun(spec, output);

  auto  invocation = Start("run", spec.env, step_env, spec.debug);
  auto& argv       = invocation.argv;

  model::Options src_options = spec.src_options;
  if (spec.input) {
    if (!spec.src_conn.empty() || !spec.src_stream.empty()) {
      FERRY_LOG_WARN("input records supersede the source connection",
                     {StringField("src_conn", spec.src_conn), StringField("src_stream", spec.src_stream)});
    }
    model::SetString(&src_options, "format", model::ToString(spec.input_format));
  } else {
    AppendFlag(&argv, "--src-conn", spec.src_conn);
    AppendFlag(&argv, "--src-stream", spec.src_stream);
  }
  if (src_options.fields_size() > 0) {
    AppendFlag(&argv, "--src-options", model::ToJson(src_options));
  }

  model::Options tgt_options = spec.tgt_options;
  if (output) {
    model::SetString(&tgt_options, "format", model::ToString(*output));
  }
  AppendFlag(&argv, "--tgt-conn", spec.tgt_conn);
  AppendFlag(&argv, "--tgt-object", spec.tgt_object);
  if (tgt_options.fields_size() > 0) {
    AppendFlag(&argv, "--tgt-options", model::ToJson(tgt_options));
  }

  if (spec.mode) AppendFlag(&argv, "--mode", model::ToString(*spec.mode));
  AppendFlag(&argv, "--primary-key", JoinColumns(spec.primary_key));
  AppendFlag(&argv, "--update-key", spec.update_key);
  AppendFlag(&argv, "--select", JoinColumns(spec.select));
  AppendFlag(&argv, "--where", spec.where);
  if (spec.limit) AppendFlag(&argv, "--limit", std::to_string(*spec.limit));
  if (spec.offset) AppendFlag(&argv, "--offset", std::to_string(*spec.offset));
  AppendFlag(&argv, "--range", spec.range);
  if (spec.columns) AppendFlag(&argv, "--columns", model::ToJson(*spec.columns));
  if (spec.transforms) AppendFlag(&argv, "--transforms", model::ToJson(*spec.transforms));

  if (output || !spec.HasTarget()) {
    argv.emplace_back("--stdout");
  }
  return invocation;
}

Invocation CommandBuilder::BuildTask(const model::RunSpec& spec, bool to_stdout, const util::EnvMap& step_env) const {
  if (spec.input) {
    throw ConfigurationError("task documents cannot carry input records; use a direct run");
  }
  if (to_stdout && spec.HasTarget()) {
    throw ConfigurationError("stdout output cannot be used with a target object");
  }
  if (spec.src_conn.empty() && spec.src_stream.empty()) {
    throw ConfigurationError("task requires a source connection or stream");
  }

  auto document = model::ToDocument(spec, model::DocumentPurpose::kEngine);
  if (to_stdout) {
    auto& options = (*document.mutable_struct_value()->mutable_fields())["options"];
    (*options.mutable_struct_value()->mutable_fields())["stdout"].set_bool_value(true);
  }

  auto invocation          = Start("run", spec.env, step_env, spec.debug);
  invocation.temp_artifact = TempArtifact::Create(engine_.temp_dir(), "task", model::ToJson(document));
  invocation.argv.emplace_back("-c");
  invocation.argv.push_back(invocation.temp_artifact->path().string());
  return invocation;
}

Invocation CommandBuilder::BuildReplication(const model::Replication& replication,
                                            const ReplicationSelection& selection,
                                            const util::EnvMap& step_env) const {
  replication.Validate();

  auto invocation = Start("run", replication.env, step_env, replication.debug);
  if (replication.file_path.empty()) {
    invocation.temp_artifact = TempArtifact::Create(
        engine_.temp_dir(), "replication", model::ReplicationToJson(replication, model::DocumentPurpose::kEngine));
  }

  invocation.argv.emplace_back("-r");
  invocation.argv.push_back(invocation.temp_artifact ? invocation.temp_artifact->path().string()
                                                     : replication.file_path);
  AppendFlag(&invocation.argv, "--streams", JoinColumns(selection.streams));
  if (selection.mode) AppendFlag(&invocation.argv, "--mode", model::ToString(*selection.mode));
  AppendFlag(&invocation.argv, "--range", selection.range);
  return invocation;
}

Invocation CommandBuilder::BuildPipeline(const model::Pipeline& pipeline, const util::EnvMap& step_env) const {
  pipeline.Validate();

  auto invocation = Start("run", pipeline.env, step_env, false);
  if (pipeline.file_path.empty()) {
    invocation.temp_artifact =
        TempArtifact::Create(engine_.temp_dir(), "pipeline",
                             model::ToJson(model::ToDocument(pipeline, model::DocumentPurpose::kEngine)));
  }

  invocation.argv.emplace_back("-p");
  invocation.argv.push_back(invocation.temp_artifact ? invocation.temp_artifact->path().string()
                                                     : pipeline.file_path);
  return invocation;
}

Invocation CommandBuilder::BuildCopy(const std::string& from, const std::string& to, bool recursive,
                                     const util::EnvMap& step_env) const {
  if (from.empty() || to.empty()) {
    throw ConfigurationError("copy requires both a source and a destination location");
  }

  auto invocation = Start("copy", {}, step_env, false);
  AppendFlag(&invocation.argv, "--from", from);
  AppendFlag(&invocation.argv, "--to", to);
  if (recursive) invocation.argv.emplace_back("--recursive");
  return invocation;
}

Invocation CommandBuilder::BuildCli(const std::vector<std::string>& args, const util::EnvMap& step_env) const {
  Invocation invocation;
  invocation.argv.push_back(engine_.binary());
  invocation.argv.insert(invocation.argv.end(), args.begin(), args.end());
  invocation.env = util::EnvLayers{process_env_, {}, step_env}.Merge();
  if (invocation.env.find(kPackageVariable) == invocation.env.end()) {
    invocation.env[kPackageVariable] = engine_.package().empty() ? "cpp" : engine_.package();
  }
  return invocation;
}

} // namespace ferry::command
