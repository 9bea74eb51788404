#include "interpreter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <variant>

#include "internal/model/document.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ferry::steps {

using ferry::observability::IntField;
using ferry::observability::StringField;
using ferry::util::ConfigurationError;
using ferry::util::ResourceError;

namespace {

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += separator;
    out += parts[i];
  }
  return out;
}

std::string Upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return text;
}

constexpr std::string_view kFileScheme = "file://";

// Upper bound for a numeric group loop.
constexpr double kMaxLoopCount = 1000000;

bool IsFileUrl(const std::string& location) {
  return location.compare(0, kFileScheme.size(), kFileScheme) == 0;
}

bool IsLocal(const std::string& location) {
  return IsFileUrl(location) || location.find("://") == std::string::npos;
}

// file:// URLs and plain paths only; everything else needs the engine.
std::string LocalPath(const std::string& location, const char* kind) {
  if (!IsLocal(location)) {
    throw ConfigurationError(std::string(kind) + " steps only handle local paths, got '" + location + "'");
  }
  return IsFileUrl(location) ? location.substr(kFileScheme.size()) : location;
}

int64_t LoopCount(double number) {
  if (!std::isfinite(number) || number < 0 || number > kMaxLoopCount || number != std::trunc(number)) {
    throw ConfigurationError("group loop count must be a whole number from 0 to " +
                             std::to_string(static_cast<int64_t>(kMaxLoopCount)));
  }
  return static_cast<int64_t>(number);
}

std::string ValueText(const google::protobuf::Value& value, const Scope& scope) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return Substitute(value.string_value(), scope);
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      if (std::fabs(number) < 9.0e18 && number == std::trunc(number)) {
        return std::to_string(static_cast<int64_t>(number));
      }
      return model::ToJson(value);
    }
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      return {};
    default:
      return model::ToJson(value);
  }
}

/*
  Loop items: a list iterates its elements, a number N iterates
  0..N-1, a string is substituted and then read as JSON (list or
  number) or taken as a single item.
*/
std::vector<std::string> LoopItems(const google::protobuf::Value& loop, const Scope& scope) {
  std::vector<std::string> items;
  switch (loop.kind_case()) {
    case google::protobuf::Value::kListValue:
      for (const auto& item : loop.list_value().values()) items.push_back(ValueText(item, scope));
      return items;
    case google::protobuf::Value::kNumberValue: {
      const auto count = LoopCount(loop.number_value());
      for (int64_t i = 0; i < count; ++i) items.push_back(std::to_string(i));
      return items;
    }
    case google::protobuf::Value::kStringValue: {
      const auto text = Substitute(loop.string_value(), scope);
      if (text.empty()) return items;
      try {
        auto parsed = model::FromJson(text);
        if (parsed.kind_case() == google::protobuf::Value::kListValue ||
            parsed.kind_case() == google::protobuf::Value::kNumberValue) {
          return LoopItems(parsed, scope);
        }
      } catch (const ConfigurationError&) {
        // not JSON: a single item
      }
      items.push_back(text);
      return items;
    }
    default:
      throw ConfigurationError("group loop must be a list, a number or a string");
  }
}

void Require(bool present, const std::string& where, const char* what) {
  if (!present) throw ConfigurationError(where + ": " + what);
}

// A literal location must be local; one with substitutions is checked when the step runs.
void RequireLocal(const std::string& location, const std::string& where) {
  if (location.find('{') == std::string::npos && !IsLocal(location)) {
    throw ConfigurationError(where + ": only local paths are handled here, got '" + location + "'");
  }
}

void ValidateLoop(const google::protobuf::Value& loop, const std::string& where) {
  switch (loop.kind_case()) {
    case google::protobuf::Value::kListValue:
    case google::protobuf::Value::kStringValue:
      return;
    case google::protobuf::Value::kNumberValue:
      try {
        LoopCount(loop.number_value());
      } catch (const ConfigurationError& e) {
        throw ConfigurationError(where + ": " + e.what());
      }
      return;
    default:
      throw ConfigurationError(where + ": group loop must be a list, a number or a string");
  }
}

void ValidateSteps(const std::vector<model::Step>& steps, const std::string& prefix) {
  for (std::size_t i = 0; i < steps.size(); ++i) {
    const auto& step  = steps[i];
    const auto  where = "step " + prefix + std::to_string(i) + " (" + model::ToString(step.type()) + ")";

    std::visit(
        [&](const auto& body) {
          using Body = std::decay_t<decltype(body)>;
          if constexpr (std::is_same_v<Body, model::EngineStep>) {
            throw ConfigurationError(where + ": this step kind runs only inside the engine");
          } else if constexpr (std::is_same_v<Body, model::CopyStep>) {
            Require(!body.from.empty() && !body.to.empty(), where, "'from' and 'to' are required");
          } else if constexpr (std::is_same_v<Body, model::ReplicationStep>) {
            Require(!body.path.empty(), where, "'path' is required");
          } else if constexpr (std::is_same_v<Body, model::HttpStep>) {
            Require(!body.url.empty(), where, "'url' is required");
          } else if constexpr (std::is_same_v<Body, model::CommandStep>) {
            Require(!body.command.empty(), where, "'command' is required");
          } else if constexpr (std::is_same_v<Body, model::WriteStep>) {
            Require(!body.to.empty(), where, "'to' is required");
            RequireLocal(body.to, where);
          } else if constexpr (std::is_same_v<Body, model::ReadStep>) {
            Require(!body.from.empty(), where, "'from' is required");
            RequireLocal(body.from, where);
          } else if constexpr (std::is_same_v<Body, model::DeleteStep>) {
            Require(!body.location.empty(), where, "'location' is required");
            RequireLocal(body.location, where);
          } else if constexpr (std::is_same_v<Body, model::StoreStep>) {
            Require(!body.key.empty(), where, "'key' is required");
          } else if constexpr (std::is_same_v<Body, model::GroupStep>) {
            if (body.loop) ValidateLoop(*body.loop, where);
            ValidateSteps(body.steps, prefix + std::to_string(i) + ".");
          }
        },
        step.body);
  }
}

util::EnvMap SubstituteEnv(const util::EnvMap& env, const Scope& scope) {
  util::EnvMap out;
  for (const auto& [key, value] : env) out[key] = Substitute(value, scope);
  return out;
}

} // namespace

Interpreter::Interpreter(const command::CommandBuilder& builder, const transport::Executor& executor,
                         const HttpClient& http)
    : builder_(builder), executor_(executor), http_(http) {
}

void Interpreter::Validate(const std::vector<model::Step>& steps) {
  ValidateSteps(steps, "");
}

PipelineResult Interpreter::Run(const model::Pipeline& pipeline) {
  if (pipeline.steps.empty() && !pipeline.file_path.empty()) {
    throw ConfigurationError("pipeline file " + pipeline.file_path + " must be loaded before it can be interpreted");
  }
  pipeline.Validate();
  return Run(pipeline.steps, pipeline.env);
}

PipelineResult Interpreter::Run(const std::vector<model::Step>& steps, const util::EnvMap& env) {
  Validate(steps);

  store_.clear();
  Scope scope;
  scope.env   = util::EnvLayers{builder_.process_env(), env, {}}.Merge();
  scope.store = &store_;

  FERRY_LOG_INFO("pipeline started", {IntField("steps", static_cast<int64_t>(steps.size()))});
  auto result = RunSteps(steps, scope);
  if (result.ok()) {
    FERRY_LOG_INFO("pipeline finished", {IntField("steps", static_cast<int64_t>(result.steps.size()))});
  } else {
    FERRY_LOG_ERROR("pipeline halted", {IntField("failed_index", static_cast<int64_t>(*result.failed_index))});
  }
  return result;
}

PipelineResult Interpreter::RunSteps(const std::vector<model::Step>& steps, const Scope& scope) {
  PipelineResult out;
  for (std::size_t i = 0; i < steps.size(); ++i) {
    auto       result = RunStep(i, steps[i], scope);
    const bool failed = result.status == StepStatus::kFailed;

    if (failed) {
      const auto& error = *result.error;
      switch (steps[i].common.on_failure) {
        case model::OnFailure::kAbort:
          FERRY_LOG_ERROR(error.what(), {StringField("step_id", result.id)});
          out.failed_index = i;
          break;
        case model::OnFailure::kWarn:
          FERRY_LOG_WARN(error.what(), {StringField("step_id", result.id)});
          break;
        case model::OnFailure::kQuiet:
          FERRY_LOG_DEBUG(error.what(), {StringField("step_id", result.id)});
          break;
      }
    }

    out.steps.push_back(std::move(result));
    if (out.failed_index) break;
  }
  return out;
}

StepResult Interpreter::RunStep(std::size_t index, const model::Step& step, const Scope& scope) {
  StepResult result;
  result.index = index;
  result.id    = step.common.id;
  result.type  = step.type();

  const auto type_name = model::ToString(result.type);

  observability::SpanScope span(observability::kStepSpan);
  span.SetAttribute("step.index", static_cast<std::int64_t>(index));
  span.SetAttribute("step.type", type_name);

  if (step.common.condition && !EvaluateCondition(*step.common.condition, scope)) {
    result.status = StepStatus::kSkipped;
    span.AddEvent("skipped");
    FERRY_LOG_DEBUG("step skipped", {IntField("index", static_cast<int64_t>(index)), StringField("type", type_name)});
    return result;
  }

  const auto start = util::SteadyClock::now();
  try {
    result.output = std::visit(
        [&](const auto& body) -> std::string {
          using Body = std::decay_t<decltype(body)>;
          if constexpr (std::is_same_v<Body, model::GroupStep>) {
            return Execute(body, scope, &result.children);
          } else if constexpr (std::is_same_v<Body, model::EngineStep>) {
            throw ConfigurationError("'" + type_name + "' steps run only inside the engine");
          } else {
            return Execute(body, scope);
          }
        },
        step.body);
    result.status = StepStatus::kSucceeded;
  } catch (const std::exception& e) {
    result.status = StepStatus::kFailed;
    result.error.emplace(index, type_name, util::ClassifyError(e), e.what(), std::current_exception());
    span.RecordError(e);
  }
  result.duration = std::chrono::milliseconds(util::ElapsedMillis(start));

  FERRY_LOG_DEBUG("step finished", {IntField("index", static_cast<int64_t>(index)), StringField("type", type_name),
                                    StringField("status", ToString(result.status)),
                                    IntField("duration_ms", result.duration.count())});
  return result;
}

// ------------------------------------------------------------
// Step bodies
// ------------------------------------------------------------

std::string Interpreter::Execute(const model::LogStep& step, const Scope& scope) {
  auto message = Substitute(step.message, scope);
  observability::Log(observability::ParseLevel(step.level), message);
  return message;
}

std::string Interpreter::Execute(const model::CopyStep& step, const Scope& scope) {
  auto invocation = builder_.BuildCopy(Substitute(step.from, scope), Substitute(step.to, scope), step.recursive,
                                       scope.env);
  return RunProcess(std::move(invocation), false, true);
}

std::string Interpreter::Execute(const model::ReplicationStep& step, const Scope& scope) {
  model::Replication replication;
  replication.file_path = Substitute(step.path, scope);

  command::ReplicationSelection selection;
  selection.streams = step.streams;
  selection.mode    = step.mode;
  selection.range   = Substitute(step.range, scope);

  auto invocation        = builder_.BuildReplication(replication, selection,
                                                     util::Overlay(scope.env, SubstituteEnv(step.env, scope)));
  invocation.working_dir = Substitute(step.working_dir, scope);
  return RunProcess(std::move(invocation), false, true);
}

std::string Interpreter::Execute(const model::HttpStep& step, const Scope& scope) {
  HttpRequest request;
  request.url  = Substitute(step.url, scope);
  request.body = Substitute(step.payload, scope);
  if (step.method.empty()) {
    request.method = request.body.empty() ? "GET" : "POST";
  } else {
    request.method = Upper(Substitute(step.method, scope));
  }
  for (const auto& [name, value] : step.headers) request.headers[name] = Substitute(value, scope);

  auto response = http_.Send(request);
  if (response.status >= 400) {
    throw util::HttpError(response.status, request.method + " " + request.url + " returned HTTP " +
                                               std::to_string(response.status));
  }
  return response.body;
}

std::string Interpreter::Execute(const model::CommandStep& step, const Scope& scope) {
  std::vector<std::string> args;
  args.reserve(step.command.size());
  for (const auto& arg : step.command) args.push_back(Substitute(arg, scope));

  command::Invocation invocation;
  if (step.shell) {
    invocation.argv = {"/bin/sh", "-c", Join(args, " ")};
  } else {
    invocation.argv = std::move(args);
  }
  invocation.env         = util::Overlay(scope.env, SubstituteEnv(step.env, scope));
  invocation.working_dir = Substitute(step.working_dir, scope);
  return RunProcess(std::move(invocation), step.capture, step.print);
}

std::string Interpreter::Execute(const model::WriteStep& step, const Scope& scope) {
  const auto path = LocalPath(Substitute(step.to, scope), "write");

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw ResourceError("cannot open " + path + " for writing");
  out << Substitute(step.content, scope);
  out.close();
  if (!out) throw ResourceError("failed writing " + path);
  return path;
}

std::string Interpreter::Execute(const model::ReadStep& step, const Scope& scope) {
  const auto path = LocalPath(Substitute(step.from, scope), "read");

  std::ifstream in(path, std::ios::binary);
  if (!in) throw ResourceError("cannot open " + path + " for reading");
  std::ostringstream content;
  content << in.rdbuf();

  auto text = content.str();
  if (!step.into.empty()) store_[Substitute(step.into, scope)] = text;
  return text;
}

std::string Interpreter::Execute(const model::DeleteStep& step, const Scope& scope) {
  namespace fs    = std::filesystem;
  const auto path = LocalPath(Substitute(step.location, scope), "delete");

  std::error_code ec;
  if (!fs::exists(path, ec)) return {};
  if (step.recursive) {
    fs::remove_all(path, ec);
  } else {
    fs::remove(path, ec);
  }
  if (ec) throw ResourceError("cannot delete " + path + ": " + ec.message());
  return path;
}

std::string Interpreter::Execute(const model::GroupStep& step, const Scope& scope, std::vector<StepResult>* children) {
  Scope inner = scope;
  inner.env   = util::Overlay(scope.env, SubstituteEnv(step.env, scope));

  auto run_once = [&]() {
    auto result = RunSteps(step.steps, inner);
    for (auto& child : result.steps) children->push_back(std::move(child));
    if (!result.ok()) children->back().error->RethrowCause();
  };

  if (!step.loop) {
    run_once();
    return {};
  }

  const auto items = LoopItems(*step.loop, scope);
  for (std::size_t i = 0; i < items.size(); ++i) {
    inner.loop = LoopFrame{items[i], i};
    run_once();
  }
  return std::to_string(items.size());
}

std::string Interpreter::Execute(const model::StoreStep& step, const Scope& scope) {
  const auto key = Substitute(step.key, scope);
  if (step.remove) {
    store_.erase(key);
    return {};
  }
  auto text   = ValueText(step.value, scope);
  store_[key] = text;
  return text;
}

std::string Interpreter::RunProcess(command::Invocation invocation, bool capture, bool print) {
  transport::ExecuteOptions options;
  options.echo_stderr = print;
  options.full_stderr = true;

  auto handle = executor_.Execute(std::move(invocation), options);
  if (!capture) {
    transport::RunToCompletion(*handle, !print);
    return {};
  }

  auto        output = transport::RunToCompletion(*handle, true);
  std::string text;
  for (const auto& line : output.lines) {
    if (print) FERRY_LOG_INFO(line, {StringField("stream", "stdout")});
    text += line;
    text += '\n';
  }
  return text;
}

} // namespace ferry::steps
