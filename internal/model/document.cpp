#include "document.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>

#include "internal/util/errors.hpp"

namespace ferry::model {

using google::protobuf::Struct;
using JsonValue = google::protobuf::Value;
using ferry::util::ConfigurationError;

namespace {

// ------------------------------------------------------------
// Writers
// ------------------------------------------------------------

JsonValue StringValue(const std::string& text) {
  JsonValue value;
  value.set_string_value(text);
  return value;
}

JsonValue NumberValue(double number) {
  JsonValue value;
  value.set_number_value(number);
  return value;
}

JsonValue BoolValue(bool flag) {
  JsonValue value;
  value.set_bool_value(flag);
  return value;
}

JsonValue StructValue(Struct fields) {
  JsonValue value;
  *value.mutable_struct_value() = std::move(fields);
  return value;
}

JsonValue StringList(const std::vector<std::string>& items) {
  JsonValue value;
  auto* list = value.mutable_list_value();
  for (const auto& item : items) {
    list->add_values()->set_string_value(item);
  }
  return value;
}

JsonValue StepList(const std::vector<Step>& steps) {
  JsonValue value;
  auto* list = value.mutable_list_value();
  for (const auto& step : steps) {
    *list->add_values() = ToDocument(step);
  }
  return value;
}

JsonValue EnvValue(const util::EnvMap& env) {
  Struct fields;
  for (const auto& [key, text] : env) {
    (*fields.mutable_fields())[key].set_string_value(text);
  }
  return StructValue(std::move(fields));
}

void Put(Struct* out, const std::string& key, JsonValue value) {
  (*out->mutable_fields())[key] = std::move(value);
}

void PutString(Struct* out, const std::string& key, const std::string& text) {
  if (!text.empty()) Put(out, key, StringValue(text));
}

void PutList(Struct* out, const std::string& key, const std::vector<std::string>& items) {
  if (!items.empty()) Put(out, key, StringList(items));
}

void PutFlag(Struct* out, const std::string& key, bool flag) {
  if (flag) Put(out, key, BoolValue(true));
}

void PutEnv(Struct* out, const std::string& key, const util::EnvMap& env) {
  if (!env.empty()) Put(out, key, EnvValue(env));
}

void PutOptions(Struct* out, const std::string& key, const Options& options) {
  if (options.fields_size() > 0) Put(out, key, StructValue(options));
}

// ------------------------------------------------------------
// Readers
// ------------------------------------------------------------

const Struct& RequireStruct(const JsonValue& value, const std::string& what) {
  if (value.kind_case() != JsonValue::kStructValue) {
    throw ConfigurationError(what + " must be a mapping");
  }
  return value.struct_value();
}

// nullptr when absent or null.
const JsonValue* Field(const Struct& in, const std::string& key) {
  auto it = in.fields().find(key);
  if (it == in.fields().end() || it->second.kind_case() == JsonValue::kNullValue) {
    return nullptr;
  }
  return &it->second;
}

std::string NumberText(double number) {
  if (std::isfinite(number) && number == std::trunc(number) && std::fabs(number) < 9.007199254740992e15) {
    return std::to_string(static_cast<int64_t>(number));
  }
  std::ostringstream out;
  out.precision(17);
  out << number;
  return out.str();
}

std::string ScalarText(const JsonValue& value, const std::string& key) {
  switch (value.kind_case()) {
    case JsonValue::kStringValue:
      return value.string_value();
    case JsonValue::kNumberValue:
      return NumberText(value.number_value());
    case JsonValue::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case JsonValue::kNullValue:
      return {};
    default:
      throw ConfigurationError("'" + key + "' must be a scalar");
  }
}

std::string GetText(const Struct& in, const std::string& key) {
  const auto* value = Field(in, key);
  return value ? ScalarText(*value, key) : std::string();
}

std::optional<std::string> GetOptionalString(const Struct& in, const std::string& key) {
  const auto* value = Field(in, key);
  if (!value) return std::nullopt;
  return ScalarText(*value, key);
}

bool GetBool(const Struct& in, const std::string& key) {
  const auto* value = Field(in, key);
  if (!value) return false;
  switch (value->kind_case()) {
    case JsonValue::kBoolValue:
      return value->bool_value();
    case JsonValue::kNumberValue:
      return value->number_value() != 0;
    case JsonValue::kStringValue: {
      const auto& text = value->string_value();
      if (text == "true" || text == "1" || text == "yes") return true;
      if (text == "false" || text == "0" || text == "no" || text.empty()) return false;
      break;
    }
    default:
      break;
  }
  throw ConfigurationError("'" + key + "' must be a boolean");
}

std::optional<bool> GetOptionalBool(const Struct& in, const std::string& key) {
  if (!Field(in, key)) return std::nullopt;
  return GetBool(in, key);
}

std::optional<int64_t> GetInt(const Struct& in, const std::string& key) {
  const auto* value = Field(in, key);
  if (!value) return std::nullopt;
  if (value->kind_case() == JsonValue::kNumberValue) {
    const double number = value->number_value();
    if (number != std::trunc(number)) {
      throw ConfigurationError("'" + key + "' must be an integer");
    }
    return static_cast<int64_t>(number);
  }
  if (value->kind_case() == JsonValue::kStringValue) {
    try {
      std::size_t consumed = 0;
      const auto  parsed = std::stoll(value->string_value(), &consumed);
      if (consumed == value->string_value().size()) return parsed;
    } catch (const std::exception&) {
    }
  }
  throw ConfigurationError("'" + key + "' must be an integer");
}

// A list of scalars, or a single scalar treated as a one-element list.
std::vector<std::string> GetStringList(const Struct& in, const std::string& key) {
  const auto* value = Field(in, key);
  if (!value) return {};
  std::vector<std::string> items;
  if (value->kind_case() == JsonValue::kListValue) {
    for (const auto& item : value->list_value().values()) {
      items.push_back(ScalarText(item, key));
    }
    return items;
  }
  items.push_back(ScalarText(*value, key));
  return items;
}

util::EnvMap GetEnv(const Struct& in, const std::string& key) {
  const auto* value = Field(in, key);
  if (!value) return {};
  util::EnvMap env;
  for (const auto& [name, entry] : RequireStruct(*value, key).fields()) {
    env[name] = ScalarText(entry, key + "." + name);
  }
  return env;
}

Options GetOptions(const Struct& in, const std::string& key) {
  const auto* value = Field(in, key);
  if (!value) return {};
  return RequireStruct(*value, key);
}

std::optional<JsonValue> GetValue(const Struct& in, const std::string& key) {
  const auto* value = Field(in, key);
  if (!value) return std::nullopt;
  return *value;
}

std::optional<Mode> GetMode(const Struct& in, const std::string& key) {
  const auto text = GetText(in, key);
  if (text.empty()) return std::nullopt;
  return ParseMode(text);
}

std::vector<Step> GetSteps(const Struct& in, const std::string& key) {
  const auto* value = Field(in, key);
  if (!value) return {};
  if (value->kind_case() != JsonValue::kListValue) {
    throw ConfigurationError("'" + key + "' must be a list of steps");
  }
  std::vector<Step> steps;
  steps.reserve(value->list_value().values_size());
  for (const auto& item : value->list_value().values()) {
    steps.push_back(StepFromDocument(item));
  }
  return steps;
}

bool IsCommonStepKey(const std::string& key) {
  return key == "type" || key == "id" || key == "if" || key == "on_failure";
}

// ------------------------------------------------------------
// Step bodies
// ------------------------------------------------------------

struct StepWriter {
  Struct* out;

  void operator()(const LogStep& step) const {
    Put(out, "message", StringValue(step.message));
    if (!step.level.empty() && step.level != "info") PutString(out, "level", step.level);
  }

  void operator()(const CopyStep& step) const {
    Put(out, "from", StringValue(step.from));
    Put(out, "to", StringValue(step.to));
    PutFlag(out, "recursive", step.recursive);
  }

  void operator()(const ReplicationStep& step) const {
    Put(out, "path", StringValue(step.path));
    PutString(out, "working_dir", step.working_dir);
    PutString(out, "range", step.range);
    if (step.mode) PutString(out, "mode", ToString(*step.mode));
    PutList(out, "streams", step.streams);
    PutEnv(out, "env", step.env);
  }

  void operator()(const HttpStep& step) const {
    Put(out, "url", StringValue(step.url));
    PutString(out, "method", step.method);
    PutString(out, "payload", step.payload);
    if (!step.headers.empty()) {
      Struct headers;
      for (const auto& [name, text] : step.headers) {
        (*headers.mutable_fields())[name].set_string_value(text);
      }
      Put(out, "headers", StructValue(std::move(headers)));
    }
  }

  void operator()(const CommandStep& step) const {
    if (step.shell && step.command.size() == 1) {
      Put(out, "command", StringValue(step.command.front()));
    } else {
      Put(out, "command", StringList(step.command));
    }
    PutFlag(out, "print", step.print);
    PutFlag(out, "capture", step.capture);
    PutString(out, "working_dir", step.working_dir);
    PutEnv(out, "env", step.env);
  }

  void operator()(const WriteStep& step) const {
    Put(out, "to", StringValue(step.to));
    Put(out, "content", StringValue(step.content));
  }

  void operator()(const ReadStep& step) const {
    Put(out, "from", StringValue(step.from));
    PutString(out, "into", step.into);
  }

  void operator()(const DeleteStep& step) const {
    Put(out, "location", StringValue(step.location));
    PutFlag(out, "recursive", step.recursive);
  }

  void operator()(const GroupStep& step) const {
    Put(out, "steps", StepList(step.steps));
    PutEnv(out, "env", step.env);
    if (step.loop) Put(out, "loop", *step.loop);
  }

  void operator()(const StoreStep& step) const {
    Put(out, "key", StringValue(step.key));
    if (step.value.kind_case() != JsonValue::KIND_NOT_SET) Put(out, "value", step.value);
    PutFlag(out, "delete", step.remove);
  }

  void operator()(const EngineStep& step) const {
    for (const auto& [key, value] : step.fields.fields()) {
      if (!IsCommonStepKey(key)) Put(out, key, value);
    }
  }
};

StepBody ParseBody(StepType type, const Struct& in) {
  switch (type) {
    case StepType::kLog: {
      LogStep step;
      step.message = GetText(in, "message");
      auto level = GetText(in, "level");
      if (!level.empty()) step.level = level;
      return step;
    }
    case StepType::kCopy:
      return CopyStep{GetText(in, "from"), GetText(in, "to"), GetBool(in, "recursive")};
    case StepType::kReplication: {
      ReplicationStep step;
      step.path = GetText(in, "path");
      step.working_dir = GetText(in, "working_dir");
      step.range = GetText(in, "range");
      step.mode = GetMode(in, "mode");
      step.streams = GetStringList(in, "streams");
      step.env = GetEnv(in, "env");
      return step;
    }
    case StepType::kHttp: {
      HttpStep step;
      step.url = GetText(in, "url");
      step.method = GetText(in, "method");
      if (const auto* payload = Field(in, "payload")) {
        if (payload->kind_case() == JsonValue::kStructValue || payload->kind_case() == JsonValue::kListValue) {
          step.payload = ToJson(*payload);
        } else {
          step.payload = ScalarText(*payload, "payload");
        }
      }
      for (const auto& [name, text] : GetEnv(in, "headers")) {
        step.headers[name] = text;
      }
      return step;
    }
    case StepType::kCommand: {
      CommandStep step;
      const auto* command = Field(in, "command");
      if (command && command->kind_case() == JsonValue::kStringValue) {
        step.shell = true;
        step.command = {command->string_value()};
      } else {
        step.command = GetStringList(in, "command");
      }
      step.print = GetBool(in, "print");
      step.capture = GetBool(in, "capture");
      step.working_dir = GetText(in, "working_dir");
      step.env = GetEnv(in, "env");
      return step;
    }
    case StepType::kWrite:
      return WriteStep{GetText(in, "to"), GetText(in, "content")};
    case StepType::kRead:
      return ReadStep{GetText(in, "from"), GetText(in, "into")};
    case StepType::kDelete: {
      DeleteStep step;
      step.location = GetText(in, "location");
      if (step.location.empty()) {
        const auto connection = GetText(in, "connection");
        const auto path = GetText(in, "path");
        step.location = connection.empty() ? path : connection + "/" + path;
      }
      step.recursive = GetBool(in, "recursive");
      return step;
    }
    case StepType::kGroup: {
      GroupStep step;
      step.steps = GetSteps(in, "steps");
      step.env = GetEnv(in, "env");
      step.loop = GetValue(in, "loop");
      return step;
    }
    case StepType::kStore: {
      StoreStep step;
      step.key = GetText(in, "key");
      if (auto value = GetValue(in, "value")) step.value = *value;
      step.remove = GetBool(in, "delete");
      return step;
    }
    case StepType::kQuery:
    case StepType::kCheck:
    case StepType::kInspect:
    case StepType::kList: {
      EngineStep step;
      step.type = type;
      for (const auto& [key, value] : in.fields()) {
        if (!IsCommonStepKey(key)) (*step.fields.mutable_fields())[key] = value;
      }
      return step;
    }
  }
  throw ConfigurationError("unknown step type: " + ToString(type));
}

} // namespace

// ------------------------------------------------------------
// Steps and hooks
// ------------------------------------------------------------

JsonValue ToDocument(const Step& step) {
  Struct out;
  Put(&out, "type", StringValue(ToString(step.type())));
  PutString(&out, "id", step.common.id);
  if (step.common.condition) Put(&out, "if", StringValue(*step.common.condition));
  if (step.common.on_failure != OnFailure::kAbort) {
    Put(&out, "on_failure", StringValue(ToString(step.common.on_failure)));
  }
  std::visit(StepWriter{&out}, step.body);
  return StructValue(std::move(out));
}

Step StepFromDocument(const JsonValue& document) {
  const auto& in = RequireStruct(document, "step");
  const auto  type_text = GetText(in, "type");
  const auto  type = ParseStepType(type_text);
  if (!type) {
    throw ConfigurationError("unknown step type: '" + type_text + "'");
  }

  Step step;
  step.common.id = GetText(in, "id");
  step.common.condition = GetOptionalString(in, "if");
  step.common.on_failure = ParseOnFailure(GetText(in, "on_failure"));
  step.body = ParseBody(*type, in);
  return step;
}

JsonValue ToDocument(const HookMap& hooks) {
  Struct out;
  if (!hooks.start.empty()) Put(&out, "start", StepList(hooks.start));
  if (!hooks.end.empty()) Put(&out, "end", StepList(hooks.end));
  if (!hooks.pre.empty()) Put(&out, "pre", StepList(hooks.pre));
  if (!hooks.post.empty()) Put(&out, "post", StepList(hooks.post));
  return StructValue(std::move(out));
}

HookMap HookMapFromDocument(const JsonValue& document) {
  const auto& in = RequireStruct(document, "hooks");
  HookMap     hooks;
  hooks.start = GetSteps(in, "start");
  hooks.end = GetSteps(in, "end");
  hooks.pre = GetSteps(in, "pre");
  hooks.post = GetSteps(in, "post");
  return hooks;
}

// ------------------------------------------------------------
// Replication
// ------------------------------------------------------------

JsonValue ToDocument(const ReplicationStream& stream) {
  Struct out;
  PutString(&out, "id", stream.id);
  PutString(&out, "description", stream.description);
  if (stream.mode) Put(&out, "mode", StringValue(ToString(*stream.mode)));
  PutString(&out, "object", stream.object);
  PutList(&out, "select", stream.select);
  PutList(&out, "files", stream.files);
  PutString(&out, "where", stream.where);
  PutList(&out, "primary_key", stream.primary_key);
  PutString(&out, "update_key", stream.update_key);
  PutString(&out, "sql", stream.sql);
  PutList(&out, "tags", stream.tags);
  PutOptions(&out, "source_options", stream.source_options);
  PutOptions(&out, "target_options", stream.target_options);
  PutString(&out, "schedule", stream.schedule);
  if (stream.transforms) Put(&out, "transforms", *stream.transforms);
  if (stream.columns) Put(&out, "columns", *stream.columns);
  if (stream.hooks) Put(&out, "hooks", ToDocument(*stream.hooks));
  if (stream.disabled) Put(&out, "disabled", BoolValue(*stream.disabled));
  return StructValue(std::move(out));
}

ReplicationStream StreamFromDocument(const JsonValue& document) {
  ReplicationStream stream;
  if (document.kind_case() == JsonValue::kNullValue) return stream;

  const auto& in = RequireStruct(document, "stream");
  stream.id = GetText(in, "id");
  stream.description = GetText(in, "description");
  stream.mode = GetMode(in, "mode");
  stream.object = GetText(in, "object");
  stream.select = GetStringList(in, "select");
  stream.files = GetStringList(in, "files");
  stream.where = GetText(in, "where");
  stream.primary_key = GetStringList(in, "primary_key");
  stream.update_key = GetText(in, "update_key");
  stream.sql = GetText(in, "sql");
  stream.tags = GetStringList(in, "tags");
  stream.source_options = GetOptions(in, "source_options");
  stream.target_options = GetOptions(in, "target_options");
  stream.schedule = GetText(in, "schedule");
  stream.transforms = GetValue(in, "transforms");
  stream.columns = GetValue(in, "columns");
  if (const auto* hooks = Field(in, "hooks")) stream.hooks = HookMapFromDocument(*hooks);
  stream.disabled = GetOptionalBool(in, "disabled");
  return stream;
}

JsonValue ToDocument(const Replication& replication, DocumentPurpose purpose) {
  Struct out;
  PutString(&out, "source", replication.source);
  PutString(&out, "target", replication.target);

  auto defaults = ToDocument(replication.defaults);
  if (defaults.struct_value().fields_size() > 0) Put(&out, "defaults", std::move(defaults));

  if (!replication.hooks.empty()) Put(&out, "hooks", ToDocument(replication.hooks));

  Struct streams;
  for (const auto& [name, stream] : replication.streams) {
    (*streams.mutable_fields())[name] = ToDocument(stream);
  }
  Put(&out, "streams", StructValue(std::move(streams)));

  if (purpose == DocumentPurpose::kCanonical) PutEnv(&out, "env", replication.env);
  PutFlag(&out, "debug", replication.debug);
  return StructValue(std::move(out));
}

Replication ReplicationFromDocument(const JsonValue& document, const std::vector<std::string>& stream_order) {
  const auto& in = RequireStruct(document, "replication");

  Replication replication;
  replication.source = GetText(in, "source");
  replication.target = GetText(in, "target");
  if (const auto* defaults = Field(in, "defaults")) replication.defaults = StreamFromDocument(*defaults);
  if (const auto* hooks = Field(in, "hooks")) replication.hooks = HookMapFromDocument(*hooks);

  if (const auto* streams = Field(in, "streams")) {
    const auto&              entries = RequireStruct(*streams, "streams").fields();
    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& name : stream_order) {
      if (entries.count(name) > 0 && std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
      }
    }
    // Streams missing from stream_order follow, by name.
    const auto ordered = static_cast<std::ptrdiff_t>(names.size());
    for (const auto& [name, unused] : entries) {
      if (std::find(names.begin(), names.begin() + ordered, name) == names.begin() + ordered) {
        names.push_back(name);
      }
    }
    std::sort(names.begin() + ordered, names.end());
    for (const auto& name : names) {
      replication.AddStream(name, StreamFromDocument(entries.at(name)));
    }
  }

  replication.env = GetEnv(in, "env");
  replication.debug = GetBool(in, "debug");
  return replication;
}

std::string ReplicationToJson(const Replication& replication, DocumentPurpose purpose) {
  auto document = ToDocument(replication, purpose);
  document.mutable_struct_value()->mutable_fields()->erase("streams");

  std::string streams = "{";
  for (const auto& [name, stream] : replication.streams) {
    if (streams.size() > 1) streams += ',';
    streams += ToJson(StringValue(name)) + ":" + ToJson(ToDocument(stream));
  }
  streams += '}';

  // Splice the ordered mapping in as the last top-level key.
  auto json = ToJson(document);
  json.pop_back();
  if (json.size() > 1) json += ',';
  return json + "\"streams\":" + streams + "}";
}

// ------------------------------------------------------------
// Pipeline
// ------------------------------------------------------------

JsonValue ToDocument(const Pipeline& pipeline, DocumentPurpose purpose) {
  Struct out;
  Put(&out, "steps", StepList(pipeline.steps));
  if (purpose == DocumentPurpose::kCanonical) PutEnv(&out, "env", pipeline.env);
  return StructValue(std::move(out));
}

Pipeline PipelineFromDocument(const JsonValue& document) {
  Pipeline pipeline;
  if (document.kind_case() == JsonValue::kListValue) {
    // bare list of steps
    Struct wrapper;
    Put(&wrapper, "steps", document);
    pipeline.steps = GetSteps(wrapper, "steps");
    return pipeline;
  }
  const auto& in = RequireStruct(document, "pipeline");
  pipeline.steps = GetSteps(in, "steps");
  pipeline.env = GetEnv(in, "env");
  return pipeline;
}

// ------------------------------------------------------------
// Direct run / task
// ------------------------------------------------------------

JsonValue ToDocument(const RunSpec& spec, DocumentPurpose purpose) {
  Struct source;
  PutString(&source, "conn", spec.src_conn);
  PutString(&source, "stream", spec.src_stream);
  PutList(&source, "primary_key", spec.primary_key);
  PutString(&source, "update_key", spec.update_key);
  PutList(&source, "select", spec.select);
  PutString(&source, "where", spec.where);
  if (spec.limit) Put(&source, "limit", NumberValue(static_cast<double>(*spec.limit)));
  if (spec.offset) Put(&source, "offset", NumberValue(static_cast<double>(*spec.offset)));
  PutString(&source, "range", spec.range);
  if (spec.columns) Put(&source, "columns", *spec.columns);
  if (spec.transforms) Put(&source, "transforms", *spec.transforms);
  PutOptions(&source, "options", spec.src_options);

  Struct target;
  PutString(&target, "conn", spec.tgt_conn);
  PutString(&target, "object", spec.tgt_object);
  PutOptions(&target, "options", spec.tgt_options);

  Struct out;
  Put(&out, "source", StructValue(std::move(source)));
  Put(&out, "target", StructValue(std::move(target)));
  if (spec.mode) Put(&out, "mode", StringValue(ToString(*spec.mode)));
  if (purpose == DocumentPurpose::kCanonical) PutEnv(&out, "env", spec.env);
  if (spec.debug) {
    Struct options;
    Put(&options, "debug", BoolValue(true));
    Put(&out, "options", StructValue(std::move(options)));
  }
  return StructValue(std::move(out));
}

AdaptedTask TaskFromDocument(const JsonValue& document) {
  const auto& in = RequireStruct(document, "task");

  static const Struct kEmpty;
  const Struct&       source = Field(in, "source") ? RequireStruct(*Field(in, "source"), "source") : kEmpty;
  const Struct&       target = Field(in, "target") ? RequireStruct(*Field(in, "target"), "target") : kEmpty;
  const Struct&       options = Field(in, "options") ? RequireStruct(*Field(in, "options"), "options") : kEmpty;

  LegacyTask task;
  task.source.conn = GetText(source, "conn");
  task.source.stream = GetText(source, "stream");
  task.source.primary_key = GetStringList(source, "primary_key");
  task.source.update_key = GetText(source, "update_key");
  task.source.limit = GetInt(source, "limit");
  task.source.options = GetOptions(source, "options");
  task.target.conn = GetText(target, "conn");
  task.target.object = GetText(target, "object");
  task.target.options = GetOptions(target, "options");
  task.mode = GetMode(in, "mode");
  task.env = GetEnv(in, "env");
  task.to_stdout = GetBool(options, "stdout");
  task.debug = GetBool(options, "debug") || GetBool(in, "debug");

  auto adapted = FromLegacyTask(task);
  auto& spec = adapted.spec;
  spec.select = GetStringList(source, "select");
  spec.where = GetText(source, "where");
  spec.offset = GetInt(source, "offset");
  spec.range = GetText(source, "range");
  spec.columns = GetValue(source, "columns");
  spec.transforms = GetValue(source, "transforms");
  return adapted;
}

RunSpec RunSpecFromDocument(const JsonValue& document) {
  return TaskFromDocument(document).spec;
}

// ------------------------------------------------------------
// JSON
// ------------------------------------------------------------

std::string ToJson(const JsonValue& document, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = pretty;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(document, &json, options);
  if (!status.ok()) {
    throw ConfigurationError("failed to render document: " + std::string(status.message()));
  }
  return json;
}

JsonValue FromJson(const std::string& json) {
  JsonValue document;
  auto  status = google::protobuf::util::JsonStringToMessage(json, &document);
  if (!status.ok()) {
    throw ConfigurationError("invalid JSON document: " + std::string(status.message()));
  }
  return document;
}

bool DocumentsEqual(const JsonValue& a, const JsonValue& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

} // namespace ferry::model
