#include "config_loader.hpp"

#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <vector>

#include "internal/model/document.hpp"
#include "internal/util/errors.hpp"

namespace ferry::config {

using ferry::runtime::config::RuntimeConfig;
using ferry::util::ConfigurationError;

namespace {

constexpr char kMergeKey[] = "<<";

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// Plain decimal notation only: "0x1f", "inf" and ".nan" stay strings.
bool ParseNumber(const std::string& text, double* number) {
  if (text.empty() || text.find_first_not_of("0123456789+-.eE") != std::string::npos) return false;
  if (!std::isdigit(static_cast<unsigned char>(text.back())) && text.back() != '.') return false;

  char* end = nullptr;
  *number   = std::strtod(text.c_str(), &end);
  return end != nullptr && *end == '\0' && std::isfinite(*number);
}

void SetScalar(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();

  // Quoted scalars stay strings.
  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }

  const auto lower = Lower(text);
  if (text.empty() || text == "~" || lower == "null") {
    value->set_null_value(google::protobuf::NULL_VALUE);
    return;
  }
  if (lower == "true" || lower == "false") {
    value->set_bool_value(lower == "true");
    return;
  }

  double number = 0;
  if (ParseNumber(text, &number)) {
    value->set_number_value(number);
    return;
  }
  value->set_string_value(text);
}

void ToValue(const YAML::Node& node, google::protobuf::Value* value);

// "<<: *defaults" copies the anchored mapping's keys; keys written next to it win.
void MergeInto(const YAML::Node& source, google::protobuf::Struct* target, const std::set<std::string>& explicit_keys) {
  if (source.IsSequence()) {
    for (const auto& item : source) MergeInto(item, target, explicit_keys);
    return;
  }
  if (!source.IsMap()) {
    throw ConfigurationError("line " + std::to_string(source.Mark().line + 1) + ": merge key needs a mapping");
  }

  for (const auto& entry : source) {
    const auto key = entry.first.Scalar();
    if (explicit_keys.count(key) > 0 || target->fields().count(key) > 0) continue;
    ToValue(entry.second, &(*target->mutable_fields())[key]);
  }
}

void ToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      SetScalar(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) ToValue(item, list->add_values());
      return;
    }

    case YAML::NodeType::Map: {
      auto*                 object = value->mutable_struct_value();
      std::set<std::string> explicit_keys;
      for (const auto& entry : node) {
        const auto key = entry.first.Scalar();
        if (key == kMergeKey) continue;
        explicit_keys.insert(key);
        ToValue(entry.second, &(*object->mutable_fields())[key]);
      }
      for (const auto& entry : node) {
        if (entry.first.Scalar() == kMergeKey) MergeInto(entry.second, object, explicit_keys);
      }
      return;
    }
  }
  throw ConfigurationError("unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
}

template <typename Load>
YAML::Node ReadYaml(const std::string& what, Load&& load) {
  try {
    return load();
  } catch (const YAML::BadFile&) {
    throw ConfigurationError("cannot read " + what);
  } catch (const YAML::Exception& e) {
    throw ConfigurationError(what + ": line " + std::to_string(e.mark.line + 1) + ": " + e.msg);
  }
}

google::protobuf::Value ToDocument(const YAML::Node& yaml) {
  google::protobuf::Value value;
  ToValue(yaml, &value);
  return value;
}

// Keys of the top-level `streams` mapping as written.
std::vector<std::string> StreamOrder(const YAML::Node& yaml) {
  std::vector<std::string> names;
  if (!yaml.IsMap()) return names;

  const auto streams = yaml["streams"];
  if (!streams || !streams.IsMap()) return names;
  for (const auto& entry : streams) {
    auto key = entry.first.Scalar();
    if (key != kMergeKey) names.push_back(std::move(key));
  }
  return names;
}

std::string EnvOr(const char* name, const std::string& fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return fallback;
}

void Validate(const RuntimeConfig& config) {
  static const std::set<std::string> kLevels = {"trace", "debug", "info",     "warn", "warning",
                                                "err",   "error", "critical", "off"};
  if (kLevels.count(config.logging().level()) == 0) {
    throw ConfigurationError("logging.level '" + config.logging().level() + "' is not a log level");
  }
  if (config.engine().binary().empty()) {
    throw ConfigurationError("engine.binary must not be empty");
  }
}

} // namespace

// ------------------------------------------------------------
// Runtime config
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  const auto document = ToDocument(ReadYaml("config " + path, [&] { return YAML::LoadFile(path); }));

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(document, &json);
  if (!to_json.ok()) {
    throw ConfigurationError("config " + path + " cannot be converted to JSON: " + std::string(to_json.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw ConfigurationError("invalid config " + path + ": " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  ApplyEnvironmentOverrides(&config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  ApplyEnvironmentOverrides(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* tracing = config->mutable_tracing();
  if (tracing->service_name().empty()) tracing->set_service_name("ferry");
  if (tracing->transport() == ferry::runtime::config::TRACING_TRANSPORT_UNSPECIFIED)
    tracing->set_transport(ferry::runtime::config::TRACING_TRANSPORT_GRPC);

  auto* engine = config->mutable_engine();
  if (engine->binary().empty()) engine->set_binary("ferry-engine");
  if (engine->temp_dir().empty()) engine->set_temp_dir(std::filesystem::temp_directory_path().string());
  if (engine->terminate_grace_ms() == 0) engine->set_terminate_grace_ms(2000);
  if (engine->stderr_capture_bytes() == 0) engine->set_stderr_capture_bytes(64 * 1024);
  if (engine->input_batch_rows() == 0) engine->set_input_batch_rows(1024);
  if (engine->package().empty()) engine->set_package("cpp");

  auto* http = config->mutable_http();
  if (http->timeout_ms() == 0) http->set_timeout_ms(30000);
}

// Logging overrides are read by InitializeLogging itself.
void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig* config) {
  auto* engine = config->mutable_engine();
  engine->set_binary(EnvOr("FERRY_BINARY", engine->binary()));
  engine->set_temp_dir(EnvOr("FERRY_TEMP_DIR", engine->temp_dir()));
}

// ------------------------------------------------------------
// Transfer documents
// ------------------------------------------------------------

google::protobuf::Value ConfigLoader::LoadDocument(const std::string& path) {
  return ToDocument(ReadYaml("document " + path, [&] { return YAML::LoadFile(path); }));
}

google::protobuf::Value ConfigLoader::ParseDocument(const std::string& text) {
  return ToDocument(ReadYaml("document", [&] { return YAML::Load(text); }));
}

model::Replication ConfigLoader::ParseReplication(const std::string& text) {
  const auto yaml = ReadYaml("replication", [&] { return YAML::Load(text); });
  return model::ReplicationFromDocument(ToDocument(yaml), StreamOrder(yaml));
}

} // namespace ferry::config
