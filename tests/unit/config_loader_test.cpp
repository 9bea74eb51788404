#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteFile(const std::string& name, const std::string& content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "ferry_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / name;
  std::ofstream out(file_path);
  out << content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteFile("quoted_backslash.yaml",
                                   R"(engine:
  binary: "C:\\ferry\\\"quoted\"\\engine.exe"
  terminate_grace_ms: 500
)");

  auto config = ferry::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.engine().binary() == "C:\\ferry\\\"quoted\"\\engine.exe");
  assert(config.engine().terminate_grace_ms() == 500);
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteFile("newline_unicode.yaml",
                                   R"(logging:
  pattern: "line1\nline2☃"
)");

  auto config = ferry::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteFile("unknown_field.yaml",
                                   R"(engine:
  binary: ferry-engine
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ferry::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestDefaultsAreFilled() {
  ::unsetenv("FERRY_BINARY");
  auto config = ferry::config::ConfigLoader::Defaults();
  assert(config.engine().binary() == "ferry-engine");
  assert(config.engine().terminate_grace_ms() == 2000);
  assert(config.engine().stderr_capture_bytes() == 64 * 1024);
  assert(config.engine().input_batch_rows() == 1024);
  assert(config.engine().package() == "cpp");
  assert(!config.engine().temp_dir().empty());
  assert(config.http().timeout_ms() == 30000);
  assert(config.logging().level() == "info");
}

void TestEnvironmentOverridesBinary() {
  ::setenv("FERRY_BINARY", "/opt/engine/bin/engine", 1);
  auto config = ferry::config::ConfigLoader::Defaults();
  ::unsetenv("FERRY_BINARY");
  assert(config.engine().binary() == "/opt/engine/bin/engine");
}

void TestLoadDocumentReadsYamlAndJson() {
  const auto yaml_path = WriteFile("replication.yaml",
                                   R"(source: postgres
target: local
streams:
  public.users:
    mode: incremental
    primary_key: [id]
)");
  auto yaml = ferry::config::ConfigLoader::LoadDocument(yaml_path.string());
  assert(yaml.struct_value().fields().at("source").string_value() == "postgres");
  const auto& stream = yaml.struct_value().fields().at("streams").struct_value().fields().at("public.users");
  assert(stream.struct_value().fields().at("primary_key").list_value().values(0).string_value() == "id");

  const auto json_path = WriteFile("task.json", R"({"source": {"conn": "file:///tmp/in.csv"}, "mode": "full-refresh"})");
  auto       json      = ferry::config::ConfigLoader::LoadDocument(json_path.string());
  assert(json.struct_value().fields().at("mode").string_value() == "full-refresh");
}

void TestDocumentMergeKeysAndScalars() {
  auto doc = ferry::config::ConfigLoader::ParseDocument(R"(defaults: &defaults
  mode: incremental
  primary_key: [id]
  target_options:
    format: parquet
streams:
  public.orders:
    <<: *defaults
    mode: full-refresh
  public.users:
    <<: *defaults
values:
  hex: 0x1f
  inf: .inf
  version: "10"
  count: 10
  ratio: -2.5e3
  flag: True
  nothing: ~
)");

  const auto& fields  = doc.struct_value().fields();
  const auto& streams = fields.at("streams").struct_value().fields();
  const auto& orders  = streams.at("public.orders").struct_value().fields();
  assert(orders.at("mode").string_value() == "full-refresh");
  assert(orders.at("primary_key").list_value().values(0).string_value() == "id");
  assert(orders.count("<<") == 0);
  const auto& users = streams.at("public.users").struct_value().fields();
  assert(users.at("mode").string_value() == "incremental");
  assert(users.at("target_options").struct_value().fields().at("format").string_value() == "parquet");

  const auto& values = fields.at("values").struct_value().fields();
  assert(values.at("hex").string_value() == "0x1f");
  assert(values.at("inf").string_value() == ".inf");
  assert(values.at("version").string_value() == "10");
  assert(values.at("count").number_value() == 10);
  assert(values.at("ratio").number_value() == -2500);
  assert(values.at("flag").bool_value());
  assert(values.at("nothing").kind_case() == google::protobuf::Value::kNullValue);
}

void TestInvalidLogLevelIsRejected() {
  const auto yaml_path = WriteFile("bad_level.yaml", "logging:\n  level: loud\n");

  bool threw = false;
  try {
    (void)ferry::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const ferry::util::ConfigurationError& e) {
    threw = std::string(e.what()).find("loud") != std::string::npos;
  }
  assert(threw);
}

void TestMalformedYamlReportsLine() {
  bool threw = false;
  try {
    (void)ferry::config::ConfigLoader::ParseDocument("source: a\nstreams: [unclosed\n");
  } catch (const ferry::util::ConfigurationError& e) {
    threw = std::string(e.what()).find("line ") != std::string::npos;
  }
  assert(threw);
}

void TestMissingDocumentIsConfigurationError() {
  bool threw = false;
  try {
    (void)ferry::config::ConfigLoader::LoadDocument("/nonexistent/ferry/doc.yaml");
  } catch (const ferry::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestDefaultsAreFilled();
  TestEnvironmentOverridesBinary();
  TestLoadDocumentReadsYamlAndJson();
  TestDocumentMergeKeysAndScalars();
  TestInvalidLogLevelIsRejected();
  TestMalformedYamlReportsLine();
  TestMissingDocumentIsConfigurationError();

  std::cout << "ferry_unit_config_loader: pass\n";
  return 0;
}
