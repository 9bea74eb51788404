#include <cassert>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/model/document.hpp"
#include "internal/util/errors.hpp"

using namespace ferry::model;
using ferry::util::ConfigurationError;

namespace {

Replication SampleReplication() {
  Replication replication;
  replication.source = "postgres";
  replication.target = "aws_s3";
  replication.env    = {{"SAMPLE_SIZE", "2000"}};
  replication.debug  = true;

  replication.defaults.mode   = Mode::kFullRefresh;
  replication.defaults.object = "bucket/{stream_schema}/{stream_table}.parquet";
  SetString(&replication.defaults.target_options, "format", "parquet");

  ReplicationStream users;
  users.mode        = Mode::kIncremental;
  users.primary_key = {"id"};
  users.update_key  = "updated_at";
  users.select      = {"id", "name", "-password"};
  users.disabled    = false;
  replication.AddStream("public.users", users);

  ReplicationStream events;
  events.sql  = "select * from events where ts > '{start}'";
  events.tags = {"nightly"};
  events.Disable();
  events.hooks = HookMap{};
  events.hooks->post.push_back(Step::Make(LogStep{"events done", "warn"}));
  replication.AddStream("public.events", events);

  replication.hooks.start.push_back(Step::Make(HttpStep{"https://hooks.example.com/start", "POST", "{}", {}}));
  replication.hooks.end.push_back(
      Step::Make(EngineStep{StepType::kQuery, {}}, StepCommon{"cleanup", std::nullopt, OnFailure::kWarn}));
  return replication;
}

Pipeline SamplePipeline() {
  Pipeline pipeline;
  pipeline.env = {{"TARGET_DIR", "/tmp/out"}};

  pipeline.steps.push_back(Step::Make(LogStep{"starting"}, StepCommon{"intro", std::nullopt, OnFailure::kAbort}));

  ReplicationStep replication;
  replication.path    = "replications/daily.yaml";
  replication.streams = {"public.users"};
  replication.mode    = Mode::kIncremental;
  replication.env     = {{"RUN_DATE", "2024-01-01"}};
  pipeline.steps.push_back(Step::Make(replication));

  CommandStep shell;
  shell.command = {"ls -la ${TARGET_DIR}"};
  shell.shell   = true;
  shell.capture = true;
  pipeline.steps.push_back(Step::Make(shell, StepCommon{"", "{env.CHECK}", OnFailure::kQuiet}));

  CommandStep argv;
  argv.command = {"echo", "hello"};
  argv.print   = true;
  pipeline.steps.push_back(Step::Make(argv));

  GroupStep group;
  google::protobuf::Value loop;
  loop.mutable_list_value()->add_values()->set_string_value("a");
  loop.mutable_list_value()->add_values()->set_string_value("b");
  group.loop = loop;
  group.steps.push_back(Step::Make(WriteStep{"/tmp/{loop.value}.txt", "{loop.index}"}));
  group.steps.push_back(Step::Make(DeleteStep{"/tmp/{loop.value}.txt", false}));
  pipeline.steps.push_back(Step::Make(group));

  StoreStep store;
  store.key = "count";
  store.value.set_number_value(3);
  pipeline.steps.push_back(Step::Make(store));
  pipeline.steps.push_back(Step::Make(ReadStep{"/tmp/in.txt", "content"}));
  pipeline.steps.push_back(Step::Make(CopyStep{"file:///tmp/a", "file:///tmp/b", true}));
  return pipeline;
}

void TestReplicationRoundTrip() {
  const auto document = ToDocument(SampleReplication());
  const auto again    = ToDocument(ReplicationFromDocument(document));
  assert(DocumentsEqual(document, again));

  // and through JSON text
  const auto reparsed = ToDocument(ReplicationFromDocument(FromJson(ToJson(document))));
  assert(DocumentsEqual(document, reparsed));
}

void TestPipelineRoundTrip() {
  const auto document = ToDocument(SamplePipeline());
  const auto parsed   = PipelineFromDocument(document);
  assert(parsed.steps.size() == 8);
  assert(parsed.steps[2].common.condition == std::optional<std::string>("{env.CHECK}"));
  assert(parsed.steps[2].common.on_failure == OnFailure::kQuiet);
  assert(std::get<CommandStep>(parsed.steps[2].body).shell);
  assert(!std::get<CommandStep>(parsed.steps[3].body).shell);
  assert(DocumentsEqual(document, ToDocument(parsed)));
}

void TestRunSpecRoundTrip() {
  RunSpec spec;
  spec.src_conn    = "postgres";
  spec.src_stream  = "public.users";
  spec.tgt_conn    = "file:///tmp/users.csv";
  spec.mode        = Mode::kSnapshot;
  spec.primary_key = {"id"};
  spec.select      = {"id", "email"};
  spec.where       = "active";
  spec.limit       = 100;
  spec.offset      = 10;
  spec.env         = {{"PGPASSWORD", "secret"}};
  spec.debug       = true;
  SetString(&spec.tgt_options, "header", "true");

  const auto document = ToDocument(spec);
  const auto parsed   = RunSpecFromDocument(document);
  assert(parsed.limit == 100);
  assert(parsed.offset == 10);
  assert(parsed.debug);
  assert(DocumentsEqual(document, ToDocument(parsed)));
}

void TestEngineDocumentsLeaveOutEnvironment() {
  const auto replication = SampleReplication();
  const auto canonical   = ToDocument(replication);
  const auto engine      = ToDocument(replication, DocumentPurpose::kEngine);
  assert(canonical.struct_value().fields().count("env") == 1);
  assert(engine.struct_value().fields().count("env") == 0);

  RunSpec spec;
  spec.src_conn = "postgres";
  spec.env      = {{"PGPASSWORD", "secret"}};
  const auto json = ToJson(ToDocument(spec, DocumentPurpose::kEngine));
  assert(json.find("secret") == std::string::npos);
}

void TestUnknownStepTypeFailsWholeDocument() {
  const auto document = ferry::config::ConfigLoader::ParseDocument(R"(
steps:
  - type: log
    message: first
  - type: teleport
    to: mars
)");
  bool threw = false;
  try {
    (void)PipelineFromDocument(document);
  } catch (const ConfigurationError& e) {
    threw = std::string(e.what()).find("teleport") != std::string::npos;
  }
  assert(threw);
}

void TestYamlReplicationDocument() {
  const auto document = ferry::config::ConfigLoader::ParseDocument(R"(
source: postgres
target: snowflake
defaults:
  mode: full_refresh
  object: "analytics.{stream_table}"
streams:
  public.orders:
    primary_key: [order_id]
  public.customers:
    disabled: true
env:
  SLING_THREADS: "4"
)");
  auto replication = ReplicationFromDocument(document);
  assert(replication.streams.size() == 2);
  assert(replication.streams[0].first == "public.customers");
  assert(replication.defaults.mode == Mode::kFullRefresh);
  assert(replication.env.at("SLING_THREADS") == "4");

  const auto resolved = replication.ResolveStreams();
  assert(resolved.size() == 1);
  assert(resolved[0].first == "public.orders");
  assert(resolved[0].second.object == "analytics.{stream_table}");
}

void TestStreamDeclarationOrderSurvives() {
  Replication replication;
  replication.source = "postgres";
  replication.target = "duckdb";
  for (const auto* name : {"public.zebra", "public.apple", "public.mango"}) {
    ReplicationStream stream;
    stream.object = std::string("main.") + name;
    replication.AddStream(name, stream);
  }

  const auto json = ReplicationToJson(replication, DocumentPurpose::kEngine);
  assert(json.find("public.zebra") < json.find("public.apple"));
  assert(json.find("public.apple") < json.find("public.mango"));

  const auto parsed = ferry::config::ConfigLoader::ParseReplication(json);
  assert(parsed.streams.size() == 3);
  assert(parsed.streams[0].first == "public.zebra");
  assert(parsed.streams[1].first == "public.apple");
  assert(parsed.streams[2].first == "public.mango");
  assert(parsed.FindStream("public.mango")->object == "main.public.mango");
  assert(DocumentsEqual(ToDocument(replication), ToDocument(parsed)));

  const auto from_yaml = ferry::config::ConfigLoader::ParseReplication(R"(
source: postgres
target: duckdb
streams:
  public.orders: {}
  public.customers:
  public.accounts:
    mode: incremental
)");
  const auto resolved = from_yaml.ResolveStreams();
  assert(resolved.size() == 3);
  assert(resolved[0].first == "public.orders");
  assert(resolved[1].first == "public.customers");
  assert(resolved[2].first == "public.accounts");

  // without an explicit order the streams come back by name
  const auto unordered = ReplicationFromDocument(FromJson(json));
  assert(unordered.streams[0].first == "public.apple");
}

void TestLegacyTaskDocument() {
  const auto document = ferry::config::ConfigLoader::ParseDocument(R"(
source:
  conn: postgres
  stream: public.users
  limit: 5
target:
  conn: file:///tmp/users.jsonl
mode: full-refresh
options:
  stdout: true
  debug: true
)");
  auto task = TaskFromDocument(document);
  assert(task.to_stdout);
  assert(task.spec.debug);
  assert(task.spec.limit == 5);
  assert(task.spec.mode == Mode::kFullRefresh);
  assert(task.spec.tgt_conn == "file:///tmp/users.jsonl");
}

void TestBareStepListIsAPipeline() {
  const auto document = ferry::config::ConfigLoader::ParseDocument(R"(
- type: log
  message: one
- type: command
  command: [echo, two]
)");
  auto pipeline = PipelineFromDocument(document);
  assert(pipeline.steps.size() == 2);
  assert(pipeline.steps[1].type() == StepType::kCommand);
}

} // namespace

int main() {
  TestReplicationRoundTrip();
  TestPipelineRoundTrip();
  TestRunSpecRoundTrip();
  TestEngineDocumentsLeaveOutEnvironment();
  TestUnknownStepTypeFailsWholeDocument();
  TestYamlReplicationDocument();
  TestStreamDeclarationOrderSurvives();
  TestLegacyTaskDocument();
  TestBareStepListIsAPipeline();

  std::cout << "ferry_unit_document: pass\n";
  return 0;
}
