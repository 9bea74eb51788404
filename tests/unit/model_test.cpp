#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/model/enums.hpp"
#include "internal/model/options.hpp"
#include "internal/model/pipeline.hpp"
#include "internal/model/record.hpp"
#include "internal/model/replication.hpp"
#include "internal/model/run_spec.hpp"
#include "internal/model/step.hpp"
#include "internal/util/errors.hpp"

using namespace ferry::model;
using ferry::util::ConfigurationError;

namespace {

template <typename Fn>
bool ThrowsConfiguration(Fn&& fn) {
  try {
    fn();
  } catch (const ConfigurationError&) {
    return true;
  }
  return false;
}

ReplicationStream StreamWithKey(const std::string& key) {
  ReplicationStream stream;
  stream.primary_key = {key};
  return stream;
}

Replication MakeReplication() {
  Replication replication;
  replication.source = "postgres";
  replication.target = "snowflake";
  replication.AddStream("public.users", StreamWithKey("id"));
  replication.AddStream("public.orders", StreamWithKey("order_id"));
  replication.AddStream("public.events", StreamWithKey("event_id"));
  return replication;
}

void TestModeSpellings() {
  assert(ParseMode("full-refresh") == Mode::kFullRefresh);
  assert(ParseMode("full_refresh") == Mode::kFullRefresh);
  assert(ParseMode("backfill") == Mode::kBackfill);
  assert(ToString(Mode::kIncremental) == "incremental");
  assert(ThrowsConfiguration([] { ParseMode("upsert"); }));
}

void TestStreamFormatMapping() {
  assert(ToStreamFormat(Format::kCsv) == StreamFormat::kCsv);
  assert(ToStreamFormat(Format::kJsonLines) == StreamFormat::kJsonLines);
  assert(ToStreamFormat(Format::kArrow) == StreamFormat::kArrow);
  assert(IsBatchFormat(StreamFormat::kArrow));
  assert(!IsBatchFormat(StreamFormat::kCsv));
  assert(ThrowsConfiguration([] { ToStreamFormat(Format::kXlsx); }));
}

void TestDuplicateStreamNameRejected() {
  auto replication = MakeReplication();
  assert(ThrowsConfiguration([&] { replication.AddStream("public.users", {}); }));

  // all-or-nothing
  assert(ThrowsConfiguration(
      [&] { replication.AddStreams({{"public.new", {}}, {"public.orders", {}}}); }));
  assert(replication.FindStream("public.new") == nullptr);
  assert(replication.streams.size() == 3);
}

void TestDisableIsolatesSiblings() {
  auto replication = MakeReplication();
  SetString(&replication.FindStream("public.orders")->source_options, "delimiter", "|");

  const auto before = replication.ResolveStreams();
  replication.DisableStreams({"public.users", "no.such.stream"});
  const auto after = replication.ResolveStreams();

  assert(before.size() == 3);
  assert(after.size() == 2);
  assert(after[0].first == "public.orders");
  assert(after[1].first == "public.events");
  assert(after[0].second.primary_key == std::vector<std::string>{"order_id"});
  assert(GetString(after[0].second.source_options, "delimiter") == std::optional<std::string>("|"));
  assert(replication.FindStream("public.users")->IsDisabled());

  replication.EnableStreams({"public.users"});
  assert(replication.ResolveStreams().size() == 3);
}

void TestDefaultsOverlayMoreSpecificWins() {
  auto replication = MakeReplication();
  replication.SetDefaultMode(Mode::kIncremental);
  replication.defaults.update_key = "updated_at";
  SetString(&replication.defaults.target_options, "column_casing", "snake");
  SetString(&replication.defaults.target_options, "add_new_columns", "true");

  auto* orders = replication.FindStream("public.orders");
  orders->mode = Mode::kFullRefresh;
  SetString(&orders->target_options, "column_casing", "source");

  const auto resolved = replication.ResolveStreams();
  const auto& users   = resolved[0].second;
  const auto& order   = resolved[1].second;

  assert(users.mode == Mode::kIncremental);
  assert(users.update_key == "updated_at");
  assert(GetString(users.target_options, "column_casing") == std::optional<std::string>("snake"));

  assert(order.mode == Mode::kFullRefresh);
  assert(order.update_key == "updated_at");
  assert(GetString(order.target_options, "column_casing") == std::optional<std::string>("source"));
  assert(GetString(order.target_options, "add_new_columns") == std::optional<std::string>("true"));

  // the stored stream is untouched by resolution
  assert(!Has(replication.FindStream("public.users")->target_options, "column_casing"));
}

void TestReplicationValidation() {
  Replication empty;
  assert(ThrowsConfiguration([&] { empty.Validate(); }));

  Replication from_file;
  from_file.file_path = "/etc/ferry/replication.yaml";
  from_file.Validate();

  auto replication = MakeReplication();
  replication.Validate();
  replication.target.clear();
  assert(ThrowsConfiguration([&] { replication.Validate(); }));
}

void TestPipelineValidation() {
  Pipeline pipeline;
  assert(ThrowsConfiguration([&] { pipeline.Validate(); }));
  pipeline.steps.push_back(Step::Make(LogStep{"hello"}));
  pipeline.Validate();
  assert(pipeline.steps.front().type() == StepType::kLog);
}

void TestStepTypesAndPolicies() {
  assert(ParseStepType("replication") == StepType::kReplication);
  assert(ParseStepType("HTTP") == StepType::kHttp);
  assert(!ParseStepType("teleport").has_value());
  assert(IsEngineOnly(StepType::kQuery));
  assert(!IsEngineOnly(StepType::kCommand));

  assert(ParseOnFailure("") == OnFailure::kAbort);
  assert(ParseOnFailure("warn") == OnFailure::kWarn);
  assert(ThrowsConfiguration([] { ParseOnFailure("retry"); }));
}

void TestLegacyTaskAdapter() {
  LegacyTask task;
  task.source.conn        = "postgres";
  task.source.stream      = "select * from users";
  task.source.primary_key = {"id"};
  task.source.limit       = 10;
  task.target.conn        = "file:///tmp/users.csv";
  task.mode               = Mode::kFullRefresh;
  task.env["PG_URL"]      = "postgres://localhost";
  task.debug              = true;
  task.to_stdout          = false;

  auto adapted = FromLegacyTask(task);
  assert(adapted.spec.src_conn == "postgres");
  assert(adapted.spec.src_stream == "select * from users");
  assert(adapted.spec.primary_key == std::vector<std::string>{"id"});
  assert(adapted.spec.limit == 10);
  assert(adapted.spec.tgt_conn == "file:///tmp/users.csv");
  assert(adapted.spec.mode == Mode::kFullRefresh);
  assert(adapted.spec.env.at("PG_URL") == "postgres://localhost");
  assert(adapted.spec.debug);
  assert(!adapted.to_stdout);
}

void TestRecordAccess() {
  Record record{{"id", int64_t{7}}, {"name", std::string("ada")}, {"score", 1.5}, {"note", std::monostate{}}};
  assert(record.size() == 4);
  assert(std::get<int64_t>(record["id"]) == 7);
  assert(std::get<std::string>(record["name"]) == "ada");
  assert(record.Find("missing") == nullptr);
  assert(TypeOf(record["note"]) == ColumnType::kNull);
  assert(ToText(record["score"]) == "1.5");
  assert(record.ColumnNames() == (std::vector<std::string>{"id", "name", "score", "note"}));

  bool threw = false;
  try {
    (void)record["missing"];
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestModeSpellings();
  TestStreamFormatMapping();
  TestDuplicateStreamNameRejected();
  TestDisableIsolatesSiblings();
  TestDefaultsOverlayMoreSpecificWins();
  TestReplicationValidation();
  TestPipelineValidation();
  TestStepTypesAndPolicies();
  TestLegacyTaskAdapter();
  TestRecordAccess();

  std::cout << "ferry_unit_model: pass\n";
  return 0;
}
