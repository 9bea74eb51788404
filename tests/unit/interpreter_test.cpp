#include "internal/steps/interpreter.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "internal/model/document.hpp"
#include "internal/util/errors.hpp"

using namespace ferry::model;
using ferry::steps::HttpClient;
using ferry::steps::HttpRequest;
using ferry::steps::HttpResponse;
using ferry::steps::Interpreter;
using ferry::steps::StepStatus;
using ferry::util::ConfigurationError;
using ferry::util::ErrorKind;
using ferry::util::StepError;

namespace {

using Steps = std::vector<Step>;

class FakeHttpClient : public HttpClient {
 public:
  FakeHttpClient() : HttpClient(ferry::runtime::config::HttpConfig{}) {
  }

  HttpResponse Send(const HttpRequest& request) const override {
    requests.push_back(request);
    return response;
  }

  HttpResponse                     response{200, "pong"};
  mutable std::vector<HttpRequest> requests;
};

struct Harness {
  ferry::runtime::config::EngineConfig engine;
  ferry::command::CommandBuilder       builder;
  ferry::transport::Executor           executor;
  FakeHttpClient                       http;
  Interpreter                          interpreter;

  Harness()
      : engine(MakeEngine()),
        builder(engine, {{"PATH", "/usr/bin:/bin"}, {"FROM_PROCESS", "p"}}),
        executor(engine),
        interpreter(builder, executor, http) {
  }

  static ferry::runtime::config::EngineConfig MakeEngine() {
    ferry::runtime::config::EngineConfig engine;
    engine.set_binary("/bin/false");
    engine.set_temp_dir(std::filesystem::temp_directory_path().string());
    engine.set_terminate_grace_ms(200);
    return engine;
  }
};

std::filesystem::path TempDir() {
  const auto dir = std::filesystem::temp_directory_path() / "ferry_interpreter_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

Step Store(const std::string& id, const std::string& key, const std::string& value) {
  StoreStep body;
  body.key = key;
  body.value.set_string_value(value);
  return Step::Make(std::move(body), StepCommon{id});
}

Step Shell(const std::string& id, const std::string& script, OnFailure on_failure = OnFailure::kAbort) {
  CommandStep body;
  body.command = {"/bin/sh", "-c", script};
  StepCommon common{id};
  common.on_failure = on_failure;
  return Step::Make(std::move(body), std::move(common));
}

void TestAbortHaltsPipeline() {
  Harness h;
  auto    result =
      h.interpreter.Run(Steps{Store("a", "first", "1"), Shell("b", "sleep 0.05; exit 3"), Store("c", "third", "3")});

  assert(!result.ok());
  assert(result.steps.size() == 2);
  assert(result.failed_index == std::optional<std::size_t>(1));
  assert(result.steps[0].status == StepStatus::kSucceeded);
  assert(result.steps[1].status == StepStatus::kFailed);
  assert(result.steps[1].error->cause_kind() == ErrorKind::kProcess);
  assert(result.steps[1].error->index() == 1);
  assert(result.steps[1].duration >= std::chrono::milliseconds(50));
  assert(h.interpreter.store().count("first") == 1);
  assert(h.interpreter.store().count("third") == 0);

  bool thrown = false;
  try {
    result.ThrowIfFailed();
  } catch (const StepError& e) {
    thrown = e.type() == "command";
    try {
      e.RethrowCause();
    } catch (const ferry::util::ProcessError& cause) {
      thrown = thrown && cause.exit_code() == 3;
    }
  }
  assert(thrown);
}

void TestWarnAndQuietContinue() {
  Harness h;
  auto    result = h.interpreter.Run(Steps{Shell("warned", "exit 1", OnFailure::kWarn),
                                      Shell("quiet", "exit 2", OnFailure::kQuiet), Store("after", "k", "v")});

  assert(result.ok());
  assert(result.steps.size() == 3);
  assert(result.steps[0].status == StepStatus::kFailed);
  assert(result.steps[1].status == StepStatus::kFailed);
  assert(result.Find("after")->status == StepStatus::kSucceeded);
  result.ThrowIfFailed();
}

void TestConditionSkipsStep() {
  Harness h;

  auto skipped = Store("skipped", "never", "x");
  skipped.common.condition = "${UNSET_FLAG}";
  auto kept = Store("kept", "always", "y");
  kept.common.condition = "{env.ENABLED}";

  auto result = h.interpreter.Run(Steps{skipped, kept}, {{"ENABLED", "true"}});
  assert(result.ok());
  assert(result.steps[0].status == StepStatus::kSkipped);
  assert(result.steps[1].status == StepStatus::kSucceeded);
  assert(h.interpreter.store().count("never") == 0);
  assert(h.interpreter.store().at("always") == "y");
}

void TestEngineOnlyStepRejectedBeforeRunning() {
  Harness    h;
  const auto dir = TempDir();

  WriteStep write;
  write.to      = (dir / "should_not_exist.txt").string();
  write.content = "x";

  EngineStep query;
  query.type = StepType::kQuery;

  bool rejected = false;
  try {
    h.interpreter.Run(Steps{Step::Make(write), Step::Make(query)});
  } catch (const ConfigurationError&) {
    rejected = true;
  }
  assert(rejected);
  assert(!std::filesystem::exists(dir / "should_not_exist.txt"));

  rejected = false;
  try {
    Interpreter::Validate(Steps{Step::Make(HttpStep{})});
  } catch (const ConfigurationError& e) {
    rejected = std::string(e.what()).find("'url' is required") != std::string::npos;
  }
  assert(rejected);
}

bool RejectedBeforeRunning(Harness* h, const Step& bad, const std::filesystem::path& marker,
                           const std::string& message) {
  WriteStep write;
  write.to      = marker.string();
  write.content = "x";

  try {
    h->interpreter.Run(Steps{Step::Make(write), bad});
  } catch (const ConfigurationError& e) {
    return !std::filesystem::exists(marker) && std::string(e.what()).find(message) != std::string::npos;
  }
  return false;
}

void TestInvalidStepsRejectedBeforeRunning() {
  Harness    h;
  const auto dir    = TempDir();
  const auto marker = dir / "should_not_exist.txt";

  ReadStep read;
  read.from = "s3://bucket/key";
  assert(RejectedBeforeRunning(&h, Step::Make(read), marker, "s3://bucket/key"));

  WriteStep write;
  write.to      = "gs://bucket/out.txt";
  write.content = "x";
  assert(RejectedBeforeRunning(&h, Step::Make(write), marker, "only local paths"));

  DeleteStep remove;
  remove.location = "https://example.com/file";
  assert(RejectedBeforeRunning(&h, Step::Make(remove), marker, "only local paths"));

  GroupStep by_struct;
  by_struct.loop = FromJson(R"({"a": 1})");
  assert(RejectedBeforeRunning(&h, Step::Make(by_struct), marker, "must be a list, a number or a string"));

  GroupStep by_bool;
  by_bool.loop = FromJson("true");
  assert(RejectedBeforeRunning(&h, Step::Make(by_bool), marker, "must be a list, a number or a string"));

  for (const double count : {-1.0, 2.5, 1e12, std::numeric_limits<double>::quiet_NaN(),
                             std::numeric_limits<double>::infinity()}) {
    GroupStep counted;
    counted.loop = google::protobuf::Value();
    counted.loop->set_number_value(count);
    assert(RejectedBeforeRunning(&h, Step::Make(counted), marker, "whole number"));
  }

  // A count produced at run time goes through the same check.
  GroupStep substituted;
  substituted.steps = {Store("child", "k", "v")};
  substituted.loop  = google::protobuf::Value();
  substituted.loop->set_string_value("${COUNT}");
  auto failed = h.interpreter.Run(Steps{Step::Make(substituted)}, {{"COUNT", "-4"}});
  assert(!failed.ok());
  assert(failed.steps[0].error->cause_kind() == ErrorKind::kConfiguration);

  GroupStep empty;
  empty.loop = FromJson("0");
  Interpreter::Validate(Steps{Step::Make(empty)});
}

void TestFileStepsAndStore() {
  Harness    h;
  const auto dir  = TempDir();
  const auto path = (dir / "greeting.txt").string();

  WriteStep write;
  write.to      = "file://" + path;
  write.content = "hello {store.name}";

  ReadStep read;
  read.from = path;
  read.into = "content";

  DeleteStep remove;
  remove.location = path;

  StoreStep drop;
  drop.key    = "name";
  drop.remove = true;

  auto result = h.interpreter.Run(Steps{Store("s", "name", "world"), Step::Make(write), Step::Make(read),
                                   Step::Make(remove), Step::Make(drop)});
  assert(result.ok());
  assert(result.steps[2].output == "hello world");
  assert(h.interpreter.store().at("content") == "hello world");
  assert(h.interpreter.store().count("name") == 0);
  assert(!std::filesystem::exists(path));

  // Only known once substituted, so it fails when the step runs.
  ReadStep remote;
  remote.from = "${REMOTE_URL}";
  auto failed = h.interpreter.Run(Steps{Step::Make(remote)}, {{"REMOTE_URL", "s3://bucket/key"}});
  assert(!failed.ok());
  assert(failed.steps[0].error->cause_kind() == ErrorKind::kConfiguration);

  ReadStep missing;
  missing.from = (dir / "missing.txt").string();
  failed       = h.interpreter.Run(Steps{Step::Make(missing)});
  assert(failed.steps[0].error->cause_kind() == ErrorKind::kResource);
}

void TestCommandCaptureSeesLayeredEnv() {
  Harness h;

  CommandStep body;
  body.command = {"/bin/sh", "-c", "echo $FROM_PROCESS-$RUN_ID-$STEP_ONLY; echo second"};
  body.capture = true;
  body.env     = {{"STEP_ONLY", "s{env.RUN_ID}"}};

  CommandStep shell;
  shell.command = {"echo", "${RUN_ID}", "joined"};
  shell.shell   = true;
  shell.capture = true;

  auto result = h.interpreter.Run(Steps{Step::Make(body), Step::Make(shell)}, {{"RUN_ID", "7"}});
  assert(result.ok());
  assert(result.steps[0].output == "p-7-s7\nsecond\n");
  assert(result.steps[1].output == "7 joined\n");
}

void TestHttpStep() {
  Harness h;

  HttpStep post;
  post.url     = "https://hooks.example.com/{env.RUN_ID}";
  post.payload = R"({"status":"done"})";
  post.headers = {{"Content-Type", "application/json"}};

  HttpStep get;
  get.url    = "https://hooks.example.com/health";
  get.method = "head";

  auto result = h.interpreter.Run(Steps{Step::Make(post), Step::Make(get)}, {{"RUN_ID", "9"}});
  assert(result.ok());
  assert(result.steps[0].output == "pong");
  assert(h.http.requests.size() == 2);
  assert(h.http.requests[0].method == "POST");
  assert(h.http.requests[0].url == "https://hooks.example.com/9");
  assert(h.http.requests[0].body == R"({"status":"done"})");
  assert(h.http.requests[0].headers.at("Content-Type") == "application/json");
  assert(h.http.requests[1].method == "HEAD");

  h.http.response = HttpResponse{503, "unavailable"};
  auto failed     = h.interpreter.Run(Steps{Step::Make(get)});
  assert(!failed.ok());
  assert(failed.steps[0].error->cause_kind() == ErrorKind::kHttp);
}

void TestGroupLoop() {
  Harness    h;
  const auto dir = TempDir();

  WriteStep write;
  write.to      = (dir / "{loop.index}.txt").string();
  write.content = "{loop.value}-${SCOPE}";

  GroupStep group;
  group.steps = {Step::Make(write)};
  group.env   = {{"SCOPE", "inner"}};
  group.loop  = FromJson(R"(["orders", "users"])");

  auto result = h.interpreter.Run(Steps{Step::Make(group, StepCommon{"per_table"})});
  assert(result.ok());
  assert(result.steps[0].output == "2");
  assert(result.steps[0].children.size() == 2);
  assert(ReadFile(dir / "0.txt") == "orders-inner");
  assert(ReadFile(dir / "1.txt") == "users-inner");

  GroupStep counted;
  counted.steps = {Shell("child", "test {loop.index} -lt 1")};
  counted.loop  = FromJson("3");
  auto failed   = h.interpreter.Run(Steps{Step::Make(counted)});
  assert(!failed.ok());
  assert(failed.steps[0].children.size() == 2);
  assert(failed.steps[0].error->cause_kind() == ErrorKind::kProcess);
}

} // namespace

int main() {
  TestAbortHaltsPipeline();
  TestWarnAndQuietContinue();
  TestConditionSkipsStep();
  TestEngineOnlyStepRejectedBeforeRunning();
  TestInvalidStepsRejectedBeforeRunning();
  TestFileStepsAndStore();
  TestCommandCaptureSeesLayeredEnv();
  TestHttpStep();
  TestGroupLoop();

  std::cout << "ferry_unit_interpreter: pass\n";
  return 0;
}
