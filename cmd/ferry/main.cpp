#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "client/cpp/ferry_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/model/document.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/transport/input_encoder.hpp"
#include "internal/util/errors.hpp"

using ferry::client::FerryClient;
using ferry::observability::StringField;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  ferry [--config runtime.yaml] run -r <replication.yaml> [--streams a,b] [--mode <mode>] [--range <r>]\n"
            << "  ferry [--config runtime.yaml] run -p <pipeline.yaml> [--interpret]\n"
            << "  ferry [--config runtime.yaml] run -c <task.yaml>\n"
            << "  ferry [--config runtime.yaml] stream -c <task.yaml> [--format csv|jsonlines|arrow]\n"
            << "  ferry [--config runtime.yaml] exec -- <engine args...>\n";
}

static std::vector<std::string> SplitList(const std::string& text) {
  std::vector<std::string> out;
  std::stringstream        in(text);
  std::string              item;
  while (std::getline(in, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

static void PrintRecord(const ferry::model::Record& record, bool header) {
  const auto  count = record.size();
  std::string line;
  for (std::size_t i = 0; i < count; ++i) {
    if (i > 0) line += ',';
    line += header ? ferry::transport::QuoteCsvField(record.name(i)) : ferry::transport::QuoteCsvField(record.at(i));
  }
  std::cout << line << '\n';
}

static int Run(const FerryClient& client, const std::vector<std::string>& args) {
  std::string replication_path, pipeline_path, task_path;
  bool        interpret = false;

  ferry::command::ReplicationSelection selection;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg     = args[i];
    auto        operand = [&]() -> std::string {
      if (i + 1 >= args.size()) throw ferry::util::ConfigurationError(arg + " requires a value");
      return args[++i];
    };

    if (arg == "-r") {
      replication_path = operand();
    } else if (arg == "-p") {
      pipeline_path = operand();
    } else if (arg == "-c") {
      task_path = operand();
    } else if (arg == "--streams") {
      selection.streams = SplitList(operand());
    } else if (arg == "--mode") {
      selection.mode = ferry::model::ParseMode(operand());
    } else if (arg == "--range") {
      selection.range = operand();
    } else if (arg == "--interpret") {
      interpret = true;
    } else {
      throw ferry::util::ConfigurationError("unknown argument for run: " + arg);
    }
  }

  const int chosen = !replication_path.empty() + !pipeline_path.empty() + !task_path.empty();
  if (chosen != 1) throw ferry::util::ConfigurationError("run needs exactly one of -r, -p or -c");

  if (!replication_path.empty()) {
    ferry::model::Replication replication;
    replication.file_path = replication_path;
    client.RunReplication(replication, selection);
    return 0;
  }

  if (!pipeline_path.empty()) {
    ferry::model::Pipeline pipeline;
    pipeline.file_path = pipeline_path;
    if (!interpret) {
      client.RunPipeline(pipeline);
      return 0;
    }
    auto result = client.Interpret(pipeline);
    result.ThrowIfFailed();
    return 0;
  }

  auto task   = ferry::model::TaskFromDocument(ferry::config::ConfigLoader::LoadDocument(task_path));
  auto result = client.RunTask(task, task.to_stdout);
  for (const auto& line : result.output) std::cout << line << '\n';
  return 0;
}

static int Stream(const FerryClient& client, const std::vector<std::string>& args) {
  std::string                task_path;
  ferry::model::StreamFormat format = ferry::model::StreamFormat::kCsv;

  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "-c" && i + 1 < args.size()) {
      task_path = args[++i];
    } else if (args[i] == "--format" && i + 1 < args.size()) {
      auto parsed = ferry::model::ParseFormat(args[++i]);
      if (!parsed) throw ferry::util::ConfigurationError("unknown format: " + args[i]);
      format = ferry::model::ToStreamFormat(*parsed);
    } else {
      throw ferry::util::ConfigurationError("unknown argument for stream: " + args[i]);
    }
  }
  if (task_path.empty()) throw ferry::util::ConfigurationError("stream requires -c <task.yaml>");

  auto spec   = ferry::model::RunSpecFromDocument(ferry::config::ConfigLoader::LoadDocument(task_path));
  auto stream = client.Stream(spec, format);

  bool header = true;
  for (const auto& record : stream) {
    if (header) {
      PrintRecord(record, true);
      header = false;
    }
    PrintRecord(record, false);
  }
  std::cout.flush();
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string command = args.front();
  args.erase(args.begin());

  int code = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? ferry::config::ConfigLoader::Defaults()
                                      : ferry::config::ConfigLoader::LoadFromYaml(config_path);

    ferry::observability::InitializeTracing(config);
    ferry::observability::InitializeLogging(config);

    FerryClient client(config);

    if (command == "run") {
      code = Run(client, args);
    } else if (command == "stream") {
      code = Stream(client, args);
    } else if (command == "exec") {
      if (!args.empty() && args.front() == "--") args.erase(args.begin());
      client.Cli(args);
    } else {
      Usage();
      code = 1;
    }
  } catch (const ferry::util::ConfigurationError& e) {
    FERRY_LOG_ERROR("invalid configuration", {StringField("error", e.what())});
    code = 2;
  } catch (const ferry::util::ProcessError& e) {
    FERRY_LOG_ERROR("engine failed", {StringField("error", e.what())});
    code = e.exit_code() != 0 ? e.exit_code() : 1;
  } catch (const ferry::util::StepError& e) {
    FERRY_LOG_ERROR("pipeline failed", {StringField("error", e.what())});
    code = 1;
  } catch (const std::exception& e) {
    FERRY_LOG_ERROR("fatal error", {StringField("error", e.what())});
    code = 1;
  }

  ferry::observability::ShutdownLogging();
  ferry::observability::ShutdownTracing();
  return code;
}
