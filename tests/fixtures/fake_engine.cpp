// Stand-in transfer engine used by the integration tests.
//
// Honours the engine process contract: reads CSV / JSON Lines / Arrow
// records from stdin when no source connection is given, writes rows to
// stdout when --stdout is given (or a -c task document asks for stdout),
// diagnostics to stderr. Behaviour is
// steered through FAKE_ENGINE_* environment variables:
//
//   FAKE_ENGINE_REPORT         path of a JSON report (argv, records_received, ...)
//   FAKE_ENGINE_ROWS           rows to emit (default 3)
//   FAKE_ENGINE_BATCH_ROWS     rows per Arrow batch (default 1000)
//   FAKE_ENGINE_MALFORMED_ROW  1-based row emitted malformed (CSV / JSON Lines)
//   FAKE_ENGINE_STDERR         text written to stderr
//   FAKE_ENGINE_STDERR_BYTES   filler bytes written to stderr before that text
//   FAKE_ENGINE_EXIT_CODE      exit code
//   FAKE_ENGINE_DELAY_MS       sleep before each emitted row
//   FAKE_ENGINE_IGNORE_STDIN   exit without reading stdin

#include <arrow/api.h>
#include <arrow/io/stdio.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int64_t kBaseMicros = 1700000000LL * 1000000; // 2023-11-14 22:13:20 UTC

int64_t EnvInt(const char* name, int64_t fallback) {
  const char* value = std::getenv(name);
  return value && *value ? std::strtoll(value, nullptr, 10) : fallback;
}

std::string EnvString(const char* name) {
  const char* value = std::getenv(name);
  return value ? value : "";
}

std::string FlagValue(const std::vector<std::string>& args, const std::string& flag) {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) return args[i + 1];
  }
  return {};
}

bool HasFlag(const std::vector<std::string>& args, const std::string& flag) {
  for (const auto& arg : args) {
    if (arg == flag) return true;
  }
  return false;
}

std::string OptionFormat(const std::string& json) {
  if (json.empty()) return {};
  google::protobuf::Struct options;
  if (!google::protobuf::util::JsonStringToMessage(json, &options).ok()) return {};
  auto it = options.fields().find("format");
  return it == options.fields().end() ? std::string() : it->second.string_value();
}

// Output format of a -c task document that asks for stdout; empty otherwise.
struct TaskOutput {
  bool        to_stdout{false};
  std::string format;
};

TaskOutput ReadTaskOutput(const std::string& path) {
  TaskOutput output;
  if (path.empty()) return output;
  std::ifstream in(path);
  if (!in) return output;

  std::ostringstream text;
  text << in.rdbuf();
  google::protobuf::Struct document;
  if (!google::protobuf::util::JsonStringToMessage(text.str(), &document).ok()) return output;

  const auto& fields  = document.fields();
  auto        options = fields.find("options");
  if (options != fields.end()) {
    auto flag        = options->second.struct_value().fields().find("stdout");
    output.to_stdout = flag != options->second.struct_value().fields().end() && flag->second.bool_value();
  }
  auto target = fields.find("target");
  if (target != fields.end()) {
    auto target_options = target->second.struct_value().fields().find("options");
    if (target_options != target->second.struct_value().fields().end()) {
      auto format = target_options->second.struct_value().fields().find("format");
      if (format != target_options->second.struct_value().fields().end()) output.format = format->second.string_value();
    }
  }
  return output;
}

void Delay() {
  const auto ms = EnvInt("FAKE_ENGINE_DELAY_MS", 0);
  if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::string ReadAll(std::istream& in) {
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

// ------------------------------------------------------------
// Input
// ------------------------------------------------------------

struct InputStats {
  int64_t     records{0};
  bool        eof{false};
  std::string first_line;
};

InputStats ReadTextInput(bool has_header) {
  InputStats  stats;
  std::string line;
  bool        header_pending = has_header;
  bool        in_quotes      = false;
  while (std::getline(std::cin, line)) {
    for (char c : line) {
      if (c == '"') in_quotes = !in_quotes;
    }
    if (in_quotes || line.empty()) continue;
    if (header_pending) {
      stats.first_line = line;
      header_pending   = false;
      continue;
    }
    ++stats.records;
  }
  stats.eof = std::cin.eof();
  return stats;
}

InputStats ReadArrowInput() {
  InputStats stats;
  auto       input  = std::make_shared<arrow::io::StdinStream>();
  auto       reader = arrow::ipc::RecordBatchStreamReader::Open(input);
  if (!reader.ok()) {
    std::cerr << "fake-engine: " << reader.status().ToString() << "\n";
    std::exit(3);
  }
  stats.first_line = (*reader)->schema()->ToString();
  for (;;) {
    std::shared_ptr<arrow::RecordBatch> batch;
    auto                                status = (*reader)->ReadNext(&batch);
    if (!status.ok()) {
      std::cerr << "fake-engine: " << status.ToString() << "\n";
      std::exit(3);
    }
    if (!batch) break;
    stats.records += batch->num_rows();
  }
  stats.eof = true;
  return stats;
}

// ------------------------------------------------------------
// Output
// ------------------------------------------------------------

void WriteCsv(int64_t rows, int64_t malformed) {
  std::cout << "id,name,active,ts,score\n";
  for (int64_t i = 1; i <= rows; ++i) {
    Delay();
    std::cout << i << ",\"row, " << i << "\"," << (i % 2 == 0 ? "true" : "false") << ",2023-11-14 22:13:20,"
              << i << ".5";
    if (i == malformed) std::cout << ",extra";
    std::cout << "\n";
    std::cout.flush();
  }
}

void WriteJsonLines(int64_t rows, int64_t malformed) {
  for (int64_t i = 1; i <= rows; ++i) {
    Delay();
    if (i == malformed) {
      std::cout << "{not json\n";
    } else {
      std::cout << "{\"id\":" << i << ",\"name\":\"row " << i << "\",\"active\":" << (i % 2 == 0 ? "true" : "false")
                << ",\"score\":" << i << ".5,\"tags\":[\"a\",\"b\"]}\n";
    }
    std::cout.flush();
  }
}

arrow::Status WriteArrow(int64_t rows) {
  auto schema = arrow::schema({arrow::field("id", arrow::int64()), arrow::field("active", arrow::boolean()),
                               arrow::field("ts", arrow::timestamp(arrow::TimeUnit::MICRO, "UTC")),
                               arrow::field("name", arrow::utf8()), arrow::field("score", arrow::float64())});

  auto out = std::make_shared<arrow::io::StdoutStream>();
  ARROW_ASSIGN_OR_RAISE(auto writer, arrow::ipc::MakeStreamWriter(out, schema));

  const int64_t batch_rows = std::max<int64_t>(1, EnvInt("FAKE_ENGINE_BATCH_ROWS", 1000));
  for (int64_t start = 1; start <= rows; start += batch_rows) {
    const int64_t end = std::min(rows, start + batch_rows - 1);

    arrow::Int64Builder     ids;
    arrow::BooleanBuilder   active;
    arrow::TimestampBuilder ts(arrow::timestamp(arrow::TimeUnit::MICRO, "UTC"), arrow::default_memory_pool());
    arrow::StringBuilder    names;
    arrow::DoubleBuilder    scores;
    for (int64_t i = start; i <= end; ++i) {
      Delay();
      ARROW_RETURN_NOT_OK(ids.Append(i));
      ARROW_RETURN_NOT_OK(active.Append(i % 2 == 0));
      ARROW_RETURN_NOT_OK(ts.Append(kBaseMicros + i * 1000000));
      if (i % 3 == 0) {
        ARROW_RETURN_NOT_OK(names.AppendNull());
      } else {
        ARROW_RETURN_NOT_OK(names.Append("row " + std::to_string(i)));
      }
      ARROW_RETURN_NOT_OK(scores.Append(static_cast<double>(i) + 0.5));
    }

    std::vector<std::shared_ptr<arrow::Array>> columns(5);
    ARROW_RETURN_NOT_OK(ids.Finish(&columns[0]));
    ARROW_RETURN_NOT_OK(active.Finish(&columns[1]));
    ARROW_RETURN_NOT_OK(ts.Finish(&columns[2]));
    ARROW_RETURN_NOT_OK(names.Finish(&columns[3]));
    ARROW_RETURN_NOT_OK(scores.Finish(&columns[4]));
    ARROW_RETURN_NOT_OK(writer->WriteRecordBatch(*arrow::RecordBatch::Make(schema, end - start + 1, columns)));
    ARROW_RETURN_NOT_OK(out->Flush());
  }
  return writer->Close();
}

// ------------------------------------------------------------
// Report
// ------------------------------------------------------------

void WriteReport(const std::vector<std::string>& args, const InputStats& input, bool read_input) {
  const auto path = EnvString("FAKE_ENGINE_REPORT");
  if (path.empty()) return;

  google::protobuf::Struct report;
  auto&                    fields = *report.mutable_fields();

  auto* argv = fields["argv"].mutable_list_value();
  for (const auto& arg : args) argv->add_values()->set_string_value(arg);

  fields["read_input"].set_bool_value(read_input);
  fields["records_received"].set_number_value(static_cast<double>(input.records));
  fields["eof"].set_bool_value(input.eof);
  fields["input_header"].set_string_value(input.first_line);
  fields["package"].set_string_value(EnvString("FERRY_PACKAGE"));

  char cwd[4096];
  if (::getcwd(cwd, sizeof(cwd)) != nullptr) fields["cwd"].set_string_value(cwd);

  // Document flags: capture what the file held while the engine ran.
  for (const char* flag : {"-c", "-r", "-p"}) {
    const auto doc_path = FlagValue(args, flag);
    if (doc_path.empty()) continue;
    std::ifstream in(doc_path);
    fields["document_path"].set_string_value(doc_path);
    fields["document"].set_string_value(in ? ReadAll(in) : std::string());
  }

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(report, &json).ok()) return;
  std::ofstream out(path, std::ios::trunc);
  out << json;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  const auto filler = EnvInt("FAKE_ENGINE_STDERR_BYTES", 0);
  if (filler > 0) std::cerr << std::string(static_cast<std::size_t>(filler), 'x') << '\n';

  const auto stderr_text = EnvString("FAKE_ENGINE_STDERR");
  if (!stderr_text.empty()) std::cerr << stderr_text << std::endl;

  const std::string verb = args.empty() ? "" : args.front();

  if (verb == "copy") {
    std::error_code ec;
    const auto      options = HasFlag(args, "--recursive") ? std::filesystem::copy_options::recursive
                                                           : std::filesystem::copy_options::none;
    std::filesystem::copy(FlagValue(args, "--from"), FlagValue(args, "--to"),
                          options | std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      std::cerr << "fake-engine: copy failed: " << ec.message() << "\n";
      WriteReport(args, {}, false);
      return 4;
    }
  }

  InputStats input;
  const bool direct     = verb == "run" && (HasFlag(args, "--src-options") || HasFlag(args, "--tgt-conn") ||
                                        HasFlag(args, "--stdout"));
  const bool read_input = direct && !HasFlag(args, "--src-conn") && EnvString("FAKE_ENGINE_IGNORE_STDIN") != "1";
  if (read_input) {
    const auto format = OptionFormat(FlagValue(args, "--src-options"));
    if (format == "arrow") {
      input = ReadArrowInput();
    } else {
      input = ReadTextInput(format != "jsonlines");
    }
  }

  const auto task = verb == "run" ? ReadTaskOutput(FlagValue(args, "-c")) : TaskOutput{};
  if (HasFlag(args, "--stdout") || task.to_stdout) {
    const auto format    = task.to_stdout ? task.format : OptionFormat(FlagValue(args, "--tgt-options"));
    const auto rows      = EnvInt("FAKE_ENGINE_ROWS", 3);
    const auto malformed = EnvInt("FAKE_ENGINE_MALFORMED_ROW", 0);
    if (format == "arrow") {
      auto status = WriteArrow(rows);
      if (!status.ok()) {
        std::cerr << "fake-engine: " << status.ToString() << "\n";
        return 3;
      }
    } else if (format == "jsonlines") {
      WriteJsonLines(rows, malformed);
    } else {
      WriteCsv(rows, malformed);
    }
  }

  WriteReport(args, input, read_input);
  return static_cast<int>(EnvInt("FAKE_ENGINE_EXIT_CODE", 0));
}
