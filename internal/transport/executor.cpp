#include "executor.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/transport/fd_stream.hpp"
#include "internal/transport/input_encoder.hpp"

namespace ferry::transport {

using ferry::observability::IntField;
using ferry::observability::StringField;

Executor::Executor(const ferry::runtime::config::EngineConfig& engine) : engine_(engine) {
}

std::unique_ptr<process::ProcessHandle> Executor::Execute(command::Invocation invocation,
                                                          const ExecuteOptions& options) const {
  process::SpawnOptions spawn;
  spawn.pipe_stdin           = options.input != nullptr;
  spawn.echo_stderr          = options.echo_stderr;
  spawn.stderr_capture_bytes = options.full_stderr                   ? 0
                               : engine_.stderr_capture_bytes() > 0 ? engine_.stderr_capture_bytes()
                                                                    : 64 * 1024;
  spawn.terminate_grace      = std::chrono::milliseconds(engine_.terminate_grace_ms() > 0 ? engine_.terminate_grace_ms()
                                                                                          : 2000);

  auto handle = process::ProcessHandle::Spawn(std::move(invocation), spawn);

  if (options.input) {
    const std::size_t batch_rows = engine_.input_batch_rows() > 0 ? engine_.input_batch_rows() : 1024;

    handle->StartInputWriter([source = options.input, format = options.input_format,
                              batch_rows](int fd, const std::atomic<bool>& stop) {
      auto encoder = MakeInputEncoder(format, fd, batch_rows);
      while (!stop) {
        auto record = source->Next();
        if (!record) break;
        if (!encoder->Write(*record)) {
          FERRY_LOG_DEBUG("engine stopped reading input",
                          {IntField("records", static_cast<int64_t>(encoder->records_written()))});
          return;
        }
      }
      if (!stop && !encoder->Finish()) {
        FERRY_LOG_DEBUG("engine stopped reading input before end of stream");
        return;
      }
      FERRY_LOG_DEBUG("input stream complete", {IntField("records", static_cast<int64_t>(encoder->records_written())),
                                                StringField("format", model::ToString(format))});
    });
  }
  return handle;
}

RunOutput RunToCompletion(process::ProcessHandle& handle, bool capture_output) {
  RunOutput output;

  LineReader  reader(handle.stdout_fd());
  std::string line;
  while (reader.Next(&line)) {
    if (capture_output) {
      output.lines.push_back(line);
    } else {
      FERRY_LOG_INFO(line, {StringField("stream", "stdout")});
    }
  }

  output.exit = handle.Wait();
  return output;
}

} // namespace ferry::transport
