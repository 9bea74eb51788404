#include "record_stream.hpp"

#include <cstdint>
#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ferry::decode {

using ferry::observability::IntField;
using ferry::util::DecodeError;

namespace {

// Ends the transfer span with the outcome of the run.
void EndSpan(std::optional<observability::SpanScope>* span, const std::optional<process::ExitResult>& exit,
             const std::exception* error) {
  if (!*span) return;
  if (error) (*span)->RecordError(*error);
  if (exit) {
    (*span)->SetAttribute("transfer.exit_code", static_cast<std::int64_t>(exit->exit_code));
    if (exit->cancelled) (*span)->AddEvent("closed");
  }
  span->reset();
}

} // namespace

// ------------------------------------------------------------
// RecordStream
// ------------------------------------------------------------

RecordStream::RecordStream(std::unique_ptr<process::ProcessHandle> handle, model::StreamFormat format)
    : handle_(std::move(handle)), decoder_(MakeRowDecoder(format, handle_->stdout_fd())) {
}

RecordStream::RecordStream(std::unique_ptr<process::ProcessHandle> handle, model::StreamFormat format,
                           observability::SpanScope span)
    : RecordStream(std::move(handle), format) {
  span_.emplace(std::move(span));
}

RecordStream::~RecordStream() {
  Close();
}

std::optional<model::Record> RecordStream::Next() {
  if (done_) return std::nullopt;

  std::optional<model::Record> record;
  try {
    record = decoder_->Next();
  } catch (const DecodeError& e) {
    handle_->RecordDecodeError(std::make_exception_ptr(DecodeError(e.what(), yielded_)));
    Finish();
    throw DecodeError(e.what(), yielded_);
  } catch (...) {
    Close();
    throw;
  }

  if (record) {
    ++yielded_;
    return record;
  }
  Finish();
  return std::nullopt;
}

void RecordStream::Finish() {
  done_ = true;
  try {
    exit_ = handle_->Wait();
  } catch (const std::exception& e) {
    exit_ = handle_->result();
    EndSpan(&span_, exit_, &e);
    throw;
  }
  EndSpan(&span_, exit_, nullptr);
}

void RecordStream::Close() {
  if (!handle_ || done_) return;
  done_ = true;
  exit_ = handle_->Terminate();
  EndSpan(&span_, exit_, nullptr);
  FERRY_LOG_DEBUG("record stream closed early", {IntField("pid", handle_->pid()),
                                                 IntField("records", static_cast<int64_t>(yielded_))});
}

// ------------------------------------------------------------
// BatchStream
// ------------------------------------------------------------

BatchStream::BatchStream(std::unique_ptr<process::ProcessHandle> handle)
    : handle_(std::move(handle)), decoder_(std::make_unique<ArrowBatchDecoder>(handle_->stdout_fd())) {
}

BatchStream::BatchStream(std::unique_ptr<process::ProcessHandle> handle, observability::SpanScope span)
    : BatchStream(std::move(handle)) {
  span_.emplace(std::move(span));
}

BatchStream::~BatchStream() {
  Close();
}

template <typename Fn>
auto BatchStream::Guard(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const DecodeError& e) {
    handle_->RecordDecodeError(std::make_exception_ptr(DecodeError(e.what(), rows_)));
    Finish();
    throw DecodeError(e.what(), rows_);
  } catch (...) {
    Close();
    throw;
  }
}

std::shared_ptr<arrow::Schema> BatchStream::schema() {
  if (!schema_read_) {
    if (done_) return nullptr;
    schema_      = Guard([this] { return decoder_->schema(); });
    schema_read_ = true;
  }
  return schema_;
}

model::SchemaPtr BatchStream::RecordSchema() {
  auto arrow_schema = schema();
  return arrow_schema ? ToRecordSchema(*arrow_schema) : model::MakeSchema({});
}

std::shared_ptr<arrow::RecordBatch> BatchStream::Next() {
  if (done_) return nullptr;

  auto batch = Guard([this] { return decoder_->Next(); });
  if (batch) {
    ++batches_;
    rows_ += static_cast<std::size_t>(batch->num_rows());
    return batch;
  }
  Finish();
  return nullptr;
}

void BatchStream::Finish() {
  done_ = true;
  try {
    exit_ = handle_->Wait();
  } catch (const std::exception& e) {
    exit_ = handle_->result();
    EndSpan(&span_, exit_, &e);
    throw;
  }
  EndSpan(&span_, exit_, nullptr);
}

void BatchStream::Close() {
  if (!handle_ || done_) return;
  done_ = true;
  exit_ = handle_->Terminate();
  EndSpan(&span_, exit_, nullptr);
  FERRY_LOG_DEBUG("batch stream closed early", {IntField("pid", handle_->pid()),
                                                IntField("batches", static_cast<int64_t>(batches_))});
}

} // namespace ferry::decode
