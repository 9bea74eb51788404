#pragma once

#include <arrow/record_batch.h>
#include <arrow/type.h>

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>

#include "internal/decode/arrow_decoder.hpp"
#include "internal/decode/row_decoder.hpp"
#include "internal/model/enums.hpp"
#include "internal/observability/spans.hpp"
#include "internal/process/process_handle.hpp"

namespace ferry::decode {

/*
  Lazy, forward-only sequence of records decoded from one running
  engine process.

  The stream owns the process handle; its decoder borrows the handle's
  stdout and is destroyed first. Reaching the end waits for the
  process and throws like ProcessHandle::Wait(). Close() or
  destruction before the end terminates the child.

  A transfer span handed to the stream ends with the stream.
*/
class RecordStream {
 public:
  RecordStream(std::unique_ptr<process::ProcessHandle> handle, model::StreamFormat format);
  RecordStream(std::unique_ptr<process::ProcessHandle> handle, model::StreamFormat format,
               observability::SpanScope span);
  ~RecordStream();

  RecordStream(RecordStream&&) noexcept            = default;
  RecordStream& operator=(RecordStream&&) noexcept = delete;

  // std::nullopt once the engine finished cleanly.
  std::optional<model::Record> Next();

  // Stops consuming and terminates the engine. Never throws.
  void Close();

  std::size_t records_yielded() const {
    return yielded_;
  }

  // Set once the stream has ended or was closed.
  const std::optional<process::ExitResult>& exit_result() const {
    return exit_;
  }

  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = model::Record;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const model::Record*;
    using reference         = const model::Record&;

    iterator() = default;
    explicit iterator(RecordStream* stream) : stream_(stream) {
      ++*this;
    }

    reference operator*() const {
      return *current_;
    }

    pointer operator->() const {
      return &*current_;
    }

    iterator& operator++() {
      current_ = stream_->Next();
      if (!current_) stream_ = nullptr;
      return *this;
    }

    void operator++(int) {
      ++*this;
    }

    bool operator==(const iterator& other) const {
      return stream_ == other.stream_;
    }

   private:
    RecordStream*                stream_{nullptr};
    std::optional<model::Record> current_;
  };

  // Single pass: begin() starts pulling records.
  iterator begin() {
    return iterator(this);
  }

  iterator end() {
    return iterator();
  }

 private:
  void Finish();

  std::unique_ptr<process::ProcessHandle> handle_;
  std::unique_ptr<RowDecoder>             decoder_;
  std::optional<observability::SpanScope> span_;
  std::size_t                             yielded_{0};
  bool                                    done_{false};
  std::optional<process::ExitResult>      exit_;
};

/*
  Columnar view of an Arrow IPC output stream. Batches keep the engine's
  column types.
*/
class BatchStream {
 public:
  explicit BatchStream(std::unique_ptr<process::ProcessHandle> handle);
  BatchStream(std::unique_ptr<process::ProcessHandle> handle, observability::SpanScope span);
  ~BatchStream();

  BatchStream(BatchStream&&) noexcept            = default;
  BatchStream& operator=(BatchStream&&) noexcept = delete;

  // Blocks until the stream header arrives; nullptr when the engine wrote nothing.
  std::shared_ptr<arrow::Schema> schema();

  // Column names and types of schema(); empty schema for an empty stream.
  model::SchemaPtr RecordSchema();

  // nullptr once the engine finished cleanly.
  std::shared_ptr<arrow::RecordBatch> Next();

  void Close();

  std::size_t batches_yielded() const {
    return batches_;
  }

  std::size_t rows_yielded() const {
    return rows_;
  }

  const std::optional<process::ExitResult>& exit_result() const {
    return exit_;
  }

 private:
  template <typename Fn>
  auto Guard(Fn&& fn) -> decltype(fn());

  void Finish();

  std::unique_ptr<process::ProcessHandle> handle_;
  std::unique_ptr<ArrowBatchDecoder>      decoder_;
  std::optional<observability::SpanScope> span_;
  std::shared_ptr<arrow::Schema>          schema_;
  bool                                    schema_read_{false};
  std::size_t                             batches_{0};
  std::size_t                             rows_{0};
  bool                                    done_{false};
  std::optional<process::ExitResult>      exit_;
};

} // namespace ferry::decode
