#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "internal/model/record.hpp"

namespace ferry::model {

/*
  Pull-based input for the transport. The stdin writer calls Next()
  only as fast as the engine drains the pipe, so a source never has
  more than one record (or one input batch) in flight.

  Finite sources return std::nullopt after the last record. A source
  that never returns std::nullopt keeps the engine's stdin open until
  the transfer is cancelled.
*/
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  virtual std::optional<Record> Next() = 0;
};

// Finite source over an in-memory collection.
class VectorRecordSource : public RecordSource {
 public:
  explicit VectorRecordSource(std::vector<Record> records) : records_(std::move(records)) {
  }

  std::optional<Record> Next() override {
    if (position_ >= records_.size()) {
      return std::nullopt;
    }
    return records_[position_++];
  }

 private:
  std::vector<Record> records_;
  std::size_t         position_{0};
};

// Lazily produced records; the generator signals the end with std::nullopt.
class GeneratorRecordSource : public RecordSource {
 public:
  using Generator = std::function<std::optional<Record>()>;

  explicit GeneratorRecordSource(Generator generator) : generator_(std::move(generator)) {
  }

  std::optional<Record> Next() override {
    if (done_) {
      return std::nullopt;
    }
    auto record = generator_();
    if (!record) {
      done_ = true;
    }
    return record;
  }

 private:
  Generator generator_;
  bool      done_{false};
};

} // namespace ferry::model
