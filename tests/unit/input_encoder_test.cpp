#include "internal/transport/input_encoder.hpp"

#include <unistd.h>

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/decode/arrow_decoder.hpp"
#include "internal/decode/row_decoder.hpp"
#include "internal/util/errors.hpp"

using namespace ferry::model;
using ferry::transport::MakeInputEncoder;
using ferry::transport::QuoteCsvField;
using ferry::util::EncodeError;

namespace {

struct Pipe {
  int read_fd{-1};
  int write_fd{-1};

  Pipe() {
    int       fds[2];
    const int rc = ::pipe(fds);
    assert(rc == 0);
    read_fd  = fds[0];
    write_fd = fds[1];
  }

  ~Pipe() {
    CloseWrite();
    if (read_fd >= 0) ::close(read_fd);
  }

  void CloseWrite() {
    if (write_fd >= 0) ::close(write_fd);
    write_fd = -1;
  }

  std::string ReadAll() {
    CloseWrite();
    std::string out;
    char        buf[4096];
    ssize_t     n = 0;
    while ((n = ::read(read_fd, buf, sizeof(buf))) > 0) out.append(buf, static_cast<std::size_t>(n));
    return out;
  }
};

template <typename Fn>
bool ThrowsEncode(Fn&& fn) {
  try {
    fn();
  } catch (const EncodeError&) {
    return true;
  }
  return false;
}

void TestQuoteCsvField() {
  assert(QuoteCsvField(Value{}) == "");
  assert(QuoteCsvField(Value(std::string())) == "\"\"");
  assert(QuoteCsvField(Value(std::string("plain"))) == "plain");
  assert(QuoteCsvField(Value(std::string("a,b"))) == "\"a,b\"");
  assert(QuoteCsvField(Value(std::string("say \"hi\""))) == "\"say \"\"hi\"\"\"");
  assert(QuoteCsvField(Value(std::string("two\nlines"))) == "\"two\nlines\"");
  assert(QuoteCsvField(Value(std::string(" padded"))) == "\" padded\"");
  assert(QuoteCsvField(Value(int64_t{42})) == "42");
  assert(QuoteCsvField(Value(true)) == "true");
}

void TestCsvEncoderWritesHeaderOnce() {
  Pipe pipe;
  auto encoder = MakeInputEncoder(StreamFormat::kCsv, pipe.write_fd, 0);

  assert(encoder->Write(Record{{"id", int64_t{1}}, {"name", std::string("a, b")}}));
  assert(encoder->Write(Record{{"id", int64_t{2}}, {"name", std::string()}}));
  assert(encoder->Write(Record{{"id", int64_t{3}}, {"name", std::monostate{}}}));
  assert(encoder->Write(Record{{"id", int64_t{4}}}));
  assert(encoder->Finish());
  assert(encoder->records_written() == 4);

  assert(pipe.ReadAll() == "id,name\n1,\"a, b\"\n2,\"\"\n3,\n4,\n");
}

void TestCsvEncoderRejectsUnknownColumn() {
  Pipe pipe;
  auto encoder = MakeInputEncoder(StreamFormat::kCsv, pipe.write_fd, 0);

  assert(encoder->Write(Record{{"id", int64_t{1}}}));
  assert(ThrowsEncode([&] { encoder->Write(Record{{"id", int64_t{2}}, {"extra", std::string("x")}}); }));
  assert(encoder->records_written() == 1);
}

void TestJsonLinesEncoderKeepsOrderAndTypes() {
  Pipe pipe;
  auto encoder = MakeInputEncoder(StreamFormat::kJsonLines, pipe.write_fd, 0);

  assert(encoder->Write(
      Record{{"id", int64_t{1}}, {"name", std::string("x")}, {"ok", true}, {"gone", std::monostate{}}}));
  assert(encoder->Write(Record{{"id", int64_t{2}}, {"score", 2.5}, {"ratio", 2.0}, {"big", int64_t{9007199254740993}}}));
  assert(encoder->Write(Record{{"at", Timestamp{1700000000LL * 1000000 + 250000}}}));
  assert(encoder->Finish());
  pipe.CloseWrite();

  auto decoder = ferry::decode::MakeRowDecoder(StreamFormat::kJsonLines, pipe.read_fd);

  auto first = decoder->Next();
  assert(first->ColumnNames() == (std::vector<std::string>{"id", "name", "ok", "gone"}));
  assert(std::get<int64_t>((*first)["id"]) == 1);
  assert(std::get<std::string>((*first)["name"]) == "x");
  assert(std::get<bool>((*first)["ok"]));
  assert(std::holds_alternative<std::monostate>((*first)["gone"]));

  auto second = decoder->Next();
  assert(second->ColumnNames() == (std::vector<std::string>{"id", "score", "ratio", "big"}));
  assert(std::get<double>((*second)["score"]) == 2.5);
  assert(std::get<double>((*second)["ratio"]) == 2.0);
  assert(std::get<int64_t>((*second)["big"]) == 9007199254740993LL);

  // Timestamps travel as UTC text.
  auto third = decoder->Next();
  assert(std::get<std::string>((*third)["at"]) == "2023-11-14 22:13:20.250000");
  assert(!decoder->Next().has_value());
}

void TestArrowEncoderWidensFirstBatch() {
  Pipe pipe;
  auto encoder = MakeInputEncoder(StreamFormat::kArrow, pipe.write_fd, 10);

  assert(encoder->Write(Record{{"id", int64_t{1}}, {"score", int64_t{2}}}));
  assert(encoder->Write(Record{{"id", int64_t{2}}, {"score", 2.5}, {"at", Timestamp{1700000000000000}}}));
  assert(encoder->Write(Record{{"id", int64_t{3}}, {"name", std::string("c")}, {"flag", true}}));
  assert(encoder->records_written() == 0);
  assert(encoder->Finish());
  assert(encoder->records_written() == 3);
  pipe.CloseWrite();

  ferry::decode::ArrowBatchDecoder decoder(pipe.read_fd);
  const auto                       schema = ferry::decode::ToRecordSchema(*decoder.schema());
  assert(schema->size() == 5);
  assert((*schema)[0] == (Column{"id", ColumnType::kInt64}));
  assert((*schema)[1] == (Column{"score", ColumnType::kFloat64}));
  assert((*schema)[2] == (Column{"at", ColumnType::kTimestamp}));
  assert((*schema)[3] == (Column{"name", ColumnType::kString}));
  assert((*schema)[4] == (Column{"flag", ColumnType::kBool}));

  auto batch = decoder.Next();
  assert(batch && batch->num_rows() == 3);
  assert(batch->column(1)->null_count() == 1);
  assert(batch->column(3)->null_count() == 2);
  assert(decoder.Next() == nullptr);
}

void TestArrowEncoderRejectsLaterTypeChange() {
  Pipe pipe;
  auto encoder = MakeInputEncoder(StreamFormat::kArrow, pipe.write_fd, 1);

  assert(encoder->Write(Record{{"id", int64_t{1}}}));
  assert(encoder->records_written() == 1);
  assert(ThrowsEncode([&] { encoder->Write(Record{{"id", std::string("two")}}); }));
  assert(ThrowsEncode([&] { encoder->Write(Record{{"other", int64_t{3}}}); }));
}

void TestArrowEncoderEmptyInput() {
  Pipe pipe;
  auto encoder = MakeInputEncoder(StreamFormat::kArrow, pipe.write_fd, 4);
  assert(encoder->Finish());
  pipe.CloseWrite();

  ferry::decode::ArrowBatchDecoder decoder(pipe.read_fd);
  assert(decoder.schema() && decoder.schema()->num_fields() == 0);
  assert(decoder.Next() == nullptr);
}

} // namespace

int main() {
  TestQuoteCsvField();
  TestCsvEncoderWritesHeaderOnce();
  TestCsvEncoderRejectsUnknownColumn();
  TestJsonLinesEncoderKeepsOrderAndTypes();
  TestArrowEncoderWidensFirstBatch();
  TestArrowEncoderRejectsLaterTypeChange();
  TestArrowEncoderEmptyInput();

  std::cout << "ferry_unit_input_encoder: pass\n";
  return 0;
}
