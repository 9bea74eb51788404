#include <iostream>
#include <string>

#include "client/cpp/ferry_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

int main(int argc, char** argv) {
  const std::string source = argc > 1 ? argv[1] : "postgres";
  const std::string stream = argc > 2 ? argv[2] : "public.orders";

  ferry::client::FerryClient client(ferry::config::ConfigLoader::Defaults());

  ferry::model::RunSpec spec;
  spec.src_conn   = source;
  spec.src_stream = stream;
  spec.limit      = 100;

  try {
    // Row by row: the first ten records, then the engine is stopped.
    auto records = client.Stream(spec, ferry::model::StreamFormat::kJsonLines);
    for (const auto& record : records) {
      for (std::size_t i = 0; i < record.size(); ++i) {
        std::cout << (i > 0 ? " " : "") << record.name(i) << "=" << ferry::model::ToText(record.at(i));
      }
      std::cout << '\n';
      if (records.records_yielded() == 10) break;
    }
    records.Close();

    // Batch by batch, keeping the engine's column types.
    auto batches = client.StreamBatches(spec);
    for (const auto& column : *batches.RecordSchema()) {
      std::cout << column.name << ": " << ferry::model::ToString(column.type) << '\n';
    }
    while (auto batch = batches.Next()) {
      std::cout << "batch of " << batch->num_rows() << " rows\n";
    }
    std::cout << "Read " << batches.rows_yielded() << " rows in " << batches.batches_yielded() << " batches\n";
  } catch (const ferry::util::DecodeError& e) {
    std::cerr << "Malformed engine output after " << e.records_yielded() << " records: " << e.what() << '\n';
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Stream failed: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
