#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "client/cpp/ferry_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

// Generates rows on demand; the engine reads them from stdin as they are produced.
class CounterSource : public ferry::model::RecordSource {
 public:
  explicit CounterSource(int64_t count) : count_(count) {
  }

  std::optional<ferry::model::Record> Next() override {
    if (next_ >= count_) {
      return std::nullopt;
    }
    const int64_t id = next_++;
    return ferry::model::Record{{"id", id}, {"label", "item-" + std::to_string(id)}, {"even", id % 2 == 0}};
  }

 private:
  int64_t count_;
  int64_t next_{0};
};

} // namespace

int main(int argc, char** argv) {
  // Optional target argument keeps the example portable across environments.
  const std::string target = argc > 1 ? argv[1] : "file:///tmp/ferry_input_example.csv";

  ferry::client::FerryClient client(ferry::config::ConfigLoader::Defaults());

  ferry::model::RunSpec spec;
  spec.tgt_conn     = target;
  spec.input        = std::make_shared<CounterSource>(1000);
  spec.input_format = ferry::model::StreamFormat::kArrow;

  try {
    auto result = client.Run(spec);
    std::cout << "Input transfer finished with exit code " << result.exit.exit_code << '\n';
  } catch (const ferry::util::ProcessError& e) {
    std::cerr << "Engine failed (" << e.exit_code() << "): " << e.stderr_text() << '\n';
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Transfer failed: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
