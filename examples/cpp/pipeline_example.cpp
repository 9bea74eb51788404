#include <iostream>
#include <string>

#include "client/cpp/ferry_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/model/document.hpp"

int main(int argc, char** argv) {
  const std::string replication_path = argc > 1 ? argv[1] : "replication.yaml";

  ferry::client::FerryClient client(ferry::config::ConfigLoader::Defaults());

  ferry::model::ReplicationStep replicate;
  replicate.path = replication_path;

  ferry::model::StoreStep store;
  store.key = "finished";
  store.value.set_string_value("{env.RUN_ID}");

  ferry::model::LogStep log;
  log.message = "run {store.finished} done";

  ferry::model::HttpStep notify;
  notify.url     = "${NOTIFY_URL}";
  notify.payload = R"({"run": "{env.RUN_ID}"})";

  ferry::model::StepCommon notify_common{"notify"};
  notify_common.condition  = "${NOTIFY_URL}";
  notify_common.on_failure = ferry::model::OnFailure::kWarn;

  ferry::model::Pipeline pipeline;
  pipeline.env   = {{"RUN_ID", "example-1"}};
  pipeline.steps = {
      ferry::model::Step::Make(replicate, {"replicate"}),
      ferry::model::Step::Make(store),
      ferry::model::Step::Make(log),
      ferry::model::Step::Make(notify, notify_common),
  };

  try {
    auto result = client.Interpret(pipeline);
    for (const auto& step : result.steps) {
      std::cout << step.index << " " << ferry::model::ToString(step.type) << ": " << ferry::steps::ToString(step.status)
                << '\n';
    }
    result.ThrowIfFailed();
  } catch (const std::exception& e) {
    std::cerr << "Pipeline failed: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
