#include "options.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace ferry::model {

std::optional<std::string> GetString(const Options& options, const std::string& key) {
  auto it = options.fields().find(key);
  if (it == options.fields().end()) {
    return std::nullopt;
  }
  if (it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return std::nullopt;
  }
  return it->second.string_value();
}

void SetString(Options* options, const std::string& key, const std::string& value) {
  (*options->mutable_fields())[key].set_string_value(value);
}

bool Has(const Options& options, const std::string& key) {
  return options.fields().find(key) != options.fields().end();
}

Options Merge(const Options& base, const Options& overlay) {
  Options merged = base;
  for (const auto& [key, value] : overlay.fields()) {
    (*merged.mutable_fields())[key] = value;
  }
  return merged;
}

std::string ToJson(const Options& options) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(options, &json);
  if (!status.ok()) {
    throw ferry::util::ConfigurationError("failed to render options: " + std::string(status.message()));
  }
  return json;
}

} // namespace ferry::model
