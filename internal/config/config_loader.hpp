#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

#include "config/config.pb.h"
#include "internal/model/replication.hpp"

namespace ferry::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset fields are filled with defaults, then FERRY_* environment
  overrides are applied.
*/
class ConfigLoader {
 public:
  static ferry::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Built-in defaults plus environment overrides, no file involved.
  static ferry::runtime::config::RuntimeConfig Defaults();

  // Fill every unset field with its default.
  static void ApplyDefaults(ferry::runtime::config::RuntimeConfig* config);

  static void ApplyEnvironmentOverrides(ferry::runtime::config::RuntimeConfig* config);

  /*
    Loads a YAML or JSON configuration document (replication,
    pipeline or task) as a generic value tree.
  */
  static google::protobuf::Value LoadDocument(const std::string& path);

  static google::protobuf::Value ParseDocument(const std::string& text);

  // Replication document text, streams kept in declaration order.
  static model::Replication ParseReplication(const std::string& text);
};

} // namespace ferry::config
