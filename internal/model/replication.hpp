#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/enums.hpp"
#include "internal/model/options.hpp"
#include "internal/model/step.hpp"
#include "internal/util/env.hpp"

namespace ferry::model {

/*
  One named unit of work inside a Replication. Every field is optional:
  empty strings, empty lists and unset optionals mean "inherit from the
  replication defaults".
*/
struct ReplicationStream {
  std::string              id;
  std::string              description;
  std::optional<Mode>      mode;
  std::string              object;
  std::vector<std::string> select;
  std::vector<std::string> files;
  std::string              where;
  std::vector<std::string> primary_key;
  std::string              update_key;
  std::string              sql;
  std::vector<std::string> tags;
  Options                  source_options;
  Options                  target_options;
  std::string              schedule;
  std::optional<google::protobuf::Value> transforms;
  std::optional<google::protobuf::Value> columns;
  std::optional<HookMap>                 hooks;
  std::optional<bool>                    disabled;

  void Enable() {
    disabled = false;
  }

  void Disable() {
    disabled = true;
  }

  bool IsDisabled() const {
    return disabled.value_or(false);
  }
};

// Fields set on `stream` win; the rest come from `defaults`. Options merge key-wise.
ReplicationStream Overlay(const ReplicationStream& defaults, const ReplicationStream& stream);

using NamedStream = std::pair<std::string, ReplicationStream>;

struct Replication {
  std::string              source;
  std::string              target;
  ReplicationStream        defaults;
  HookMap                  hooks;
  std::vector<NamedStream> streams; // declaration order
  util::EnvMap             env;
  bool                     debug = false;

  // When set, the engine reads this file and the in-memory fields are ignored.
  std::string file_path;

  ReplicationStream*       FindStream(const std::string& name);
  const ReplicationStream* FindStream(const std::string& name) const;

  // Throws ConfigurationError on a duplicate name; nothing is added in that case.
  void AddStream(std::string name, ReplicationStream stream);
  void AddStreams(std::vector<NamedStream> more);

  // Names that do not exist are ignored.
  void EnableStreams(const std::vector<std::string>& names);
  void DisableStreams(const std::vector<std::string>& names);

  void SetDefaultMode(Mode mode);

  // Enabled streams with defaults applied, in declaration order.
  std::vector<NamedStream> ResolveStreams() const;

  // Throws ConfigurationError.
  void Validate() const;
};

} // namespace ferry::model
