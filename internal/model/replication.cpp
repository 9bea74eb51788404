#include "replication.hpp"

#include <set>

#include "internal/util/errors.hpp"

namespace ferry::model {

namespace {

template <typename T>
void Inherit(T& value, const T& fallback) {
  if (value.empty()) value = fallback;
}

template <typename T>
void Inherit(std::optional<T>& value, const std::optional<T>& fallback) {
  if (!value) value = fallback;
}

} // namespace

ReplicationStream Overlay(const ReplicationStream& defaults, const ReplicationStream& stream) {
  ReplicationStream out = stream;
  Inherit(out.id, defaults.id);
  Inherit(out.description, defaults.description);
  Inherit(out.mode, defaults.mode);
  Inherit(out.object, defaults.object);
  Inherit(out.select, defaults.select);
  Inherit(out.files, defaults.files);
  Inherit(out.where, defaults.where);
  Inherit(out.primary_key, defaults.primary_key);
  Inherit(out.update_key, defaults.update_key);
  Inherit(out.sql, defaults.sql);
  Inherit(out.tags, defaults.tags);
  Inherit(out.schedule, defaults.schedule);
  Inherit(out.transforms, defaults.transforms);
  Inherit(out.columns, defaults.columns);
  Inherit(out.hooks, defaults.hooks);
  Inherit(out.disabled, defaults.disabled);
  out.source_options = Merge(defaults.source_options, stream.source_options);
  out.target_options = Merge(defaults.target_options, stream.target_options);
  return out;
}

ReplicationStream* Replication::FindStream(const std::string& name) {
  for (auto& [stream_name, stream] : streams) {
    if (stream_name == name) return &stream;
  }
  return nullptr;
}

const ReplicationStream* Replication::FindStream(const std::string& name) const {
  for (const auto& [stream_name, stream] : streams) {
    if (stream_name == name) return &stream;
  }
  return nullptr;
}

void Replication::AddStream(std::string name, ReplicationStream stream) {
  if (FindStream(name)) {
    throw ferry::util::ConfigurationError("duplicate stream name: " + name);
  }
  streams.emplace_back(std::move(name), std::move(stream));
}

void Replication::AddStreams(std::vector<NamedStream> more) {
  std::set<std::string> seen;
  for (const auto& [name, stream] : more) {
    if (FindStream(name) || !seen.insert(name).second) {
      throw ferry::util::ConfigurationError("duplicate stream name: " + name);
    }
  }
  for (auto& entry : more) {
    streams.push_back(std::move(entry));
  }
}

void Replication::EnableStreams(const std::vector<std::string>& names) {
  for (const auto& name : names) {
    if (auto* stream = FindStream(name)) stream->Enable();
  }
}

void Replication::DisableStreams(const std::vector<std::string>& names) {
  for (const auto& name : names) {
    if (auto* stream = FindStream(name)) stream->Disable();
  }
}

void Replication::SetDefaultMode(Mode mode) {
  defaults.mode = mode;
}

std::vector<NamedStream> Replication::ResolveStreams() const {
  std::vector<NamedStream> resolved;
  resolved.reserve(streams.size());
  for (const auto& [name, stream] : streams) {
    auto effective = Overlay(defaults, stream);
    if (effective.IsDisabled()) continue;
    resolved.emplace_back(name, std::move(effective));
  }
  return resolved;
}

void Replication::Validate() const {
  if (!file_path.empty()) return;

  if (source.empty()) {
    throw ferry::util::ConfigurationError("replication requires a source connection");
  }
  if (target.empty()) {
    throw ferry::util::ConfigurationError("replication requires a target connection");
  }
  if (streams.empty()) {
    throw ferry::util::ConfigurationError("replication has no streams");
  }
  std::set<std::string> seen;
  for (const auto& [name, stream] : streams) {
    if (name.empty()) {
      throw ferry::util::ConfigurationError("replication stream name must not be empty");
    }
    if (!seen.insert(name).second) {
      throw ferry::util::ConfigurationError("duplicate stream name: " + name);
    }
  }
}

} // namespace ferry::model
