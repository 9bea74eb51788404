#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <vector>

#include "internal/model/pipeline.hpp"
#include "internal/model/replication.hpp"
#include "internal/model/run_spec.hpp"
#include "internal/model/step.hpp"

namespace ferry::model {

/*
  Canonical configuration documents.

  A document is a google::protobuf::Value tree with the top-level keys
  source, target, mode, defaults, streams, steps, env. kCanonical keeps
  every field so a document survives FromDocument/ToDocument unchanged.
  kEngine is what gets written to disk for the engine: the top-level env
  is left out, its values travel in the process environment instead.

  All FromDocument functions throw ConfigurationError.
*/
enum class DocumentPurpose {
  kCanonical,
  kEngine,
};

google::protobuf::Value ToDocument(const Replication& replication,
                                   DocumentPurpose purpose = DocumentPurpose::kCanonical);
google::protobuf::Value ToDocument(const ReplicationStream& stream);
google::protobuf::Value ToDocument(const Pipeline& pipeline, DocumentPurpose purpose = DocumentPurpose::kCanonical);
google::protobuf::Value ToDocument(const Step& step);
google::protobuf::Value ToDocument(const HookMap& hooks);
google::protobuf::Value ToDocument(const RunSpec& spec, DocumentPurpose purpose = DocumentPurpose::kCanonical);

/*
  A protobuf Struct keeps no key order, so the declaration order of the
  `streams` mapping is passed separately (ConfigLoader::ParseReplication
  reads it from the document text). Streams not named in `stream_order`
  follow by name.
*/
Replication       ReplicationFromDocument(const google::protobuf::Value& document,
                                          const std::vector<std::string>& stream_order = {});
ReplicationStream StreamFromDocument(const google::protobuf::Value& document);
Pipeline          PipelineFromDocument(const google::protobuf::Value& document);
Step              StepFromDocument(const google::protobuf::Value& document);
HookMap           HookMapFromDocument(const google::protobuf::Value& document);

// Accepts the direct layout and the legacy task layout (options.stdout / options.debug).
AdaptedTask TaskFromDocument(const google::protobuf::Value& document);
RunSpec     RunSpecFromDocument(const google::protobuf::Value& document);

// JSON with the streams mapping in declaration order. This is what the engine reads.
std::string ReplicationToJson(const Replication& replication, DocumentPurpose purpose = DocumentPurpose::kCanonical);

std::string             ToJson(const google::protobuf::Value& document, bool pretty = false);
google::protobuf::Value FromJson(const std::string& json);

bool DocumentsEqual(const google::protobuf::Value& a, const google::protobuf::Value& b);

} // namespace ferry::model
