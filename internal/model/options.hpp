#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>

namespace ferry::model {

/*
  Connector options are an opaque key/value blob. The engine owns their
  semantics; the bridge only reads the handful of keys it negotiates
  (e.g. "format") and passes everything else through untouched.
*/
using Options = google::protobuf::Struct;

std::optional<std::string> GetString(const Options& options, const std::string& key);

void SetString(Options* options, const std::string& key, const std::string& value);

bool Has(const Options& options, const std::string& key);

// Key-wise overlay; keys present in `overlay` win.
Options Merge(const Options& base, const Options& overlay);

// Compact JSON rendering, used for --src-options / --tgt-options.
std::string ToJson(const Options& options);

} // namespace ferry::model
