#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace ferry::command {

/*
  Temporary configuration document handed to the engine.

  Named <dir>/ferry-<kind>-<uuid>.json, created exclusively with mode
  0600 and removed when the owning object goes away. Remove() reports
  a failed deletion; the destructor only logs it.
*/
class TempArtifact {
 public:
  // Throws ResourceError.
  static std::unique_ptr<TempArtifact> Create(const std::filesystem::path& dir, const std::string& kind,
                                              const std::string& content);

  ~TempArtifact();

  TempArtifact(const TempArtifact&)            = delete;
  TempArtifact& operator=(const TempArtifact&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

  bool removed() const {
    return removed_;
  }

  // Idempotent. Throws ResourceError when the file exists but cannot be deleted.
  void Remove();

 private:
  explicit TempArtifact(std::filesystem::path path);

  std::filesystem::path path_;
  bool                  removed_{false};
};

} // namespace ferry::command
