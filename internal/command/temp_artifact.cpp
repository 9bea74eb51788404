#include "temp_artifact.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace ferry::command {

namespace {

std::string ErrnoText(int error) {
  return std::strerror(error);
}

} // namespace

std::unique_ptr<TempArtifact> TempArtifact::Create(const std::filesystem::path& dir, const std::string& kind,
                                                   const std::string& content) {
  const auto path = dir / ("ferry-" + kind + "-" + ferry::util::ToString(ferry::util::GenerateUUID()) + ".json");

  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
  if (fd < 0) {
    throw ferry::util::ResourceError("cannot create " + path.string() + ": " + ErrnoText(errno));
  }

  // From here on the destructor owns the file.
  std::unique_ptr<TempArtifact> artifact(new TempArtifact(path));

  const char* data      = content.data();
  std::size_t remaining = content.size();
  while (remaining > 0) {
    const ssize_t written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR) continue;
      const int error = errno;
      ::close(fd);
      throw ferry::util::ResourceError("cannot write " + path.string() + ": " + ErrnoText(error));
    }
    data += written;
    remaining -= static_cast<std::size_t>(written);
  }

  if (::close(fd) != 0) {
    throw ferry::util::ResourceError("cannot close " + path.string() + ": " + ErrnoText(errno));
  }

  FERRY_LOG_DEBUG("temp artifact created", {ferry::observability::StringField("path", path.string())});
  return artifact;
}

TempArtifact::TempArtifact(std::filesystem::path path) : path_(std::move(path)) {
}

TempArtifact::~TempArtifact() {
  try {
    Remove();
  } catch (const ferry::util::ResourceError& e) {
    FERRY_LOG_WARN("temp artifact not removed", {ferry::observability::StringField("error", e.what())});
  }
}

void TempArtifact::Remove() {
  if (removed_) return;

  std::error_code ec;
  std::filesystem::remove(path_, ec);
  std::error_code exists_ec;
  if (ec && std::filesystem::exists(path_, exists_ec)) {
    throw ferry::util::ResourceError("cannot remove " + path_.string() + ": " + ec.message());
  }
  removed_ = true;
}

} // namespace ferry::command
