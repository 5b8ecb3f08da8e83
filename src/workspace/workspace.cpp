#include "workspace/workspace.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "job/job_error.hpp"
#include "utils/common.hpp"

namespace proverd::workspace {
namespace {

constexpr int kCreateAttempts = 16;
constexpr std::size_t kSuffixLength = 16;

[[noreturn]] void ThrowResource(const std::string& what, int err) {
    throw job::JobError(job::JobErrorKind::kResource, what + ": " + std::strerror(err));
}

}  // namespace

Workspace::Workspace(std::filesystem::path path, utils::Logger& logger)
    : path_(std::move(path))
    , logger_(logger) {}

Workspace::~Workspace() {
    Destroy();
}

void Workspace::Destroy() noexcept {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        logger_.Error("Failed to clean up workspace",
                      {{"workspace", Name()}, {"error", ec.message()}});
        return;
    }
    logger_.Info("Cleaned up workspace", {{"workspace", Name()}});
}

WorkspaceManager::WorkspaceManager(config::WorkspaceConfig config, utils::Logger& logger)
    : config_(std::move(config))
    , logger_(logger) {}

std::unique_ptr<Workspace> WorkspaceManager::Create() const {
    std::error_code ec;
    const auto root = std::filesystem::absolute(config_.root, ec);
    if (ec) {
        throw job::JobError(job::JobErrorKind::kResource,
                            "cannot resolve workspace root " + config_.root + ": " + ec.message());
    }

    // mkdir fails with EEXIST on a name clash, which is what makes the random
    // suffix safe against concurrent creators.
    for (int attempt = 0; attempt < kCreateAttempts; ++attempt) {
        const auto path = root / (config_.prefix + utils::RandomHex(kSuffixLength));
        if (::mkdir(path.c_str(), S_IRWXU) == 0) {
            logger_.Info("Created workspace", {{"workspace", path.filename().string()}});
            return std::make_unique<Workspace>(path, logger_);
        }
        if (errno != EEXIST) {
            ThrowResource("cannot create workspace in " + root.string(), errno);
        }
    }
    throw job::JobError(job::JobErrorKind::kResource,
                        "cannot create workspace in " + root.string() + ": name collisions");
}

void WorkspaceManager::WriteInput(const Workspace& workspace,
                                  const std::string& name,
                                  const std::string& bytes) const {
    if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
        throw job::JobError(job::JobErrorKind::kResource, "invalid input file name: " + name);
    }
    const auto path = workspace.Path() / name;
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR);
    if (fd < 0) {
        ThrowResource("cannot create " + path.string(), errno);
    }

    std::size_t written = 0;
    while (written < bytes.size()) {
        const auto n = ::write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            ::close(fd);
            ThrowResource("cannot write " + path.string(), err);
        }
        written += static_cast<std::size_t>(n);
    }
    if (::close(fd) != 0) {
        ThrowResource("cannot close " + path.string(), errno);
    }
}

}  // namespace proverd::workspace
