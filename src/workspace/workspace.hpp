#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "utils/logging.hpp"

namespace proverd::workspace {

// Request-private directory. Removed exactly once: by Destroy() or, failing
// that, by the destructor. Removal errors are logged and never thrown.
class Workspace {
public:
    Workspace(std::filesystem::path path, utils::Logger& logger);
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    std::string Name() const { return path_.filename().string(); }
    bool Destroyed() const { return destroyed_; }

    void Destroy() noexcept;

private:
    std::filesystem::path path_;
    utils::Logger& logger_;
    bool destroyed_ = false;
};

class WorkspaceManager {
public:
    WorkspaceManager(config::WorkspaceConfig config, utils::Logger& logger);

    // Creates `<root>/<prefix><random>` with mode 0700. Throws JobError
    // (kResource) when the directory cannot be created.
    std::unique_ptr<Workspace> Create() const;

    // Creates `name` inside the workspace with mode 0400 and writes `bytes`.
    // Throws JobError (kResource) on any failure.
    void WriteInput(const Workspace& workspace,
                    const std::string& name,
                    const std::string& bytes) const;

private:
    config::WorkspaceConfig config_;
    utils::Logger& logger_;
};

}  // namespace proverd::workspace
