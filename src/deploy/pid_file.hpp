#pragma once

#include <filesystem>
#include <string>
#include <sys/types.h>
#include "core/errors/agent_errors.hpp"
#include "deploy/deployment_record.hpp"

namespace agentrt::deploy {

// Bookkeeping files of detached deployments under one directory:
//   <deploy_id>.pid   the child pid, one line
//   <deploy_id>.json  the DeploymentRecord
//   <deploy_id>.log   stdout/stderr of the child
class PidFileStore {
public:
    explicit PidFileStore(std::filesystem::path pid_dir);

    core::errors::Result<std::filesystem::path> pid_path(const std::string& deploy_id) const;
    core::errors::Result<std::filesystem::path> log_path(const std::string& deploy_id) const;

    core::errors::Result<std::filesystem::path> write(const DeploymentRecord& record) const;
    core::errors::Result<pid_t> read(const std::string& deploy_id) const;
    core::errors::Result<DeploymentRecord> read_record(const std::string& deploy_id) const;

    // false when there was nothing to remove.
    core::errors::Result<bool> remove(const std::string& deploy_id) const;

    const std::filesystem::path& directory() const { return pid_dir_; }

private:
    core::errors::Result<std::filesystem::path> file_path(const std::string& deploy_id,
                                                          const std::string& extension) const;

    std::filesystem::path pid_dir_;
};

}  // namespace agentrt::deploy
