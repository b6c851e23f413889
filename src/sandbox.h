#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "job_config.h"
#include "job_model.h"
#include "mount_provider.h"
#include "output_handler.h"
#include "process.h"

namespace gaprun {

// Receives the in-progress update right before the job process starts
using StatusCallback = std::function<void(const JobUpdate&)>;

struct RunnerHooks {
    std::vector<std::shared_ptr<JobOutputHandler>> handlers;
    StatusCallback on_status;
};

// Outcome of JobRunner::run. Blocking mode fills exit_code/error_message;
// non-blocking mode only sets `process`, and the caller owns its completion.
struct RunResult {
    int exit_code = -1;
    std::optional<std::string> error_message;   // captured stderr when non-empty
    bool timed_out = false;
    std::unique_ptr<ChildProcess> process;
};

// One implementation per RuntimeKind
class JobRunner {
public:
    virtual ~JobRunner() = default;

    // Throws PathNotFoundError before anything is spawned, and
    // SandboxUnavailableError / BuildFailureError from the container path
    virtual RunResult run(const JobConfig& config) = 0;
};

// Runs the job as a local child process under rlimits and a seccomp filter
class InterpreterRunner : public JobRunner {
public:
    explicit InterpreterRunner(RunnerHooks hooks = {});
    RunResult run(const JobConfig& config) override;

    static std::vector<std::string> build_command(const JobConfig& config);

private:
    RunnerHooks hooks_;
};

// Runs the job in a hardened, network-less container
class ContainerRunner : public JobRunner {
public:
    explicit ContainerRunner(RunnerHooks hooks = {},
                             std::shared_ptr<MountProviderRegistry> mounts = nullptr,
                             std::string engine = "docker");
    RunResult run(const JobConfig& config) override;

    // Explicit image_name, or the runtime's name
    static std::string image_name(const JobConfig& config);

    // "gaprun-<job folder name>", so a timed-out container can be killed by name
    static std::string container_name(const JobConfig& config);

    // Full `<engine> run ...` argv
    static std::vector<std::string> build_command(const JobConfig& config,
                                                  const std::vector<ContainerMount>& provider_mounts,
                                                  const std::string& engine = "docker");

private:
    void check_engine() const;
    void ensure_image(const JobConfig& config) const;
    std::vector<ContainerMount> provider_mounts(const JobConfig& config) const;

    RunnerHooks hooks_;
    std::shared_ptr<MountProviderRegistry> mounts_;
    std::string engine_;
};

// Placeholder backend; validates and then reports the cluster as unavailable
class ClusterRunner : public JobRunner {
public:
    explicit ClusterRunner(RunnerHooks hooks = {});
    RunResult run(const JobConfig& config) override;

private:
    RunnerHooks hooks_;
};

// Factory keyed on the runtime kind
std::unique_ptr<JobRunner> make_runner(RuntimeKind kind,
                                       RunnerHooks hooks = {},
                                       std::shared_ptr<MountProviderRegistry> mounts = nullptr);

// Shared by every backend

// Code and data directories must exist; throws PathNotFoundError
void validate_paths(const JobConfig& config);

// Creates logs/ and output/, output/ world-writable
void prepare_job_folders(const JobConfig& config);

// Notifies hooks, spawns, and either streams to completion or hands back the process.
// on_timeout runs after the process group was killed for exceeding the timeout
RunResult launch_job(const ProcessOptions& options, const JobConfig& config,
                     const RunnerHooks& hooks,
                     const std::function<void()>& on_timeout = {});

} // namespace gaprun
