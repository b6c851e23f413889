#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "dataset.h"
#include "job_queue.h"
#include "runtime.h"
#include "sync.h"

namespace gaprun {

// <root>/private/<principal>/syft_runtimes/<identifier>
std::filesystem::path runtime_dir_for(const std::filesystem::path& root,
                                      const std::string& principal,
                                      const std::string& identifier);

// Trusted side: owns the private data, runs jobs, pushes results down.
// The low side is reached only through sync transfers.
class HighSideClient {
public:
    // Opens an initialized high root
    HighSideClient(std::filesystem::path root, std::string principal, std::string identifier);

    // Throws GaprunError if root exists and force_overwrite is false;
    // with force_overwrite the old root is removed first. A non-empty cmd
    // becomes the interpreter every job runs with
    static HighSideClient initialize(const std::string& principal,
                                     const std::string& identifier,
                                     const std::filesystem::path& root,
                                     bool force_overwrite = false,
                                     const std::vector<std::string>& cmd = {});

    const std::filesystem::path& root() const { return root_; }
    const std::string& principal() const { return principal_; }
    const std::string& identifier() const { return identifier_; }
    std::filesystem::path runtime_dir() const { return queue_.runtime_dir(); }

    JobQueue& queue() { return queue_; }
    const DatasetStore& datasets() const { return datasets_; }

    // Low root must already exist. Initializes the low runtime directory,
    // persists the standing entries and runs a first full sync.
    // Throws ConfigError if a sync config exists and force_overwrite is false
    SyncResult connect_local(const std::filesystem::path& low_root,
                             SyncTransport transport = SyncTransport::RSYNC,
                             bool force_overwrite = false);

    // Remote layout is created by the transfers themselves
    SyncResult connect_ssh(const SshConnection& connection,
                           const std::string& low_root,
                           bool force_overwrite = false);

    bool is_connected() const;
    SyncConfig sync_config() const;

    // Overrides the executor derived from the configured transport
    void set_executor(std::shared_ptr<SyncCommandExecutor> executor) { executor_ = std::move(executor); }
    void set_sync_timeout(std::chrono::seconds timeout) { sync_timeout_ = timeout; }

    // low jobs/ -> high jobs/, existing files kept
    SyncResult sync_pending_jobs();
    // high done/ -> low done/
    SyncResult sync_done_jobs(bool ignore_existing = false);
    // Public folders of every attached dataset
    SyncResult sync_datasets();
    // Every standing entry
    SyncResult sync_all();

    // Publishes one dataset: transfers its public folder, attaches it to the
    // runtime and pushes config.yaml. Throws DatasetNotFoundError
    SyncResult sync_dataset(const std::string& name);

    // One pass over the high queue; returns the number of jobs run
    size_t run_pending_jobs();

    // Jobs run with this runtime whatever their records ask for. Kept in
    // runtime.json next to config.yaml, which only ever replicates down
    void register_runtime(const Runtime& runtime);
    Runtime registered_runtime() const;

    Dataset create_dataset(const std::string& name,
                           const std::filesystem::path& mock_source,
                           const std::filesystem::path& private_source,
                           const std::optional<std::filesystem::path>& readme = std::nullopt,
                           const std::string& summary = "",
                           const std::vector<std::string>& tags = {});

private:
    SyncResult connect(SyncConfig config, bool force_overwrite);
    std::vector<SyncEntry> standing_entries(const SyncConfig& config) const;
    void refresh_entries();

    SyncEntry jobs_entry(const SyncConfig& config) const;
    SyncEntry done_entry(const SyncConfig& config, bool ignore_existing) const;
    SyncEntry dataset_entry(const SyncConfig& config, const std::string& name) const;
    SyncEntry runtime_config_entry(const SyncConfig& config) const;

    SyncResult run_entries(const SyncConfig& config, const std::vector<SyncEntry>& entries) const;

    std::filesystem::path root_;
    std::string principal_;
    std::string identifier_;
    JobQueue queue_;
    DatasetStore datasets_;
    std::shared_ptr<SyncCommandExecutor> executor_;
    std::chrono::seconds sync_timeout_{DEFAULT_SYNC_TIMEOUT_SECONDS};
};

// Untrusted side: submits jobs and reads replicated results. Never sees
// private data.
class LowSideClient {
public:
    LowSideClient(std::filesystem::path root, std::string principal, std::string identifier);

    const std::filesystem::path& root() const { return root_; }
    JobQueue& queue() { return queue_; }

    // Snapshots code_dir into the queue. Throws DatasetNotFoundError unless
    // the dataset has been published to this side
    std::string submit_job(const std::string& dataset_name,
                           const std::filesystem::path& code_dir,
                           const std::vector<std::string>& args,
                           const Runtime& runtime,
                           int timeout_seconds = DEFAULT_JOB_TIMEOUT_SECONDS,
                           const std::map<std::string, std::string>& extra_env = {},
                           const std::string& name = "");

    JobStatus job_status(const std::string& job_id);
    Job get_job(const std::string& job_id);
    JobResults job_results(const std::string& job_id);
    std::vector<Dataset> list_datasets() const;

    // Always throws PermissionError here
    std::filesystem::path private_dataset_path(const std::string& name) const;

    // Drops pending copies whose results have arrived
    size_t refresh();

private:
    std::filesystem::path root_;
    std::string principal_;
    JobQueue queue_;
    DatasetStore datasets_;
};

} // namespace gaprun
