#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "constants.h"
#include "job_config.h"
#include "job_model.h"
#include "job_results.h"
#include "mount_provider.h"
#include "output_handler.h"
#include "runtime.h"

namespace gaprun {

// config.yaml of a runtime directory
struct RuntimeDirConfig {
    std::vector<std::string> datasets;
    std::string runtime_name;
    std::vector<std::string> cmd;

    bool has_dataset(const std::string& name) const;

    // Throws ConfigError
    static RuntimeDirConfig load(const std::filesystem::path& path);
    void save(const std::filesystem::path& path) const;
};

// What jobs/<id>.json and done/<id>.json hold
struct JobRecord {
    Job job;
    Runtime runtime;
    std::string data_dir;       // empty: resolved from job.dataset_name at dispatch
};

Json::Value job_record_to_json(const JobRecord& record);
JobRecord job_record_from_json(const Json::Value& json);

using DataDirResolver = std::function<std::filesystem::path(const Job&)>;
using RuntimeResolver = std::function<Runtime(const Job&)>;
using HandlerFactory = std::function<std::vector<std::shared_ptr<JobOutputHandler>>()>;

// Durable folder-backed queue for one runtime instance on one side:
//
//   <runtime_dir>/config.yaml
//   <runtime_dir>/jobs/<id>.json, jobs/<id>_code/
//   <runtime_dir>/running/<id>_status.json, running/<id>/
//   <runtime_dir>/done/<id>.json, done/<id>_results/{logs,output}/
//
// Exactly one writer per directory per side (the processing loop on the
// high side, the submitter on the low side). There is no locking; running
// two writers against the same directory is unsupported.
class JobQueue {
public:
    explicit JobQueue(std::filesystem::path runtime_dir);

    const std::filesystem::path& runtime_dir() const { return runtime_dir_; }
    std::filesystem::path jobs_dir() const { return runtime_dir_ / "jobs"; }
    std::filesystem::path running_dir() const { return runtime_dir_ / "running"; }
    std::filesystem::path done_dir() const { return runtime_dir_ / "done"; }
    std::filesystem::path config_path() const { return runtime_dir_ / RUNTIME_CONFIG_FILE; }

    // Creates jobs/, running/, done/; writes config.yaml only if missing
    void init(const std::string& runtime_name = "",
              const std::vector<std::string>& cmd = {});

    RuntimeDirConfig config() const;

    // Records absolute code and data paths, nothing is copied; job_folder is
    // assigned at dispatch. Throws PathNotFoundError for missing folders
    std::string submit(const JobConfig& config, const std::string& dataset_name = "");

    // Snapshots code_source into jobs/<id>_code so the job replicates as a unit
    std::string submit(JobRecord record, const std::filesystem::path& code_source);

    // Probes jobs/, done/, running/ in that order; throws JobNotFoundError
    JobStatus status(const std::string& job_id) const;
    Job get_job(const std::string& job_id) const;
    std::vector<Job> list_jobs() const;

    // Only for a done/ record that finished successfully
    JobResults results(const std::string& job_id) const;

    // Returns whether the name was newly added
    bool attach_dataset(const std::string& name);

    Job reject(const std::string& job_id, const std::string& reason);
    Job share(const std::string& job_id);

    // Removes jobs/ records whose result already arrived in done/
    size_t prune_finished();

    // One scan of jobs/; returns the number of jobs dispatched. Records left
    // job_in_progress by a dead run are finished as cancelled
    size_t process_once();

    // Scans until `stop` is set
    void process_queue(const std::atomic<bool>& stop,
                       std::chrono::milliseconds interval =
                           std::chrono::milliseconds(QUEUE_SCAN_INTERVAL_MS));

    void set_data_dir_resolver(DataDirResolver resolver) { resolver_ = std::move(resolver); }
    void set_handler_factory(HandlerFactory factory) { handler_factory_ = std::move(factory); }
    void set_mount_registry(std::shared_ptr<MountProviderRegistry> mounts) { mounts_ = std::move(mounts); }
    void set_runtime_resolver(RuntimeResolver resolver) { runtime_resolver_ = std::move(resolver); }

    // Records in jobs/ arrive from the other side of the air gap. Their
    // data_dir and runtime are replaced by the resolvers and their code must
    // be the jobs/<id>_code snapshot
    void set_replicated_records(bool replicated) { replicated_records_ = replicated; }

private:
    std::filesystem::path job_file(const std::string& id) const { return jobs_dir() / (id + ".json"); }
    std::filesystem::path code_snapshot(const std::string& id) const { return jobs_dir() / (id + "_code"); }
    std::filesystem::path done_file(const std::string& id) const { return done_dir() / (id + ".json"); }
    std::filesystem::path results_dir(const std::string& id) const { return done_dir() / (id + "_results"); }
    std::filesystem::path running_marker(const std::string& id) const {
        return running_dir() / (id + "_status.json");
    }

    std::string new_job_id() const;
    JobRecord load_record(const std::filesystem::path& path) const;
    void write_record(const std::filesystem::path& path, const JobRecord& record) const;
    void remove_pending(const std::string& id) const;

    void accept_replicated(const std::string& id, JobRecord& record) const;
    JobConfig build_job_config(const std::string& id, const JobRecord& record) const;
    void process_job(const std::string& id, JobRecord& record);
    void finalize_job(const std::string& id, JobRecord& record);

    std::filesystem::path runtime_dir_;
    DataDirResolver resolver_;
    HandlerFactory handler_factory_;
    std::shared_ptr<MountProviderRegistry> mounts_;
    RuntimeResolver runtime_resolver_;
    bool replicated_records_ = false;
};

} // namespace gaprun
