#include "job_queue.h"
#include "errors.h"
#include "file_utils.h"
#include "sandbox.h"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <yaml-cpp/yaml.h>

namespace gaprun {

namespace fs = std::filesystem;

namespace {

constexpr const char* RECORD_SUFFIX = ".json";

// Sorted for stable scans; callers must not rely on submission order
std::vector<fs::path> list_records(const fs::path& dir) {
    std::vector<fs::path> records;
    if (!fs::is_directory(dir)) {
        return records;
    }
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == RECORD_SUFFIX) {
            records.push_back(entry.path());
        }
    }
    std::sort(records.begin(), records.end());
    return records;
}

void emit_string_seq(YAML::Emitter& out, const std::vector<std::string>& values) {
    out << YAML::BeginSeq;
    for (const auto& v : values) {
        out << v;
    }
    out << YAML::EndSeq;
}

} // namespace

// ============================================================================
// RuntimeDirConfig
// ============================================================================

bool RuntimeDirConfig::has_dataset(const std::string& name) const {
    return std::find(datasets.begin(), datasets.end(), name) != datasets.end();
}

RuntimeDirConfig RuntimeDirConfig::load(const fs::path& path) {
    RuntimeDirConfig config;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root["datasets"] && root["datasets"].IsSequence()) {
            config.datasets = root["datasets"].as<std::vector<std::string>>();
        }
        if (root["runtime_name"] && !root["runtime_name"].IsNull()) {
            config.runtime_name = root["runtime_name"].as<std::string>();
        }
        if (root["cmd"] && root["cmd"].IsSequence()) {
            config.cmd = root["cmd"].as<std::vector<std::string>>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot read " + path.string() + ": " + e.what());
    }
    return config;
}

void RuntimeDirConfig::save(const fs::path& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "datasets" << YAML::Value;
    emit_string_seq(out, datasets);
    out << YAML::Key << "runtime_name" << YAML::Value << runtime_name;
    out << YAML::Key << "cmd" << YAML::Value;
    emit_string_seq(out, cmd);
    out << YAML::EndMap;

    if (!out.good()) {
        throw ConfigError(std::string("cannot serialise runtime config: ") + out.GetLastError());
    }
    FileUtils::write_text_file(path, std::string(out.c_str()) + "\n");
}

// ============================================================================
// JobRecord
// ============================================================================

Json::Value job_record_to_json(const JobRecord& record) {
    Json::Value json;
    json["job"] = job_to_json(record.job);
    json["runtime"] = record.runtime.to_json();
    json["data_dir"] = record.data_dir;
    return json;
}

JobRecord job_record_from_json(const Json::Value& json) {
    if (!json.isObject() || !json.isMember("job") || !json.isMember("runtime")) {
        throw ValidationError("job record needs 'job' and 'runtime'");
    }
    JobRecord record;
    record.job = job_from_json(json["job"]);
    record.runtime = Runtime::from_json(json["runtime"]);
    record.data_dir = json.get("data_dir", "").asString();
    return record;
}

// ============================================================================
// JobQueue
// ============================================================================

JobQueue::JobQueue(fs::path runtime_dir) : runtime_dir_(std::move(runtime_dir)) {
    handler_factory_ = []() {
        return std::vector<std::shared_ptr<JobOutputHandler>>{std::make_shared<FileOutputHandler>()};
    };
}

void JobQueue::init(const std::string& runtime_name, const std::vector<std::string>& cmd) {
    fs::create_directories(jobs_dir());
    fs::create_directories(running_dir());
    fs::create_directories(done_dir());

    if (!fs::exists(config_path())) {
        RuntimeDirConfig config;
        config.runtime_name = runtime_name.empty() ? runtime_dir_.filename().string() : runtime_name;
        config.cmd = cmd;
        config.save(config_path());
        std::cout << "[JobQueue] Initialized runtime directory: " << runtime_dir_ << std::endl;
    }
}

RuntimeDirConfig JobQueue::config() const {
    if (!fs::exists(config_path())) {
        throw ConfigError("runtime config not found at " + config_path().string());
    }
    return RuntimeDirConfig::load(config_path());
}

std::string JobQueue::new_job_id() const {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << "job_" << std::put_time(&utc, "%Y%m%d_%H%M%S") << "_" << FileUtils::random_hex(4);
    return oss.str();
}

JobRecord JobQueue::load_record(const fs::path& path) const {
    return job_record_from_json(FileUtils::read_json_file(path));
}

void JobQueue::write_record(const fs::path& path, const JobRecord& record) const {
    FileUtils::write_json_file(path, job_record_to_json(record));
}

void JobQueue::remove_pending(const std::string& id) const {
    fs::remove(job_file(id));
    fs::remove_all(code_snapshot(id));
}

std::string JobQueue::submit(const JobConfig& config, const std::string& dataset_name) {
    if (config.args.empty()) {
        throw ValidationError("job needs at least an entrypoint argument");
    }
    if (config.timeout <= 0) {
        throw ValidationError("timeout must be positive");
    }
    if (!fs::is_directory(config.function_folder)) {
        throw PathNotFoundError("Function folder " + config.function_folder.string() + " does not exist");
    }
    if (config.data_path.empty() || !fs::exists(config.data_path)) {
        throw PathNotFoundError("Dataset folder " + config.data_path.string() + " does not exist");
    }

    JobRecord record;
    record.job.uid = new_job_id();
    record.job.name = record.job.uid;
    record.job.dataset_name = dataset_name;
    record.job.runtime_name = config.runtime.name();
    record.job.code_dir = fs::absolute(config.function_folder).string();
    record.job.args = config.args;
    record.job.timeout_seconds = config.timeout;
    record.job.extra_env = config.extra_env;
    record.job.created_at = current_timestamp();
    record.runtime = config.runtime;
    record.data_dir = fs::absolute(config.data_path).string();
    validate(record.job);

    write_record(job_file(record.job.uid), record);
    std::cout << "[JobQueue] Submitted job " << record.job.uid << std::endl;
    return record.job.uid;
}

std::string JobQueue::submit(JobRecord record, const fs::path& code_source) {
    if (!fs::is_directory(code_source)) {
        throw PathNotFoundError("Function folder " + code_source.string() + " does not exist");
    }
    if (record.job.args.empty()) {
        throw ValidationError("job needs at least an entrypoint argument");
    }

    std::string id = new_job_id();
    record.job.uid = id;
    if (record.job.name.empty()) {
        record.job.name = id;
    }
    record.job.status = JobStatus::PENDING_CODE_REVIEW;
    record.job.error = JobErrorKind::NO_ERROR;
    record.job.error_message.reset();
    record.job.output_location.reset();
    record.job.runtime_name = record.runtime.name();
    record.job.created_at = current_timestamp();
    validate(record.job);

    fs::create_directories(jobs_dir());
    fs::copy(code_source, code_snapshot(id),
             fs::copy_options::recursive | fs::copy_options::overwrite_existing);
    record.job.code_dir = code_snapshot(id).filename().string();

    write_record(job_file(id), record);
    std::cout << "[JobQueue] Submitted job " << id << " on dataset '"
              << record.job.dataset_name << "'" << std::endl;
    return id;
}

Job JobQueue::get_job(const std::string& job_id) const {
    if (fs::exists(job_file(job_id))) {
        return load_record(job_file(job_id)).job;
    }
    if (fs::exists(done_file(job_id))) {
        return load_record(done_file(job_id)).job;
    }
    if (fs::exists(running_marker(job_id))) {
        return job_from_json(FileUtils::read_json_file(running_marker(job_id)));
    }
    throw JobNotFoundError(job_id);
}

JobStatus JobQueue::status(const std::string& job_id) const {
    return get_job(job_id).status;
}

std::vector<Job> JobQueue::list_jobs() const {
    std::vector<Job> jobs;
    for (const auto& dir : {jobs_dir(), done_dir()}) {
        for (const auto& path : list_records(dir)) {
            try {
                jobs.push_back(load_record(path).job);
            } catch (const GaprunError& e) {
                std::cerr << "[JobQueue] Skipping unreadable record " << path << ": "
                          << e.what() << std::endl;
            }
        }
    }
    return jobs;
}

JobResults JobQueue::results(const std::string& job_id) const {
    if (!fs::exists(done_file(job_id))) {
        if (fs::exists(job_file(job_id)) || fs::exists(running_marker(job_id))) {
            throw GaprunError("Job " + job_id + " has not finished yet");
        }
        throw JobNotFoundError(job_id);
    }

    Job job = load_record(done_file(job_id)).job;
    bool finished = job.status == JobStatus::RUN_FINISHED ||
                    (job.status == JobStatus::SHARED && job.error == JobErrorKind::NO_ERROR);
    if (!finished) {
        throw GaprunError("Job " + job_id + " has no results (status " +
                          job_status_to_string(job.status) + ")");
    }
    return JobResults(results_dir(job_id));
}

bool JobQueue::attach_dataset(const std::string& name) {
    RuntimeDirConfig cfg = config();
    if (cfg.has_dataset(name)) {
        return false;
    }
    cfg.datasets.push_back(name);
    cfg.save(config_path());
    std::cout << "[JobQueue] Attached dataset '" << name << "'" << std::endl;
    return true;
}

Job JobQueue::reject(const std::string& job_id, const std::string& reason) {
    if (fs::exists(job_file(job_id))) {
        JobRecord record = load_record(job_file(job_id));
        apply_update(record.job, transition_reject(record.job, reason));
        write_record(done_file(job_id), record);
        remove_pending(job_id);
        std::cout << "[JobQueue] Rejected job " << job_id << ": " << reason << std::endl;
        return record.job;
    }
    if (fs::exists(done_file(job_id))) {
        JobRecord record = load_record(done_file(job_id));
        apply_update(record.job, transition_reject(record.job, reason));
        write_record(done_file(job_id), record);
        std::cout << "[JobQueue] Rejected output of job " << job_id << ": " << reason << std::endl;
        return record.job;
    }
    Job job = get_job(job_id);
    apply_update(job, transition_reject(job, reason));
    return job;
}

Job JobQueue::share(const std::string& job_id) {
    if (!fs::exists(done_file(job_id))) {
        Job job = get_job(job_id);
        apply_update(job, transition_share(job));
        return job;
    }
    JobRecord record = load_record(done_file(job_id));
    apply_update(record.job, transition_share(record.job));
    write_record(done_file(job_id), record);
    std::cout << "[JobQueue] Shared job " << job_id << std::endl;
    return record.job;
}

size_t JobQueue::prune_finished() {
    size_t pruned = 0;
    for (const auto& path : list_records(jobs_dir())) {
        std::string id = path.stem().string();
        if (fs::exists(done_file(id))) {
            remove_pending(id);
            ++pruned;
        }
    }
    if (pruned > 0) {
        std::cout << "[JobQueue] Pruned " << pruned << " finished job(s) from jobs/" << std::endl;
    }
    return pruned;
}

size_t JobQueue::process_once() {
    size_t processed = 0;

    for (const auto& path : list_records(jobs_dir())) {
        std::string id = path.stem().string();
        try {
            if (fs::exists(done_file(id))) {
                // Re-replicated from the other side after it already ran here
                std::cout << "[JobQueue] Job " << id << " already done, dropping stale copy" << std::endl;
                remove_pending(id);
                continue;
            }

            JobRecord record = load_record(path);
            if (record.job.status == JobStatus::IN_PROGRESS) {
                // Runs are blocking, so nothing is in flight between scans
                std::cerr << "[JobQueue] Job " << id << " was interrupted, marking it cancelled" << std::endl;
                apply_update(record.job,
                             transition_cancelled(record.job, "Job was interrupted before it completed"));
                finalize_job(id, record);
                continue;
            }
            if (record.job.status != JobStatus::PENDING_CODE_REVIEW) {
                continue;
            }

            process_job(id, record);
            ++processed;
        } catch (const std::exception& e) {
            std::cerr << "[JobQueue] Failed to process job " << id << ": " << e.what() << std::endl;
        }
    }

    return processed;
}

void JobQueue::process_queue(const std::atomic<bool>& stop, std::chrono::milliseconds interval) {
    std::cout << "[JobQueue] Watching " << jobs_dir() << std::endl;
    while (!stop.load()) {
        process_once();

        auto until = std::chrono::steady_clock::now() + interval;
        while (!stop.load() && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
        }
    }
    std::cout << "[JobQueue] Stopped" << std::endl;
}

void JobQueue::accept_replicated(const std::string& id, JobRecord& record) const {
    Job& job = record.job;
    if (job.uid != id) {
        std::string claimed = job.uid;
        job.uid = id;
        throw ValidationError("record " + id + " claims job id '" + claimed + "'");
    }
    if (job.code_dir != code_snapshot(id).filename().string()) {
        throw ValidationError("job " + id + " must run from jobs/" + code_snapshot(id).filename().string() +
                              ", not '" + job.code_dir + "'");
    }
    if (job.args.empty()) {
        throw ValidationError("job needs at least an entrypoint argument");
    }
    fs::path entrypoint(job.args[0]);
    bool escapes = entrypoint.is_absolute();
    for (const auto& part : entrypoint) {
        escapes = escapes || part == "..";
    }
    if (escapes) {
        throw ValidationError("entrypoint '" + job.args[0] + "' is outside the code snapshot");
    }

    record.data_dir.clear();
    if (!runtime_resolver_) {
        throw ConfigError("no runtime registered in " + runtime_dir_.string());
    }
    record.runtime = runtime_resolver_(job);
    job.runtime_name = record.runtime.name();
}

JobConfig JobQueue::build_job_config(const std::string& id, const JobRecord& record) const {
    JobConfig config;
    fs::path code_dir(record.job.code_dir);
    config.function_folder = code_dir.is_absolute() ? code_dir : jobs_dir() / code_dir;
    config.args = record.job.args;

    if (!replicated_records_ && !record.data_dir.empty()) {
        config.data_path = record.data_dir;
    } else if (resolver_) {
        config.data_path = resolver_(record.job);
    } else {
        throw ConfigError("no data directory for dataset '" + record.job.dataset_name + "'");
    }

    config.runtime = record.runtime;
    config.job_folder = running_dir() / id;
    config.timeout = record.job.timeout_seconds;
    config.extra_env = record.job.extra_env;
    config.blocking = true;
    return config;
}

void JobQueue::process_job(const std::string& id, JobRecord& record) {
    Job& job = record.job;
    std::cout << "[JobQueue] Processing job " << id << std::endl;

    try {
        if (replicated_records_) {
            accept_replicated(id, record);
        }
        std::cout << "[JobQueue] Job " << id << " runs with runtime " << record.runtime.name() << std::endl;
        JobConfig config = build_job_config(id, record);

        RunnerHooks hooks;
        hooks.handlers = handler_factory_ ? handler_factory_()
                                          : std::vector<std::shared_ptr<JobOutputHandler>>{};
        hooks.on_status = [this, &record, &id](const JobUpdate& update) {
            apply_update(record.job, update);
            write_record(job_file(id), record);
            FileUtils::write_json_file(running_marker(id), job_to_json(record.job));
        };

        auto runner = make_runner(record.runtime.kind(), std::move(hooks), mounts_);
        RunResult result = runner->run(config);

        JobUpdate update = result.timed_out
            ? transition_timeout(job, config.timeout)
            : transition_from_exit_code(job, result.exit_code, result.error_message.value_or(""));
        apply_update(job, update);
    } catch (const std::exception& e) {
        std::cerr << "[JobQueue] Job " << id << " failed: " << e.what() << std::endl;
        JobUpdate update;
        update.uid = job.uid;
        update.status = JobStatus::RUN_FAILED;
        update.error = JobErrorKind::EXECUTION_FAILED;
        update.error_message = e.what();
        apply_update(job, update);
    }

    finalize_job(id, record);
    std::cout << "[JobQueue] Job " << id << " finished: " << job_status_to_string(job.status)
              << " (" << job_error_to_string(job.error) << ")" << std::endl;
}

void JobQueue::finalize_job(const std::string& id, JobRecord& record) {
    fs::path target = results_dir(id);
    fs::path work = running_dir() / id;

    fs::remove_all(target);
    if (fs::exists(work)) {
        fs::rename(work, target);
    }
    fs::create_directories(target / "logs");
    fs::create_directories(target / "output");

    record.job.output_location = (fs::path("done") / target.filename()).string();
    write_record(done_file(id), record);

    remove_pending(id);
    fs::remove(running_marker(id));
}

} // namespace gaprun
