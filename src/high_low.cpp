#include "high_low.h"
#include "errors.h"
#include "file_utils.h"
#include <iostream>

namespace gaprun {

namespace fs = std::filesystem;

fs::path runtime_dir_for(const fs::path& root, const std::string& principal, const std::string& identifier) {
    return root / "private" / principal / RUNTIMES_DIR_NAME / identifier;
}

namespace {

std::string join(const fs::path& base, const fs::path& rest) {
    return (base / rest).string();
}

// Relative location of the runtime directory inside either root
fs::path runtime_rel(const std::string& principal, const std::string& identifier) {
    return fs::path("private") / principal / RUNTIMES_DIR_NAME / identifier;
}

// runtime.json first, then the interpreter command of config.yaml
Runtime load_registered_runtime(const fs::path& runtime_dir) {
    fs::path profile = runtime_dir / RUNTIME_PROFILE_FILE;
    if (fs::exists(profile)) {
        return Runtime::from_json(FileUtils::read_json_file(profile));
    }

    RuntimeDirConfig config = RuntimeDirConfig::load(runtime_dir / RUNTIME_CONFIG_FILE);
    if (config.cmd.empty()) {
        throw ConfigError("no runtime registered in " + runtime_dir.string());
    }
    InterpreterConfig interp;
    interp.cmd = config.cmd;
    return Runtime::create(interp);
}

} // namespace

// ============================================================================
// HighSideClient
// ============================================================================

HighSideClient::HighSideClient(fs::path root, std::string principal, std::string identifier)
    : root_(std::move(root)),
      principal_(std::move(principal)),
      identifier_(std::move(identifier)),
      queue_(runtime_dir_for(root_, principal_, identifier_)),
      datasets_(root_, principal_) {
    if (principal_.empty() || identifier_.empty()) {
        throw ValidationError("high side needs a principal and an identifier");
    }

    // The store is copied in so the resolver does not outlive this client
    queue_.set_data_dir_resolver([store = datasets_, runtime_dir = queue_.runtime_dir()](const Job& job) {
        RuntimeDirConfig config = RuntimeDirConfig::load(runtime_dir / RUNTIME_CONFIG_FILE);
        if (!config.has_dataset(job.dataset_name)) {
            throw DatasetNotFoundError(job.dataset_name);
        }
        return store.private_dir(job.dataset_name);
    });

    // Job records come from the low side; only the code snapshot is theirs
    queue_.set_replicated_records(true);
    queue_.set_runtime_resolver([runtime_dir = queue_.runtime_dir()](const Job&) {
        return load_registered_runtime(runtime_dir);
    });
}

HighSideClient HighSideClient::initialize(const std::string& principal,
                                          const std::string& identifier,
                                          const fs::path& root,
                                          bool force_overwrite,
                                          const std::vector<std::string>& cmd) {
    if (fs::exists(root)) {
        if (!force_overwrite) {
            throw GaprunError("Directory " + root.string() +
                              " already exists. Use force_overwrite=true to reinitialize");
        }
        std::cout << "[HighSide] Removing existing root " << root << std::endl;
        fs::remove_all(root);
    }

    fs::create_directories(root / "public");
    HighSideClient client(fs::absolute(root), principal, identifier);
    client.queue_.init(identifier, cmd);
    fs::create_directories(client.datasets_.public_datasets_dir());
    fs::create_directories(client.datasets_.private_datasets_dir(principal));

    std::cout << "[HighSide] Initialized " << identifier << " for " << principal
              << " at " << client.root_ << std::endl;
    return client;
}

SyncResult HighSideClient::connect_local(const fs::path& low_root, SyncTransport transport, bool force_overwrite) {
    if (!fs::is_directory(low_root)) {
        throw ConfigError("low side root " + low_root.string() + " does not exist");
    }

    fs::path low = fs::absolute(low_root);
    JobQueue(runtime_dir_for(low, principal_, identifier_)).init(identifier_);

    SyncConfig config;
    config.high_side_name = identifier_;
    config.high_root = root_.string();
    config.low_root = low.string();
    config.transport = transport;
    return connect(std::move(config), force_overwrite);
}

SyncResult HighSideClient::connect_ssh(const SshConnection& connection,
                                       const std::string& low_root,
                                       bool force_overwrite) {
    if (connection.user.empty()) {
        throw ConfigError("ssh user is required");
    }

    SyncConfig config;
    config.high_side_name = identifier_;
    config.high_root = root_.string();
    config.low_root = low_root;
    config.connection = connection;
    config.transport = SyncTransport::RSYNC;
    return connect(std::move(config), force_overwrite);
}

SyncResult HighSideClient::connect(SyncConfig config, bool force_overwrite) {
    fs::path path = SyncConfig::path_for(root_);
    if (fs::exists(path) && !force_overwrite) {
        throw ConfigError("Sync config already exists at " + path.string() +
                          ". Use force_overwrite=true to replace");
    }

    config.entries = standing_entries(config);
    config.save();
    std::cout << "[HighSide] Connected to low side at "
              << (config.connection ? config.connection->host + ":" : std::string()) << config.low_root
              << std::endl;

    return run_entries(config, config.entries);
}

bool HighSideClient::is_connected() const {
    return fs::exists(SyncConfig::path_for(root_));
}

SyncConfig HighSideClient::sync_config() const {
    return SyncConfig::load(root_);
}

SyncEntry HighSideClient::jobs_entry(const SyncConfig& config) const {
    fs::path rel = runtime_rel(principal_, identifier_) / "jobs";
    SyncEntry entry;
    entry.local_dir = join(config.high_root, rel);
    entry.remote_dir = join(config.low_root, rel);
    entry.direction = SyncDirection::REMOTE_TO_LOCAL;
    entry.ignore_existing = true;
    return entry;
}

SyncEntry HighSideClient::done_entry(const SyncConfig& config, bool ignore_existing) const {
    fs::path rel = runtime_rel(principal_, identifier_) / "done";
    SyncEntry entry;
    entry.local_dir = join(config.high_root, rel);
    entry.remote_dir = join(config.low_root, rel);
    entry.direction = SyncDirection::LOCAL_TO_REMOTE;
    entry.ignore_existing = ignore_existing;
    return entry;
}

SyncEntry HighSideClient::dataset_entry(const SyncConfig& config, const std::string& name) const {
    fs::path rel = fs::path("public") / DATASETS_DIR_NAME / name;
    SyncEntry entry;
    entry.local_dir = join(config.high_root, rel);
    entry.remote_dir = join(config.low_root, rel);
    entry.direction = SyncDirection::LOCAL_TO_REMOTE;
    entry.ignore_existing = true;
    return entry;
}

SyncEntry HighSideClient::runtime_config_entry(const SyncConfig& config) const {
    fs::path rel = runtime_rel(principal_, identifier_) / RUNTIME_CONFIG_FILE;
    SyncEntry entry;
    entry.local_dir = join(config.high_root, rel);
    entry.remote_dir = join(config.low_root, rel);
    entry.direction = SyncDirection::LOCAL_TO_REMOTE;
    entry.ignore_existing = false;
    return entry;
}

std::vector<SyncEntry> HighSideClient::standing_entries(const SyncConfig& config) const {
    std::vector<SyncEntry> entries;
    entries.push_back(jobs_entry(config));
    entries.push_back(done_entry(config, false));
    for (const auto& name : queue_.config().datasets) {
        entries.push_back(dataset_entry(config, name));
    }
    return entries;
}

void HighSideClient::refresh_entries() {
    SyncConfig config = sync_config();
    config.entries = standing_entries(config);
    config.save();
}

SyncResult HighSideClient::run_entries(const SyncConfig& config, const std::vector<SyncEntry>& entries) const {
    std::shared_ptr<SyncCommandExecutor> executor = executor_;
    if (!executor) {
        executor = make_executor(config.transport);
    }

    std::vector<SyncCommand> commands;
    commands.reserve(entries.size());
    for (const auto& entry : entries) {
        commands.push_back(build_sync_command(entry, config.connection));
    }
    return SyncEngine(executor, sync_timeout_).execute(commands);
}

SyncResult HighSideClient::sync_pending_jobs() {
    SyncConfig config = sync_config();
    return run_entries(config, {jobs_entry(config)});
}

SyncResult HighSideClient::sync_done_jobs(bool ignore_existing) {
    SyncConfig config = sync_config();
    return run_entries(config, {done_entry(config, ignore_existing)});
}

SyncResult HighSideClient::sync_datasets() {
    SyncConfig config = sync_config();
    std::vector<SyncEntry> entries;
    for (const auto& name : queue_.config().datasets) {
        entries.push_back(dataset_entry(config, name));
    }
    return run_entries(config, entries);
}

SyncResult HighSideClient::sync_all() {
    refresh_entries();
    SyncConfig config = sync_config();
    return run_entries(config, config.entries);
}

SyncResult HighSideClient::sync_dataset(const std::string& name) {
    if (!datasets_.exists(name) || !fs::exists(datasets_.public_dataset_dir(name) / "mock")) {
        throw DatasetNotFoundError(name);
    }

    SyncConfig config = sync_config();
    SyncResult result = run_entries(config, {dataset_entry(config, name)});
    if (!result.success()) {
        std::cerr << "[HighSide] Dataset '" << name << "' not published" << std::endl;
        return result;
    }

    if (queue_.attach_dataset(name)) {
        refresh_entries();
    }
    result.merge(run_entries(config, {runtime_config_entry(config)}));

    std::cout << "[HighSide] Published dataset '" << name << "'" << std::endl;
    return result;
}

size_t HighSideClient::run_pending_jobs() {
    return queue_.process_once();
}

void HighSideClient::register_runtime(const Runtime& runtime) {
    FileUtils::write_json_file(runtime_dir() / RUNTIME_PROFILE_FILE, runtime.to_json());

    RuntimeDirConfig config = queue_.config();
    config.runtime_name = runtime.name();
    config.cmd = runtime.cmd();
    config.save(queue_.config_path());
    std::cout << "[HighSide] Registered runtime " << runtime.name() << std::endl;
}

Runtime HighSideClient::registered_runtime() const {
    return load_registered_runtime(runtime_dir());
}

Dataset HighSideClient::create_dataset(const std::string& name,
                                       const fs::path& mock_source,
                                       const fs::path& private_source,
                                       const std::optional<fs::path>& readme,
                                       const std::string& summary,
                                       const std::vector<std::string>& tags) {
    return datasets_.create(name, mock_source, private_source, readme, summary, tags);
}

// ============================================================================
// LowSideClient
// ============================================================================

LowSideClient::LowSideClient(fs::path root, std::string principal, std::string identifier)
    : root_(std::move(root)),
      principal_(std::move(principal)),
      queue_(runtime_dir_for(root_, principal_, identifier)),
      datasets_(root_, principal_) {}

std::string LowSideClient::submit_job(const std::string& dataset_name,
                                      const fs::path& code_dir,
                                      const std::vector<std::string>& args,
                                      const Runtime& runtime,
                                      int timeout_seconds,
                                      const std::map<std::string, std::string>& extra_env,
                                      const std::string& name) {
    if (!queue_.config().has_dataset(dataset_name) || !datasets_.exists(dataset_name)) {
        throw DatasetNotFoundError(dataset_name);
    }

    JobRecord record;
    record.job.name = name;
    record.job.dataset_name = dataset_name;
    record.job.args = args;
    record.job.timeout_seconds = timeout_seconds;
    record.job.extra_env = extra_env;
    record.runtime = runtime;
    return queue_.submit(std::move(record), code_dir);
}

JobStatus LowSideClient::job_status(const std::string& job_id) {
    refresh();
    return queue_.status(job_id);
}

Job LowSideClient::get_job(const std::string& job_id) {
    refresh();
    return queue_.get_job(job_id);
}

JobResults LowSideClient::job_results(const std::string& job_id) {
    refresh();
    return queue_.results(job_id);
}

std::vector<Dataset> LowSideClient::list_datasets() const {
    return datasets_.list();
}

fs::path LowSideClient::private_dataset_path(const std::string& name) const {
    datasets_.get(name);
    throw PermissionError("private data of dataset '" + name + "' never leaves the high side");
}

size_t LowSideClient::refresh() {
    return queue_.prune_finished();
}

} // namespace gaprun
