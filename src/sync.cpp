#include "sync.h"
#include "errors.h"
#include "file_utils.h"
#include "process.h"
#include <iostream>
#include <sstream>

namespace gaprun {

namespace fs = std::filesystem;

namespace {

// rsync's "partial transfer due to error"
constexpr int PARTIAL_TRANSFER_EXIT = 23;

std::string with_trailing_slash(std::string path) {
    if (path.empty() || path.back() != '/') {
        path += '/';
    }
    return path;
}

std::string without_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::string normalize_side(const std::string& path) {
    return FileUtils::has_file_suffix(path) ? without_trailing_slash(path) : with_trailing_slash(path);
}

// rsync splits -e on spaces and honours single or double quotes, not backslashes
std::string quote_for_remote_shell(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t'\"") == std::string::npos) {
        return arg;
    }
    if (arg.find('\'') == std::string::npos) {
        return "'" + arg + "'";
    }
    if (arg.find('"') == std::string::npos) {
        return "\"" + arg + "\"";
    }
    throw ConfigError("ssh key path " + arg + " mixes single and double quotes");
}

std::string quote_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"'") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    for (char c : arg) {
        if (c == '"' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted + "\"";
}

std::string failed_message(int exit_code, const SyncCommand& command, const std::string& detail) {
    std::string message = "Command failed (exit " + std::to_string(exit_code) + "): " + command.to_string();
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

std::string timed_out_message(std::chrono::seconds timeout, const SyncCommand& command) {
    return "Command timed out after " + std::to_string(timeout.count()) + "s: " + command.to_string();
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool is_excluded(const fs::path& relative, const std::vector<std::string>& excludes) {
    std::string name = relative.filename().string();
    std::string rel = relative.generic_string();
    for (const auto& pattern : excludes) {
        if (FileUtils::matches_pattern(name, pattern) || FileUtils::matches_pattern(rel, pattern)) {
            return true;
        }
    }
    return false;
}

class DeadlineExceeded : public std::runtime_error {
public:
    DeadlineExceeded() : std::runtime_error("deadline exceeded") {}
};

void copy_entry(const fs::path& source, const fs::path& target, bool ignore_existing) {
    if (fs::is_symlink(source)) {
        if (!fs::exists(fs::symlink_status(target))) {
            fs::copy_symlink(source, target);
        }
        return;
    }
    if (fs::exists(target) && ignore_existing) {
        return;
    }
    fs::create_directories(target.parent_path());
    fs::copy_file(source, target, fs::copy_options::overwrite_existing);
}

} // namespace

std::string sync_direction_to_string(SyncDirection direction) {
    return direction == SyncDirection::LOCAL_TO_REMOTE ? "local_to_remote" : "remote_to_local";
}

SyncDirection parse_sync_direction(const std::string& value) {
    if (value == "local_to_remote") return SyncDirection::LOCAL_TO_REMOTE;
    if (value == "remote_to_local") return SyncDirection::REMOTE_TO_LOCAL;
    throw ConfigError("unknown sync direction '" + value + "'");
}

std::string sync_transport_to_string(SyncTransport transport) {
    return transport == SyncTransport::RSYNC ? "rsync" : "copy";
}

SyncTransport parse_sync_transport(const std::string& value) {
    if (value == "rsync") return SyncTransport::RSYNC;
    if (value == "copy") return SyncTransport::LOCAL_COPY;
    throw ConfigError("unknown sync transport '" + value + "'");
}

// ============================================================================
// SyncConfig
// ============================================================================

void SyncConfig::validate() const {
    if (high_root.empty() || low_root.empty()) {
        throw ConfigError("sync config needs both a high and a low root");
    }
    if (connection) {
        if (connection->host.empty()) {
            throw ConfigError("ssh connection without a host");
        }
        if (connection->port <= 0 || connection->port > 65535) {
            throw ConfigError("invalid ssh port " + std::to_string(connection->port));
        }
        if (transport == SyncTransport::LOCAL_COPY) {
            throw ConfigError("the copy transport cannot reach " + connection->host);
        }
    }
}

Json::Value SyncConfig::to_json() const {
    Json::Value json;
    json["high_side_name"] = high_side_name;
    json["high_root"] = high_root;
    json["low_root"] = low_root;
    json["transport"] = sync_transport_to_string(transport);

    if (connection) {
        Json::Value conn;
        conn["host"] = connection->host;
        conn["user"] = connection->user;
        conn["port"] = connection->port;
        if (connection->ssh_key_path) {
            conn["ssh_key_path"] = *connection->ssh_key_path;
        }
        json["connection"] = conn;
    } else {
        json["connection"] = Json::nullValue;
    }

    json["entries"] = Json::arrayValue;
    for (const auto& entry : entries) {
        Json::Value e;
        e["local_dir"] = entry.local_dir;
        e["remote_dir"] = entry.remote_dir;
        e["direction"] = sync_direction_to_string(entry.direction);
        e["ignore_existing"] = entry.ignore_existing;
        e["excludes"] = Json::arrayValue;
        for (const auto& pattern : entry.excludes) {
            e["excludes"].append(pattern);
        }
        json["entries"].append(e);
    }
    return json;
}

SyncConfig SyncConfig::from_json(const Json::Value& json) {
    SyncConfig config;
    config.high_side_name = json.get("high_side_name", "").asString();
    config.high_root = json.get("high_root", "").asString();
    config.low_root = json.get("low_root", "").asString();
    config.transport = parse_sync_transport(json.get("transport", "rsync").asString());

    const Json::Value& conn = json["connection"];
    if (conn.isObject()) {
        SshConnection ssh;
        ssh.host = conn.get("host", "").asString();
        ssh.user = conn.get("user", "").asString();
        ssh.port = conn.get("port", DEFAULT_SSH_PORT).asInt();
        if (conn.isMember("ssh_key_path") && !conn["ssh_key_path"].isNull()) {
            ssh.ssh_key_path = conn["ssh_key_path"].asString();
        }
        config.connection = ssh;
    }

    for (const auto& e : json["entries"]) {
        SyncEntry entry;
        entry.local_dir = e.get("local_dir", "").asString();
        entry.remote_dir = e.get("remote_dir", "").asString();
        entry.direction = parse_sync_direction(e.get("direction", "local_to_remote").asString());
        entry.ignore_existing = e.get("ignore_existing", true).asBool();
        for (const auto& pattern : e["excludes"]) {
            entry.excludes.push_back(pattern.asString());
        }
        config.entries.push_back(entry);
    }

    config.validate();
    return config;
}

fs::path SyncConfig::path_for(const fs::path& high_root) {
    return high_root / SYNC_CONFIG_FILE;
}

void SyncConfig::save() const {
    validate();
    FileUtils::write_json_file(path_for(high_root), to_json());
}

SyncConfig SyncConfig::load(const fs::path& high_root) {
    fs::path path = path_for(high_root);
    if (!fs::exists(path)) {
        throw ConfigError("no sync config at " + path.string() + ", connect to a low side first");
    }
    try {
        return from_json(FileUtils::read_json_file(path));
    } catch (const ConfigError&) {
        throw;
    } catch (const GaprunError& e) {
        throw ConfigError(e.what());
    }
}

// ============================================================================
// Command construction
// ============================================================================

std::string SyncCommand::to_string() const {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << quote_arg(argv[i]);
    }
    return oss.str();
}

SyncCommand build_sync_command(const SyncEntry& entry,
                               const std::optional<SshConnection>& connection) {
    std::string local = normalize_side(entry.local_dir);
    std::string remote = normalize_side(entry.remote_dir);
    if (connection) {
        std::string login = connection->user.empty()
            ? connection->host
            : connection->user + "@" + connection->host;
        remote = login + ":" + remote;
    }

    SyncCommand command;
    command.ignore_existing = entry.ignore_existing;
    command.excludes = entry.excludes;
    if (entry.direction == SyncDirection::LOCAL_TO_REMOTE) {
        command.source = local;
        command.destination = remote;
    } else {
        command.source = remote;
        command.destination = local;
    }

    command.argv = {"rsync", "-avh", "--progress", "--mkpath"};
    if (entry.ignore_existing) {
        command.argv.push_back("--ignore-existing");
    }
    for (const auto& pattern : entry.excludes) {
        command.argv.push_back("--exclude=" + pattern);
    }
    if (connection) {
        std::string ssh = "ssh -p " + std::to_string(connection->port);
        if (connection->ssh_key_path) {
            ssh += " -i " + quote_for_remote_shell(*connection->ssh_key_path);
        }
        command.argv.push_back("-e");
        command.argv.push_back(ssh);
    }
    command.argv.push_back(command.source);
    command.argv.push_back(command.destination);
    return command;
}

std::vector<SyncCommand> build_sync_commands(const SyncConfig& config) {
    std::vector<SyncCommand> commands;
    commands.reserve(config.entries.size());
    for (const auto& entry : config.entries) {
        commands.push_back(build_sync_command(entry, config.connection));
    }
    return commands;
}

void SyncResult::merge(const SyncResult& other) {
    commands_executed += other.commands_executed;
    successful_syncs += other.successful_syncs;
    failed_syncs += other.failed_syncs;
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
}

// ============================================================================
// Executors
// ============================================================================

SyncOutcome RsyncExecutor::execute(const SyncCommand& command, std::chrono::seconds timeout) {
    SyncOutcome outcome;
    CommandResult result;
    try {
        result = run_command(command.argv, timeout);
    } catch (const GaprunError& e) {
        outcome.error = failed_message(-1, command, e.what());
        return outcome;
    }

    if (result.timed_out) {
        outcome.error = timed_out_message(timeout, command);
    } else if (result.exit_code != 0) {
        outcome.error = failed_message(result.exit_code, command, trim(result.stderr_output));
    } else {
        outcome.ok = true;
    }
    return outcome;
}

SyncOutcome LocalCopyExecutor::execute(const SyncCommand& command, std::chrono::seconds timeout) {
    SyncOutcome outcome;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto check_deadline = [&deadline]() {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw DeadlineExceeded();
        }
    };

    bool contents_only = !command.source.empty() && command.source.back() == '/';
    fs::path source = without_trailing_slash(command.source);
    fs::path destination = without_trailing_slash(command.destination);

    try {
        if (!fs::exists(source)) {
            outcome.error = failed_message(PARTIAL_TRANSFER_EXIT, command,
                                           "source " + source.string() + " does not exist");
            return outcome;
        }

        if (!fs::is_directory(source)) {
            fs::path target = fs::is_directory(destination) ? destination / source.filename() : destination;
            if (!is_excluded(source.filename(), command.excludes)) {
                copy_entry(source, target, command.ignore_existing);
            }
            outcome.ok = true;
            return outcome;
        }

        fs::path target_root = contents_only ? destination : destination / source.filename();
        fs::create_directories(target_root);

        for (auto it = fs::recursive_directory_iterator(source); it != fs::recursive_directory_iterator(); ++it) {
            check_deadline();
            fs::path relative = fs::relative(it->path(), source);
            if (is_excluded(relative, command.excludes)) {
                if (it->is_directory() && !it->is_symlink()) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            fs::path target = target_root / relative;
            if (it->is_directory() && !it->is_symlink()) {
                fs::create_directories(target);
            } else {
                copy_entry(it->path(), target, command.ignore_existing);
            }
        }
        outcome.ok = true;
    } catch (const DeadlineExceeded&) {
        outcome.error = timed_out_message(timeout, command);
    } catch (const fs::filesystem_error& e) {
        outcome.error = failed_message(PARTIAL_TRANSFER_EXIT, command, e.what());
    }
    return outcome;
}

std::unique_ptr<SyncCommandExecutor> make_executor(SyncTransport transport) {
    if (transport == SyncTransport::LOCAL_COPY) {
        return std::make_unique<LocalCopyExecutor>();
    }
    return std::make_unique<RsyncExecutor>();
}

// ============================================================================
// SyncEngine
// ============================================================================

SyncEngine::SyncEngine(std::shared_ptr<SyncCommandExecutor> executor, std::chrono::seconds timeout)
    : executor_(std::move(executor)), timeout_(timeout) {
    if (!executor_) {
        throw ConfigError("sync engine needs an executor");
    }
}

SyncResult SyncEngine::execute(const std::vector<SyncCommand>& commands) const {
    SyncResult result;
    for (const auto& command : commands) {
        std::cout << "[Sync] " << command.source << " -> " << command.destination << std::endl;
        SyncOutcome outcome = executor_->execute(command, timeout_);
        result.commands_executed++;
        if (outcome.ok) {
            result.successful_syncs++;
        } else {
            result.failed_syncs++;
            result.errors.push_back(outcome.error);
            std::cerr << "[Sync] " << outcome.error << std::endl;
        }
    }

    std::cout << "[Sync] " << result.successful_syncs << "/" << result.commands_executed
              << " transfers succeeded" << std::endl;
    return result;
}

} // namespace gaprun
