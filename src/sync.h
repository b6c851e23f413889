#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "constants.h"

namespace gaprun {

enum class SyncDirection {
    LOCAL_TO_REMOTE,
    REMOTE_TO_LOCAL
};

std::string sync_direction_to_string(SyncDirection direction);
SyncDirection parse_sync_direction(const std::string& value);

// How transfers reach the low side
enum class SyncTransport {
    RSYNC,          // rsync, optionally over ssh
    LOCAL_COPY      // in-process filesystem copy, local bridge only
};

std::string sync_transport_to_string(SyncTransport transport);
SyncTransport parse_sync_transport(const std::string& value);

// One directional transfer rule. "local" is the high side.
struct SyncEntry {
    std::string local_dir;
    std::string remote_dir;
    SyncDirection direction = SyncDirection::LOCAL_TO_REMOTE;
    bool ignore_existing = true;
    std::vector<std::string> excludes;
};

struct SshConnection {
    std::string host;
    std::string user;
    int port = DEFAULT_SSH_PORT;
    std::optional<std::string> ssh_key_path;
};

struct SyncConfig {
    std::string high_side_name;
    std::string high_root;
    std::string low_root;
    std::optional<SshConnection> connection;    // none: local bridge
    SyncTransport transport = SyncTransport::RSYNC;
    std::vector<SyncEntry> entries;

    bool is_local() const { return !connection.has_value(); }

    // Throws ConfigError when the transport cannot reach the low side
    void validate() const;

    Json::Value to_json() const;
    static SyncConfig from_json(const Json::Value& json);

    // <high_root>/high_side_sync_config.json
    static std::filesystem::path path_for(const std::filesystem::path& high_root);
    void save() const;
    static SyncConfig load(const std::filesystem::path& high_root);
};

// A fully resolved transfer
struct SyncCommand {
    std::vector<std::string> argv;      // rsync invocation
    std::string source;                 // as passed to rsync, trailing '/' included
    std::string destination;
    bool ignore_existing = true;
    std::vector<std::string> excludes;

    std::string to_string() const;
};

// Directories (no ".ext" on the last segment) get a trailing '/' on each
// side, files never do. Extension-less files are treated as directories.
SyncCommand build_sync_command(const SyncEntry& entry,
                               const std::optional<SshConnection>& connection = std::nullopt);

std::vector<SyncCommand> build_sync_commands(const SyncConfig& config);

struct SyncResult {
    int commands_executed = 0;
    int successful_syncs = 0;
    int failed_syncs = 0;
    std::vector<std::string> errors;

    bool success() const { return failed_syncs == 0; }

    void merge(const SyncResult& other);
};

struct SyncOutcome {
    bool ok = false;
    std::string error;      // set when !ok
};

// Executes one transfer; never throws for transfer failures
class SyncCommandExecutor {
public:
    virtual ~SyncCommandExecutor() = default;
    virtual SyncOutcome execute(const SyncCommand& command, std::chrono::seconds timeout) = 0;
};

// Spawns the rsync command line
class RsyncExecutor : public SyncCommandExecutor {
public:
    SyncOutcome execute(const SyncCommand& command, std::chrono::seconds timeout) override;
};

// rsync semantics on the local filesystem: a trailing '/' on the source
// copies its contents, ignore_existing skips files present at the
// destination, excludes match file names or relative paths
class LocalCopyExecutor : public SyncCommandExecutor {
public:
    SyncOutcome execute(const SyncCommand& command, std::chrono::seconds timeout) override;
};

std::unique_ptr<SyncCommandExecutor> make_executor(SyncTransport transport);

// Runs every command in order regardless of earlier failures
class SyncEngine {
public:
    explicit SyncEngine(std::shared_ptr<SyncCommandExecutor> executor,
                        std::chrono::seconds timeout =
                            std::chrono::seconds(DEFAULT_SYNC_TIMEOUT_SECONDS));

    SyncResult execute(const std::vector<SyncCommand>& commands) const;

private:
    std::shared_ptr<SyncCommandExecutor> executor_;
    std::chrono::seconds timeout_;
};

} // namespace gaprun
