#include <gtest/gtest.h>
#include "errors.h"
#include "file_utils.h"
#include "sync.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>

namespace gaprun {
namespace {

// Fails every command whose source contains `fail_marker`
class ScriptedExecutor : public SyncCommandExecutor {
public:
    explicit ScriptedExecutor(std::string fail_marker) : fail_marker_(std::move(fail_marker)) {}

    SyncOutcome execute(const SyncCommand& command, std::chrono::seconds) override {
        seen.push_back(command.source);
        SyncOutcome outcome;
        if (command.source.find(fail_marker_) != std::string::npos) {
            outcome.error = "Command failed (exit 23): " + command.to_string();
        } else {
            outcome.ok = true;
        }
        return outcome;
    }

    std::vector<std::string> seen;

private:
    std::string fail_marker_;
};

bool has_arg(const SyncCommand& command, const std::string& arg) {
    return std::find(command.argv.begin(), command.argv.end(), arg) != command.argv.end();
}

class SyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/gaprun_sync_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        test_dir = tmpl;
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void write(const std::filesystem::path& path, const std::string& content) {
        FileUtils::write_text_file(path, content);
    }

    std::filesystem::path test_dir;
};

// ============================================================================
// Command Construction
// ============================================================================

TEST_F(SyncTest, Command_DirectoriesGetTrailingSlash) {
    // Given: A directory entry without trailing slashes
    SyncEntry entry{"/high/private/a/syft_runtimes/rt/done", "/low/private/a/syft_runtimes/rt/done",
                    SyncDirection::LOCAL_TO_REMOTE, false, {}};

    // When: Building the command
    SyncCommand command = build_sync_command(entry);

    // Then: Both sides end in '/', so contents are mirrored
    EXPECT_EQ(command.source, "/high/private/a/syft_runtimes/rt/done/");
    EXPECT_EQ(command.destination, "/low/private/a/syft_runtimes/rt/done/");
    EXPECT_EQ(command.argv.back(), command.destination);
    EXPECT_EQ(command.argv[command.argv.size() - 2], command.source);
}

TEST_F(SyncTest, Command_FilesNeverGetTrailingSlash) {
    SyncEntry entry{"/high/rt/config.yaml/", "/low/rt/config.yaml", SyncDirection::LOCAL_TO_REMOTE, false, {}};

    SyncCommand command = build_sync_command(entry);

    EXPECT_EQ(command.source, "/high/rt/config.yaml");
    EXPECT_EQ(command.destination, "/low/rt/config.yaml");
}

TEST_F(SyncTest, Command_SlashesDecidedPerSide) {
    SyncEntry entry{"/high/rt/config.yaml", "/low/rt", SyncDirection::LOCAL_TO_REMOTE, false, {}};

    SyncCommand command = build_sync_command(entry);

    EXPECT_EQ(command.source, "/high/rt/config.yaml");
    EXPECT_EQ(command.destination, "/low/rt/");
}

TEST_F(SyncTest, Command_DirectionSwapsSides) {
    SyncEntry entry{"/high/jobs", "/low/jobs", SyncDirection::REMOTE_TO_LOCAL, true, {}};

    SyncCommand command = build_sync_command(entry);

    EXPECT_EQ(command.source, "/low/jobs/");
    EXPECT_EQ(command.destination, "/high/jobs/");
}

TEST_F(SyncTest, Command_FlagsAndExcludes) {
    SyncEntry entry{"/high/jobs", "/low/jobs", SyncDirection::LOCAL_TO_REMOTE, true, {"*.tmp", "cache"}};

    SyncCommand command = build_sync_command(entry);

    ASSERT_GE(command.argv.size(), 4u);
    EXPECT_EQ(command.argv[0], "rsync");
    EXPECT_EQ(command.argv[1], "-avh");
    EXPECT_EQ(command.argv[2], "--progress");
    EXPECT_EQ(command.argv[3], "--mkpath");
    EXPECT_TRUE(has_arg(command, "--ignore-existing"));
    EXPECT_TRUE(has_arg(command, "--exclude=*.tmp"));
    EXPECT_TRUE(has_arg(command, "--exclude=cache"));
    EXPECT_FALSE(has_arg(command, "-e")) << "Local bridge has no remote shell";

    entry.ignore_existing = false;
    EXPECT_FALSE(has_arg(build_sync_command(entry), "--ignore-existing"));
}

TEST_F(SyncTest, Command_SshPrefixesRemoteSide) {
    SshConnection ssh;
    ssh.host = "low.example.org";
    ssh.user = "ops";
    ssh.port = 2222;
    ssh.ssh_key_path = "/keys/id_ed25519";

    SyncEntry push{"/high/done", "/srv/low/done", SyncDirection::LOCAL_TO_REMOTE, false, {}};
    SyncEntry pull{"/high/jobs", "/srv/low/jobs", SyncDirection::REMOTE_TO_LOCAL, true, {}};

    SyncCommand push_cmd = build_sync_command(push, ssh);
    SyncCommand pull_cmd = build_sync_command(pull, ssh);

    EXPECT_EQ(push_cmd.source, "/high/done/");
    EXPECT_EQ(push_cmd.destination, "ops@low.example.org:/srv/low/done/");
    EXPECT_EQ(pull_cmd.source, "ops@low.example.org:/srv/low/jobs/");
    EXPECT_EQ(pull_cmd.destination, "/high/jobs/");

    auto it = std::find(push_cmd.argv.begin(), push_cmd.argv.end(), "-e");
    ASSERT_NE(it, push_cmd.argv.end());
    ASSERT_NE(it + 1, push_cmd.argv.end());
    EXPECT_EQ(*(it + 1), "ssh -p 2222 -i /keys/id_ed25519");
}

TEST_F(SyncTest, Command_KeyPathWithSpacesQuoted) {
    SshConnection ssh;
    ssh.host = "low";
    ssh.user = "ops";
    ssh.ssh_key_path = "/keys/my key";
    SyncEntry entry{"/high/done", "/low/done", SyncDirection::LOCAL_TO_REMOTE, false, {}};

    SyncCommand command = build_sync_command(entry, ssh);

    auto it = std::find(command.argv.begin(), command.argv.end(), "-e");
    ASSERT_NE(it, command.argv.end());
    ASSERT_NE(it + 1, command.argv.end());
    EXPECT_EQ(*(it + 1), "ssh -p 22 -i '/keys/my key'");

    ssh.ssh_key_path = "/keys/ops's key";
    SyncCommand apostrophe = build_sync_command(entry, ssh);
    it = std::find(apostrophe.argv.begin(), apostrophe.argv.end(), "-e");
    ASSERT_NE(it, apostrophe.argv.end());
    EXPECT_EQ(*(it + 1), "ssh -p 22 -i \"/keys/ops's key\"");

    ssh.ssh_key_path = "/keys/\"ops's\" key";
    EXPECT_THROW(build_sync_command(entry, ssh), ConfigError);
}

TEST_F(SyncTest, Command_ToStringQuotesSpaces) {
    SshConnection ssh;
    ssh.host = "low";
    ssh.user = "ops";
    SyncEntry entry{"/high/done", "/low/done", SyncDirection::LOCAL_TO_REMOTE, false, {}};

    std::string text = build_sync_command(entry, ssh).to_string();

    EXPECT_NE(text.find("-e \"ssh -p 22\""), std::string::npos) << text;
    EXPECT_EQ(text.rfind("rsync -avh --progress --mkpath", 0), 0u);
}

// ============================================================================
// Engine
// ============================================================================

TEST_F(SyncTest, Engine_PartialFailureRunsEverything) {
    // Given: Three transfers, the second of which fails
    std::vector<SyncCommand> commands = {
        build_sync_command({"/high/a", "/low/a", SyncDirection::LOCAL_TO_REMOTE, true, {}}),
        build_sync_command({"/high/broken", "/low/broken", SyncDirection::LOCAL_TO_REMOTE, true, {}}),
        build_sync_command({"/high/c", "/low/c", SyncDirection::LOCAL_TO_REMOTE, true, {}}),
    };
    auto executor = std::make_shared<ScriptedExecutor>("broken");

    // When: Executing them
    SyncResult result = SyncEngine(executor).execute(commands);

    // Then: Every command ran and the failure is reported
    EXPECT_EQ(result.commands_executed, 3);
    EXPECT_EQ(result.successful_syncs, 2);
    EXPECT_EQ(result.failed_syncs, 1);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].rfind("Command failed (exit 23): ", 0), 0u);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(executor->seen.size(), 3u);
    EXPECT_EQ(executor->seen[2], "/high/c/") << "Order is preserved";
}

TEST_F(SyncTest, Engine_EmptyIsSuccess) {
    SyncResult result = SyncEngine(std::make_shared<LocalCopyExecutor>()).execute({});
    EXPECT_EQ(result.commands_executed, 0);
    EXPECT_TRUE(result.success());
}

TEST_F(SyncTest, Engine_NeedsExecutor) {
    EXPECT_THROW(SyncEngine(nullptr), ConfigError);
}

TEST_F(SyncTest, Result_Merge) {
    SyncResult a;
    a.commands_executed = 2;
    a.successful_syncs = 2;
    SyncResult b;
    b.commands_executed = 1;
    b.failed_syncs = 1;
    b.errors = {"Command timed out after 5s: rsync"};

    a.merge(b);

    EXPECT_EQ(a.commands_executed, 3);
    EXPECT_EQ(a.successful_syncs, 2);
    EXPECT_EQ(a.failed_syncs, 1);
    EXPECT_EQ(a.errors.size(), 1u);
}

TEST_F(SyncTest, RsyncExecutor_MissingBinaryOrSourceFails) {
    // Whether or not rsync is installed, a missing source is a failed transfer
    SyncEntry entry{(test_dir / "missing").string(), (test_dir / "dst").string(),
                    SyncDirection::LOCAL_TO_REMOTE, true, {}};

    SyncOutcome outcome = RsyncExecutor().execute(build_sync_command(entry), std::chrono::seconds(30));

    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error.rfind("Command failed (exit ", 0), 0u) << outcome.error;
}

// ============================================================================
// Local Copy Executor
// ============================================================================

TEST_F(SyncTest, LocalCopy_MirrorsDirectoryContents) {
    write(test_dir / "src" / "a.json", "{}");
    write(test_dir / "src" / "nested" / "b.txt", "b");
    SyncEntry entry{(test_dir / "src").string(), (test_dir / "dst").string(),
                    SyncDirection::LOCAL_TO_REMOTE, true, {}};

    SyncOutcome outcome = LocalCopyExecutor().execute(build_sync_command(entry), std::chrono::seconds(30));

    ASSERT_TRUE(outcome.ok) << outcome.error;
    EXPECT_TRUE(std::filesystem::exists(test_dir / "dst" / "a.json"));
    EXPECT_TRUE(std::filesystem::exists(test_dir / "dst" / "nested" / "b.txt"));
    EXPECT_FALSE(std::filesystem::exists(test_dir / "dst" / "src")) << "Trailing slash copies contents";
}

TEST_F(SyncTest, LocalCopy_IgnoreExistingKeepsDestination) {
    write(test_dir / "src" / "job.json", "new");
    write(test_dir / "dst" / "job.json", "old");
    SyncEntry entry{(test_dir / "src").string(), (test_dir / "dst").string(),
                    SyncDirection::LOCAL_TO_REMOTE, true, {}};

    ASSERT_TRUE(LocalCopyExecutor().execute(build_sync_command(entry), std::chrono::seconds(30)).ok);
    EXPECT_EQ(FileUtils::read_text_file(test_dir / "dst" / "job.json"), "old");

    entry.ignore_existing = false;
    ASSERT_TRUE(LocalCopyExecutor().execute(build_sync_command(entry), std::chrono::seconds(30)).ok);
    EXPECT_EQ(FileUtils::read_text_file(test_dir / "dst" / "job.json"), "new");
}

TEST_F(SyncTest, LocalCopy_Excludes) {
    write(test_dir / "src" / "keep.csv", "1");
    write(test_dir / "src" / "scratch.tmp", "x");
    write(test_dir / "src" / "cache" / "blob.bin", "x");
    SyncEntry entry{(test_dir / "src").string(), (test_dir / "dst").string(),
                    SyncDirection::LOCAL_TO_REMOTE, false, {"*.tmp", "cache"}};

    ASSERT_TRUE(LocalCopyExecutor().execute(build_sync_command(entry), std::chrono::seconds(30)).ok);

    EXPECT_TRUE(std::filesystem::exists(test_dir / "dst" / "keep.csv"));
    EXPECT_FALSE(std::filesystem::exists(test_dir / "dst" / "scratch.tmp"));
    EXPECT_FALSE(std::filesystem::exists(test_dir / "dst" / "cache"));
}

TEST_F(SyncTest, LocalCopy_SingleFileToPath) {
    write(test_dir / "high" / "config.yaml", "datasets: [alpha]\n");
    SyncEntry entry{(test_dir / "high" / "config.yaml").string(),
                    (test_dir / "low" / "rt" / "config.yaml").string(),
                    SyncDirection::LOCAL_TO_REMOTE, false, {}};

    ASSERT_TRUE(LocalCopyExecutor().execute(build_sync_command(entry), std::chrono::seconds(30)).ok);

    EXPECT_EQ(FileUtils::read_text_file(test_dir / "low" / "rt" / "config.yaml"), "datasets: [alpha]\n");
}

TEST_F(SyncTest, LocalCopy_MissingSource) {
    SyncEntry entry{(test_dir / "nothing").string(), (test_dir / "dst").string(),
                    SyncDirection::LOCAL_TO_REMOTE, true, {}};

    SyncOutcome outcome = LocalCopyExecutor().execute(build_sync_command(entry), std::chrono::seconds(30));

    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error.rfind("Command failed (exit 23): ", 0), 0u);
}

// ============================================================================
// Config Persistence
// ============================================================================

TEST_F(SyncTest, Config_SaveAndLoad) {
    SyncConfig config;
    config.high_side_name = "rt";
    config.high_root = test_dir.string();
    config.low_root = "/srv/low";
    SshConnection ssh;
    ssh.host = "low";
    ssh.user = "ops";
    config.connection = ssh;
    config.entries.push_back({"/h/jobs", "/l/jobs", SyncDirection::REMOTE_TO_LOCAL, true, {"*.tmp"}});

    config.save();
    ASSERT_TRUE(std::filesystem::exists(test_dir / "high_side_sync_config.json"));
    SyncConfig back = SyncConfig::load(test_dir);

    EXPECT_EQ(back.high_side_name, "rt");
    EXPECT_EQ(back.low_root, "/srv/low");
    ASSERT_TRUE(back.connection.has_value());
    EXPECT_EQ(back.connection->port, 22);
    EXPECT_FALSE(back.connection->ssh_key_path.has_value());
    ASSERT_EQ(back.entries.size(), 1u);
    EXPECT_EQ(back.entries[0].direction, SyncDirection::REMOTE_TO_LOCAL);
    EXPECT_EQ(back.entries[0].excludes, std::vector<std::string>{"*.tmp"});
}

TEST_F(SyncTest, Config_MissingIsConfigError) {
    EXPECT_THROW(SyncConfig::load(test_dir), ConfigError);
}

TEST_F(SyncTest, Config_CopyTransportCannotUseSsh) {
    SyncConfig config;
    config.high_root = test_dir.string();
    config.low_root = "/srv/low";
    config.transport = SyncTransport::LOCAL_COPY;
    SshConnection ssh;
    ssh.host = "low";
    config.connection = ssh;

    EXPECT_THROW(config.validate(), ConfigError);
    EXPECT_THROW(config.save(), ConfigError);
}

TEST_F(SyncTest, Strings_DirectionAndTransport) {
    EXPECT_EQ(sync_direction_to_string(SyncDirection::LOCAL_TO_REMOTE), "local_to_remote");
    EXPECT_EQ(parse_sync_direction("remote_to_local"), SyncDirection::REMOTE_TO_LOCAL);
    EXPECT_EQ(sync_transport_to_string(SyncTransport::LOCAL_COPY), "copy");
    EXPECT_EQ(parse_sync_transport("rsync"), SyncTransport::RSYNC);
    EXPECT_THROW(parse_sync_direction("sideways"), ConfigError);
}

} // namespace
} // namespace gaprun
