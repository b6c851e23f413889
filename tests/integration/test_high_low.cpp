#include <gtest/gtest.h>
#include "errors.h"
#include "file_utils.h"
#include "high_low.h"
#include <cstdlib>
#include <filesystem>
#include <functional>

namespace gaprun {
namespace {

const std::string OWNER = "owner@example.org";
const std::string RUNTIME_ID = "shell-runtime";

// Drives both sides against two local roots with the in-process copier
class HighLowTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/gaprun_highlow_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        test_dir = tmpl;
        high_root = test_dir / "high";
        low_root = test_dir / "low";
        std::filesystem::create_directories(low_root);

        FileUtils::write_text_file(test_dir / "src" / "mock" / "rows.csv", "id\n1\n2\n");
        FileUtils::write_text_file(test_dir / "src" / "private" / "rows.csv", "id\n10\n20\n30\n");
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    HighSideClient connected_high() {
        HighSideClient high = HighSideClient::initialize(OWNER, RUNTIME_ID, high_root, false, {"/bin/sh"});
        high.connect_local(low_root, SyncTransport::LOCAL_COPY);
        return high;
    }

    void publish(HighSideClient& high, const std::string& name) {
        high.create_dataset(name, test_dir / "src" / "mock", test_dir / "src" / "private");
        SyncResult result = high.sync_dataset(name);
        ASSERT_TRUE(result.success()) << (result.errors.empty() ? "" : result.errors[0]);
    }

    std::filesystem::path write_code(const std::string& script) {
        std::filesystem::path code = test_dir / "analysis";
        FileUtils::write_text_file(code / "main.sh", script);
        return code;
    }

    Runtime shell_runtime() {
        InterpreterConfig interp;
        interp.cmd = {"/bin/sh"};
        return Runtime::create(interp);
    }

    LowSideClient low_client() {
        return LowSideClient(low_root, OWNER, RUNTIME_ID);
    }

    // Rewrites a pending record on the low side before it is pulled
    void edit_record(LowSideClient& low, const std::string& id,
                     const std::function<void(Json::Value&)>& change) {
        std::filesystem::path path = low.queue().jobs_dir() / (id + ".json");
        Json::Value json = FileUtils::read_json_file(path);
        change(json);
        FileUtils::write_json_file(path, json);
    }

    Job run_on_high(HighSideClient& high, LowSideClient& low, const std::string& id) {
        EXPECT_TRUE(high.sync_pending_jobs().success());
        high.run_pending_jobs();
        EXPECT_TRUE(high.sync_done_jobs().success());
        return low.get_job(id);
    }

    std::filesystem::path test_dir;
    std::filesystem::path high_root;
    std::filesystem::path low_root;
};

// ============================================================================
// Setup
// ============================================================================

TEST_F(HighLowTest, Initialize_RefusesExistingRoot) {
    HighSideClient::initialize(OWNER, RUNTIME_ID, high_root);

    EXPECT_THROW(HighSideClient::initialize(OWNER, RUNTIME_ID, high_root), GaprunError);

    FileUtils::write_text_file(high_root / "stale.txt", "x");
    HighSideClient fresh = HighSideClient::initialize(OWNER, RUNTIME_ID, high_root, true);
    EXPECT_FALSE(std::filesystem::exists(high_root / "stale.txt"));
    EXPECT_TRUE(std::filesystem::is_directory(fresh.runtime_dir() / "jobs"));
    EXPECT_EQ(fresh.runtime_dir(), runtime_dir_for(fresh.root(), OWNER, RUNTIME_ID));
}

TEST_F(HighLowTest, Connect_CreatesLowLayoutAndConfig) {
    HighSideClient high = HighSideClient::initialize(OWNER, RUNTIME_ID, high_root);
    EXPECT_FALSE(high.is_connected());

    SyncResult first = high.connect_local(low_root, SyncTransport::LOCAL_COPY);

    EXPECT_TRUE(first.success());
    EXPECT_EQ(first.commands_executed, 2) << "jobs and done";
    EXPECT_TRUE(high.is_connected());
    EXPECT_TRUE(std::filesystem::is_directory(runtime_dir_for(low_root, OWNER, RUNTIME_ID) / "jobs"));

    SyncConfig config = high.sync_config();
    EXPECT_TRUE(config.is_local());
    EXPECT_EQ(config.transport, SyncTransport::LOCAL_COPY);
    EXPECT_EQ(config.entries.size(), 2u);
}

TEST_F(HighLowTest, Connect_TwiceNeedsForce) {
    HighSideClient high = connected_high();

    EXPECT_THROW(high.connect_local(low_root, SyncTransport::LOCAL_COPY), ConfigError);
    EXPECT_NO_THROW(high.connect_local(low_root, SyncTransport::LOCAL_COPY, true));
}

TEST_F(HighLowTest, Connect_MissingLowRoot) {
    HighSideClient high = HighSideClient::initialize(OWNER, RUNTIME_ID, high_root);
    EXPECT_THROW(high.connect_local(test_dir / "nowhere", SyncTransport::LOCAL_COPY), ConfigError);
}

TEST_F(HighLowTest, Connect_SshNeedsUser) {
    HighSideClient high = HighSideClient::initialize(OWNER, RUNTIME_ID, high_root);
    SshConnection ssh;
    ssh.host = "low.example.org";
    EXPECT_THROW(high.connect_ssh(ssh, "/srv/low"), ConfigError);
}

TEST_F(HighLowTest, Sync_BeforeConnectFails) {
    HighSideClient high = HighSideClient::initialize(OWNER, RUNTIME_ID, high_root);
    EXPECT_THROW(high.sync_pending_jobs(), ConfigError);
}

// ============================================================================
// Datasets
// ============================================================================

TEST_F(HighLowTest, Datasets_OnlyPublicHalfReplicates) {
    // Given: Two datasets published from the high side
    HighSideClient high = connected_high();
    publish(high, "alpha");
    publish(high, "beta");

    // When: Listing them on the low side
    LowSideClient low = low_client();
    auto datasets = low.list_datasets();

    // Then: Both are visible, but only their mock data
    ASSERT_EQ(datasets.size(), 2u);
    EXPECT_EQ(datasets[0].name, "alpha");
    EXPECT_EQ(datasets[1].name, "beta");
    EXPECT_TRUE(std::filesystem::exists(datasets[0].mock_dir / "rows.csv"));
    EXPECT_FALSE(std::filesystem::exists(low_root / "private" / OWNER / "syft_datasets"));
    EXPECT_THROW(low.private_dataset_path("alpha"), PermissionError);
    EXPECT_THROW(low.private_dataset_path("gamma"), DatasetNotFoundError);

    RuntimeDirConfig low_config = low.queue().config();
    EXPECT_TRUE(low_config.has_dataset("alpha"));
    EXPECT_TRUE(low_config.has_dataset("beta"));

    EXPECT_EQ(high.sync_config().entries.size(), 4u) << "jobs, done and one per dataset";
}

TEST_F(HighLowTest, Datasets_UnknownCannotBePublished) {
    HighSideClient high = connected_high();
    EXPECT_THROW(high.sync_dataset("missing"), DatasetNotFoundError);
}

TEST_F(HighLowTest, Submit_UnpublishedDatasetRejected) {
    HighSideClient high = connected_high();
    high.create_dataset("local-only", test_dir / "src" / "mock", test_dir / "src" / "private");

    LowSideClient low = low_client();

    EXPECT_THROW(low.submit_job("local-only", write_code("true\n"), {"main.sh"}, shell_runtime()),
                 DatasetNotFoundError);
}

// ============================================================================
// Job Round Trip
// ============================================================================

TEST_F(HighLowTest, RoundTrip_ResultsReachLowSide) {
    // Given: A published dataset and a job submitted on the low side
    HighSideClient high = connected_high();
    publish(high, "alpha");
    LowSideClient low = low_client();
    std::string id = low.submit_job(
        "alpha",
        write_code("tail -n +2 \"$DATA_DIR/rows.csv\" | wc -l > \"$OUTPUT_DIR/count.txt\"\n"
                   "printf ABC > \"$OUTPUT_DIR/output.txt\"\n"),
        {"main.sh"}, shell_runtime(), 10, {}, "count rows");
    EXPECT_EQ(low.job_status(id), JobStatus::PENDING_CODE_REVIEW);

    // When: The high side pulls, runs and pushes back
    ASSERT_TRUE(high.sync_pending_jobs().success());
    EXPECT_EQ(high.queue().status(id), JobStatus::PENDING_CODE_REVIEW);
    EXPECT_EQ(high.run_pending_jobs(), 1u);
    ASSERT_TRUE(high.sync_done_jobs().success());

    // Then: The low side sees the finished job and its outputs
    Job job = low.get_job(id);
    EXPECT_EQ(job.status, JobStatus::RUN_FINISHED);
    EXPECT_EQ(job.name, "count rows");
    EXPECT_EQ(job.output_location.value_or(""), "done/" + id + "_results");

    JobResults results = low.job_results(id);
    auto outputs = results.outputs();
    ASSERT_TRUE(outputs.count("output.txt"));
    EXPECT_EQ(std::get<std::string>(outputs.at("output.txt")), "ABC");
    ASSERT_TRUE(outputs.count("count.txt"));
    EXPECT_NE(std::get<std::string>(outputs.at("count.txt")).find('3'), std::string::npos)
        << "The job read the private rows, not the mock ones";

    EXPECT_FALSE(std::filesystem::exists(low.queue().jobs_dir() / (id + ".json")))
        << "Pending copy pruned once results arrived";
}

TEST_F(HighLowTest, RoundTrip_ResyncDoesNotRerun) {
    HighSideClient high = connected_high();
    publish(high, "alpha");
    LowSideClient low = low_client();
    std::string id = low.submit_job("alpha", write_code("true\n"), {"main.sh"}, shell_runtime());

    high.sync_pending_jobs();
    high.run_pending_jobs();
    // The low side has not pruned yet, so the job comes back
    high.sync_pending_jobs();

    EXPECT_EQ(high.run_pending_jobs(), 0u);
    EXPECT_EQ(high.queue().status(id), JobStatus::RUN_FINISHED);
}

TEST_F(HighLowTest, RoundTrip_MissingCodeFails) {
    // Given: A job whose code snapshot never made it to the high side
    HighSideClient high = connected_high();
    publish(high, "alpha");
    LowSideClient low = low_client();
    std::string id = low.submit_job("alpha", write_code("true\n"), {"main.sh"}, shell_runtime());
    high.sync_pending_jobs();
    std::filesystem::remove_all(high.queue().jobs_dir() / (id + "_code"));

    // When: Running and pushing back
    high.run_pending_jobs();
    high.sync_done_jobs();

    // Then: The failure replicates with its reason
    Job job = low.get_job(id);
    EXPECT_EQ(job.status, JobStatus::RUN_FAILED);
    EXPECT_EQ(job.error, JobErrorKind::EXECUTION_FAILED);
    EXPECT_NE(job.error_message.value_or("").find("does not exist"), std::string::npos);
    EXPECT_THROW(low.job_results(id), GaprunError);
}

TEST_F(HighLowTest, RoundTrip_RejectedJob) {
    HighSideClient high = connected_high();
    publish(high, "alpha");
    LowSideClient low = low_client();
    std::string id = low.submit_job("alpha", write_code("cat \"$DATA_DIR/rows.csv\"\n"),
                                    {"main.sh"}, shell_runtime());
    high.sync_pending_jobs();

    high.queue().reject(id, "bad code");
    EXPECT_EQ(high.run_pending_jobs(), 0u);
    high.sync_done_jobs();

    Job job = low.get_job(id);
    EXPECT_EQ(job.status, JobStatus::REJECTED);
    EXPECT_EQ(job.error, JobErrorKind::FAILED_CODE_REVIEW);
    EXPECT_EQ(job.error_message.value_or(""), "bad code");
}

// ============================================================================
// Records From the Low Side
// ============================================================================

TEST_F(HighLowTest, LowRecord_DataDirIgnored) {
    // Given: A job on published 'alpha' whose record points at the private
    // data of 'beta', which was never published
    HighSideClient high = connected_high();
    publish(high, "alpha");
    FileUtils::write_text_file(test_dir / "secret" / "rows.csv", "TOPSECRET\n");
    high.create_dataset("beta", test_dir / "src" / "mock", test_dir / "secret");

    LowSideClient low = low_client();
    std::string id = low.submit_job("alpha",
                                    write_code("cat \"$DATA_DIR/rows.csv\" > \"$OUTPUT_DIR/output.txt\"\n"),
                                    {"main.sh"}, shell_runtime());
    std::string beta_private = high.datasets().private_dir("beta").string();
    edit_record(low, id, [&beta_private](Json::Value& json) { json["data_dir"] = beta_private; });

    // When: The high side runs it
    Job job = run_on_high(high, low, id);

    // Then: The job saw alpha's private rows and nothing of beta
    ASSERT_EQ(job.status, JobStatus::RUN_FINISHED) << job.error_message.value_or("");
    std::string output = std::get<std::string>(low.job_results(id).outputs().at("output.txt"));
    EXPECT_EQ(output.find("TOPSECRET"), std::string::npos);
    EXPECT_NE(output.find("30"), std::string::npos);
}

TEST_F(HighLowTest, LowRecord_CodeOutsideSnapshotFails) {
    HighSideClient high = connected_high();
    publish(high, "alpha");
    LowSideClient low = low_client();
    std::filesystem::path code = write_code("printf ran > \"$OUTPUT_DIR/output.txt\"\n");
    std::string id = low.submit_job("alpha", code, {"main.sh"}, shell_runtime());
    std::string elsewhere = code.string();
    edit_record(low, id, [&elsewhere](Json::Value& json) { json["job"]["code_dir"] = elsewhere; });

    Job job = run_on_high(high, low, id);

    EXPECT_EQ(job.status, JobStatus::RUN_FAILED);
    EXPECT_EQ(job.error, JobErrorKind::EXECUTION_FAILED);
    EXPECT_NE(job.error_message.value_or("").find(id + "_code"), std::string::npos);
}

TEST_F(HighLowTest, LowRecord_RuntimeReplacedByRegistered) {
    // Given: A record whose runtime injects an environment variable, and one
    // asking for a container with the host root mounted writable
    HighSideClient high = connected_high();
    publish(high, "alpha");
    LowSideClient low = low_client();
    std::filesystem::path code = write_code("echo \"${INJECTED:-absent}\" > \"$OUTPUT_DIR/env.txt\"\n");

    InterpreterConfig injecting;
    injecting.cmd = {"/usr/bin/env", "INJECTED=1", "/bin/sh"};
    std::string env_id = low.submit_job("alpha", code, {"main.sh"}, Runtime::create(injecting));

    ContainerConfig container;
    container.dockerfile_content = "FROM alpine";
    container.image_name = "alpine";
    container.cmd = {"/bin/sh"};
    container.extra_mounts.push_back(ContainerMount{"/", "/host", "rw"});
    std::string mount_id = low.submit_job("alpha", code, {"main.sh"}, shell_runtime());
    Json::Value container_json = Runtime::create(container).to_json();
    edit_record(low, mount_id, [&container_json](Json::Value& json) { json["runtime"] = container_json; });

    // When: The high side runs both
    run_on_high(high, low, env_id);
    std::string registered = high.registered_runtime().name();

    // Then: Both ran with the high side's interpreter
    for (const auto& id : {env_id, mount_id}) {
        Job job = low.get_job(id);
        ASSERT_EQ(job.status, JobStatus::RUN_FINISHED) << id << ": " << job.error_message.value_or("");
        EXPECT_EQ(job.runtime_name, registered);
        auto outputs = low.job_results(id).outputs();
        EXPECT_EQ(std::get<std::string>(outputs.at("env.txt")), "absent\n");
    }
}

TEST_F(HighLowTest, LowRecord_NoRegisteredRuntimeFails) {
    HighSideClient high = HighSideClient::initialize(OWNER, RUNTIME_ID, high_root);
    high.connect_local(low_root, SyncTransport::LOCAL_COPY);
    publish(high, "alpha");
    LowSideClient low = low_client();
    std::string id = low.submit_job("alpha", write_code("true\n"), {"main.sh"}, shell_runtime());

    Job job = run_on_high(high, low, id);

    EXPECT_EQ(job.status, JobStatus::RUN_FAILED);
    EXPECT_NE(job.error_message.value_or("").find("no runtime registered"), std::string::npos);
}

TEST_F(HighLowTest, RegisterRuntime_UsedForLaterJobs) {
    HighSideClient high = HighSideClient::initialize(OWNER, RUNTIME_ID, high_root);
    high.connect_local(low_root, SyncTransport::LOCAL_COPY);
    publish(high, "alpha");
    EXPECT_THROW(high.registered_runtime(), ConfigError);

    high.register_runtime(shell_runtime());

    EXPECT_EQ(high.registered_runtime().name(), shell_runtime().name());
    EXPECT_EQ(high.queue().config().runtime_name, shell_runtime().name());
    LowSideClient low = low_client();
    std::string id = low.submit_job("alpha", write_code("true\n"), {"main.sh"}, shell_runtime());
    EXPECT_EQ(run_on_high(high, low, id).status, JobStatus::RUN_FINISHED);
}

TEST_F(HighLowTest, SyncAll_RunsEveryStandingEntry) {
    HighSideClient high = connected_high();
    publish(high, "alpha");

    SyncResult result = high.sync_all();

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.commands_executed, 3);
}

} // namespace
} // namespace gaprun
