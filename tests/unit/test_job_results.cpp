#include <gtest/gtest.h>
#include "errors.h"
#include "file_utils.h"
#include "job_results.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace gaprun {
namespace {

class JobResultsTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/gaprun_results_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        results_dir = tmpl;
        std::filesystem::create_directories(results_dir / "logs");
        std::filesystem::create_directories(results_dir / "output");
    }

    void TearDown() override {
        std::filesystem::remove_all(results_dir);
    }

    std::filesystem::path write(const std::string& relpath, const std::string& content) {
        std::filesystem::path path = results_dir / relpath;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    std::filesystem::path results_dir;
};

// ============================================================================
// Loader Dispatch
// ============================================================================

TEST_F(JobResultsTest, Load_JsonParsed) {
    auto path = write("output/metrics.json", R"({"rows": 42, "mean": 1.5})");

    LoadedOutput loaded = load_output_file(path);

    ASSERT_TRUE(std::holds_alternative<Json::Value>(loaded));
    EXPECT_EQ(std::get<Json::Value>(loaded)["rows"].asInt(), 42);
}

TEST_F(JobResultsTest, Load_CsvRows) {
    auto path = write("output/table.csv", "name,count\r\n\"a, b\",1\n\"say \"\"hi\"\"\",2\n");

    LoadedOutput loaded = load_output_file(path);

    ASSERT_TRUE(std::holds_alternative<CsvTable>(loaded));
    const auto& rows = std::get<CsvTable>(loaded);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], (std::vector<std::string>{"name", "count"}));
    EXPECT_EQ(rows[1][0], "a, b");
    EXPECT_EQ(rows[2][0], "say \"hi\"");
}

TEST_F(JobResultsTest, Load_ParquetRawBytes) {
    std::string magic("PAR1\0\x01PAR1", 10);
    auto path = write("output/frame.parquet", magic);

    LoadedOutput loaded = load_output_file(path);

    ASSERT_TRUE(std::holds_alternative<Bytes>(loaded));
    EXPECT_EQ(std::get<Bytes>(loaded).size(), 10u);
}

TEST_F(JobResultsTest, Load_TextVariants) {
    for (const std::string name : {"a.txt", "b.log", "c.md", "d.html"}) {
        auto path = write("output/" + name, "content of " + name);
        LoadedOutput loaded = load_output_file(path);
        ASSERT_TRUE(std::holds_alternative<std::string>(loaded)) << name;
        EXPECT_EQ(std::get<std::string>(loaded), "content of " + name);
    }
}

TEST_F(JobResultsTest, Load_UnsupportedType) {
    auto path = write("output/model.pkl", "binary");
    EXPECT_THROW(load_output_file(path), UnsupportedFileTypeError);
}

TEST_F(JobResultsTest, Load_TooLarge) {
    // Given: A file just over a small ceiling
    auto path = write("output/big.txt", std::string(2048, 'x'));

    // Then: The size check runs before the type dispatch
    EXPECT_THROW(load_output_file(path, 1024), OutputTooLargeError);
    EXPECT_NO_THROW(load_output_file(path, 4096));
}

TEST_F(JobResultsTest, Load_Missing) {
    EXPECT_THROW(load_output_file(results_dir / "output" / "none.json"), PathNotFoundError);
}

// ============================================================================
// Results View
// ============================================================================

TEST_F(JobResultsTest, Outputs_SkipUnsupported) {
    write("output/result.json", "{\"ok\": true}");
    write("output/notes.txt", "fine");
    write("output/weights.bin", "skip me");

    JobResults results(results_dir);
    auto outputs = results.outputs();

    EXPECT_EQ(outputs.size(), 2u);
    EXPECT_TRUE(outputs.count("result.json"));
    EXPECT_TRUE(outputs.count("notes.txt"));
    EXPECT_FALSE(outputs.count("weights.bin"));
    EXPECT_EQ(results.output_files().size(), 3u) << "Listing still shows every file";
}

TEST_F(JobResultsTest, Logs_PresentAndAbsent) {
    JobResults results(results_dir);
    EXPECT_FALSE(results.stdout_text().has_value());

    write("logs/stdout.log", "Starting job...\nhello\n");
    EXPECT_EQ(results.stdout_text().value_or(""), "Starting job...\nhello\n");
    EXPECT_EQ(results.log_files().size(), 1u);
}

TEST_F(JobResultsTest, Manifest_HashesOutputs) {
    write("output/result.json", "{}");

    auto manifest = JobResults(results_dir).output_manifest();

    ASSERT_EQ(manifest.size(), 1u);
    EXPECT_EQ(manifest.at("result.json").sha256_hash, FileUtils::sha256_string("{}"));
}

TEST_F(JobResultsTest, ParseCsv_EdgeCases) {
    EXPECT_TRUE(parse_csv("").empty());
    EXPECT_EQ(parse_csv("a,,c"), (CsvTable{{"a", "", "c"}}));
    EXPECT_EQ(parse_csv("x\n\ny\n"), (CsvTable{{"x"}, {"y"}})) << "Blank lines are skipped";
}

} // namespace
} // namespace gaprun
