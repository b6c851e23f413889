#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <json/json.h>
#include "constants.h"
#include "file_utils.h"

namespace gaprun {

using CsvTable = std::vector<std::vector<std::string>>;
using Bytes = std::vector<unsigned char>;

// JSON document, CSV rows, raw parquet bytes, or text
using LoadedOutput = std::variant<Json::Value, CsvTable, Bytes, std::string>;

// Read-only view over a finished job's folder ({logs,output}/)
class JobResults {
public:
    explicit JobResults(std::filesystem::path results_dir);

    const std::filesystem::path& results_dir() const { return results_dir_; }
    std::filesystem::path logs_dir() const { return results_dir_ / "logs"; }
    std::filesystem::path output_dir() const { return results_dir_ / "output"; }
    std::filesystem::path stdout_file() const { return logs_dir() / "stdout.log"; }
    std::filesystem::path stderr_file() const { return logs_dir() / "stderr.log"; }

    std::optional<std::string> stdout_text() const;
    std::optional<std::string> stderr_text() const;

    std::vector<std::filesystem::path> log_files() const;
    std::vector<std::filesystem::path> output_files() const;

    // Every loadable output keyed by file name; unsupported or oversized
    // files are skipped with a warning
    std::map<std::string, LoadedOutput> outputs() const;

    // SHA-256 manifest of output/, keyed by relative path
    std::map<std::string, FileMetadata> output_manifest() const;

private:
    std::filesystem::path results_dir_;
};

// Throws PathNotFoundError, OutputTooLargeError, UnsupportedFileTypeError
LoadedOutput load_output_file(const std::filesystem::path& path,
                              size_t max_size = MAX_LOADED_OUTPUT_BYTES);

// Minimal RFC 4180 reader: quoted fields, doubled quotes, CRLF
CsvTable parse_csv(const std::string& text);

} // namespace gaprun
