#pragma once

#include <string>
#include <filesystem>
#include <map>
#include <vector>
#include <json/json.h>

namespace gaprun {

// Output file categories understood by the results loader
enum class FileType {
    JSON,       // .json
    CSV,        // .csv
    PARQUET,    // .parquet
    TEXT,       // .txt, .log, .md, .html
    OTHER       // Unknown/other types
};

// File metadata with hash (output manifests)
struct FileMetadata {
    std::string path;
    size_t size_bytes;
    std::string sha256_hash;
    FileType type;
};

class FileUtils {
public:
    // Detect file type based on extension
    static FileType detect_file_type(const std::string& filename);

    // Get human-readable file type name
    static std::string file_type_to_string(FileType type);

    // True when the last path segment carries a ".ext" suffix
    static bool has_file_suffix(const std::string& path);

    // Check if path matches glob pattern (e.g., "*.png")
    static bool matches_pattern(const std::string& path, const std::string& pattern);

    // Hash utilities
    static std::string sha256_file(const std::string& filepath);
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Cryptographically random hex string of 2 * num_bytes characters
    static std::string random_hex(size_t num_bytes);

    // Get file metadata with hash
    static FileMetadata get_file_metadata(const std::string& filepath);

    // Get metadata for all files in directory (recursive)
    static std::map<std::string, FileMetadata> hash_directory(
        const std::string& dirpath,
        const std::vector<std::string>& patterns = {}  // e.g., {"*.csv", "*.json"}
    );

    // Whole-file IO; throw GaprunError on failure
    static std::string read_text_file(const std::filesystem::path& path);
    static void write_text_file(const std::filesystem::path& path, const std::string& content);
    static Json::Value read_json_file(const std::filesystem::path& path);
    static void write_json_file(const std::filesystem::path& path, const Json::Value& value);

private:
    static const std::map<std::string, FileType> extension_map_;
    static const std::map<FileType, std::string> type_name_map_;
};

} // namespace gaprun
