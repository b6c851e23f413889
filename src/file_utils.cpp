#include "file_utils.h"
#include "errors.h"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace gaprun {

// Extension to FileType mapping
const std::map<std::string, FileType> FileUtils::extension_map_ = {
    {".json", FileType::JSON},
    {".csv", FileType::CSV},
    {".parquet", FileType::PARQUET},

    // Text
    {".txt", FileType::TEXT},
    {".log", FileType::TEXT},
    {".md", FileType::TEXT},
    {".html", FileType::TEXT},
};

const std::map<FileType, std::string> FileUtils::type_name_map_ = {
    {FileType::JSON, "json"},
    {FileType::CSV, "csv"},
    {FileType::PARQUET, "parquet"},
    {FileType::TEXT, "text"},
    {FileType::OTHER, "other"},
};

FileType FileUtils::detect_file_type(const std::string& filename) {
    // Extension of the last segment only (lowercase)
    std::string ext = std::filesystem::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    auto it = extension_map_.find(ext);
    if (it != extension_map_.end()) {
        return it->second;
    }

    return FileType::OTHER;
}

std::string FileUtils::file_type_to_string(FileType type) {
    auto it = type_name_map_.find(type);
    if (it != type_name_map_.end()) {
        return it->second;
    }
    return "other";
}

bool FileUtils::has_file_suffix(const std::string& path) {
    std::string trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    return !std::filesystem::path(trimmed).extension().empty();
}

bool FileUtils::matches_pattern(const std::string& path, const std::string& pattern) {
    // Simple glob pattern matching
    // Supports: *.ext, prefix*, *suffix, dir/*.ext

    if (pattern == "*") {
        return true;  // Match all
    }

    // Check if pattern has wildcard
    size_t star_pos = pattern.find('*');
    if (star_pos == std::string::npos) {
        // No wildcard - exact match
        return path == pattern;
    }

    // Pattern: *.ext
    if (star_pos == 0 && pattern.find('*', 1) == std::string::npos) {
        std::string suffix = pattern.substr(1);
        return path.size() >= suffix.size() &&
               path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // Pattern: prefix*
    if (star_pos == pattern.size() - 1) {
        std::string prefix = pattern.substr(0, star_pos);
        return path.size() >= prefix.size() &&
               path.compare(0, prefix.size(), prefix) == 0;
    }

    // prefix*suffix
    std::string before_star = pattern.substr(0, star_pos);
    std::string after_star = pattern.substr(star_pos + 1);

    return path.size() >= before_star.size() + after_star.size() &&
           path.compare(0, before_star.size(), before_star) == 0 &&
           path.compare(path.size() - after_star.size(), after_star.size(), after_star) == 0;
}

// Hash utilities implementation

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string FileUtils::sha256_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return "";  // Return empty string on error
    }

    SHA256_CTX ctx;
    SHA256_Init(&ctx);

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        SHA256_Update(&ctx, buffer, file.gcount());
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_Final(hash, &ctx);

    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string FileUtils::random_hex(size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw GaprunError("Failed to generate random bytes");
    }
    return bytes_to_hex(bytes.data(), bytes.size());
}

FileMetadata FileUtils::get_file_metadata(const std::string& filepath) {
    FileMetadata metadata;
    metadata.path = filepath;

    namespace fs = std::filesystem;

    if (!fs::exists(filepath) || !fs::is_regular_file(filepath)) {
        metadata.size_bytes = 0;
        metadata.sha256_hash = "";
        metadata.type = FileType::OTHER;
        return metadata;
    }

    metadata.size_bytes = fs::file_size(filepath);
    metadata.sha256_hash = sha256_file(filepath);
    metadata.type = detect_file_type(filepath);

    return metadata;
}

std::map<std::string, FileMetadata> FileUtils::hash_directory(
    const std::string& dirpath,
    const std::vector<std::string>& patterns
) {
    std::map<std::string, FileMetadata> result;
    namespace fs = std::filesystem;

    if (!fs::exists(dirpath) || !fs::is_directory(dirpath)) {
        return result;
    }

    bool match_all = patterns.empty();

    for (const auto& entry : fs::recursive_directory_iterator(dirpath)) {
        if (!entry.is_regular_file()) {
            continue;
        }

        std::string relpath = fs::relative(entry.path(), dirpath).generic_string();

        bool matches = match_all;
        for (const auto& pattern : patterns) {
            if (matches_pattern(relpath, pattern)) {
                matches = true;
                break;
            }
        }

        if (matches) {
            FileMetadata metadata = get_file_metadata(entry.path().string());
            metadata.path = relpath;  // Store relative path
            result[relpath] = metadata;
        }
    }

    return result;
}

std::string FileUtils::read_text_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw GaprunError("Failed to open " + path.string());
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void FileUtils::write_text_file(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    // Write-then-rename; readers never observe a partial record
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw GaprunError("Failed to write " + path.string());
        }
        file << content;
        if (!file) {
            throw GaprunError("Failed to write " + path.string());
        }
    }
    std::filesystem::rename(tmp, path);
}

Json::Value FileUtils::read_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw GaprunError("Failed to open " + path.string());
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        throw GaprunError("Failed to parse " + path.string() + ": " + errors);
    }
    return root;
}

void FileUtils::write_json_file(const std::filesystem::path& path, const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    write_text_file(path, Json::writeString(builder, value) + "\n");
}

} // namespace gaprun
