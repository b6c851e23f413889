#include "job_results.h"
#include "errors.h"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace gaprun {

namespace fs = std::filesystem;

namespace {

std::vector<fs::path> list_dir(const fs::path& dir) {
    std::vector<fs::path> files;
    if (!fs::is_directory(dir)) {
        return files;
    }
    for (const auto& entry : fs::directory_iterator(dir)) {
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::optional<std::string> read_if_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        return std::nullopt;
    }
    return FileUtils::read_text_file(path);
}

} // namespace

JobResults::JobResults(fs::path results_dir) : results_dir_(std::move(results_dir)) {}

std::optional<std::string> JobResults::stdout_text() const {
    return read_if_exists(stdout_file());
}

std::optional<std::string> JobResults::stderr_text() const {
    return read_if_exists(stderr_file());
}

std::vector<fs::path> JobResults::log_files() const {
    return list_dir(logs_dir());
}

std::vector<fs::path> JobResults::output_files() const {
    return list_dir(output_dir());
}

std::map<std::string, LoadedOutput> JobResults::outputs() const {
    std::map<std::string, LoadedOutput> loaded;
    for (const auto& file : output_files()) {
        if (!fs::is_regular_file(file)) {
            continue;
        }
        try {
            loaded.emplace(file.filename().string(), load_output_file(file));
        } catch (const UnsupportedFileTypeError& e) {
            std::cerr << "[JobResults] Skipping output " << file.filename().string() << ": "
                      << e.what() << ". Please load this file manually." << std::endl;
        } catch (const OutputTooLargeError& e) {
            std::cerr << "[JobResults] Skipping output " << file.filename().string() << ": "
                      << e.what() << ". Please load this file manually." << std::endl;
        }
    }
    return loaded;
}

std::map<std::string, FileMetadata> JobResults::output_manifest() const {
    return FileUtils::hash_directory(output_dir().string());
}

LoadedOutput load_output_file(const fs::path& path, size_t max_size) {
    if (!fs::exists(path)) {
        throw PathNotFoundError("File " + path.string() + " does not exist.");
    }

    size_t size = fs::file_size(path);
    if (size > max_size) {
        throw OutputTooLargeError("File " + path.filename().string() + " exceeds the maximum size of " +
                                  std::to_string(max_size / (1024 * 1024)) + " MB.");
    }

    switch (FileUtils::detect_file_type(path.string())) {
        case FileType::JSON:
            return LoadedOutput(std::in_place_type<Json::Value>, FileUtils::read_json_file(path));
        case FileType::CSV:
            return LoadedOutput(std::in_place_type<CsvTable>, parse_csv(FileUtils::read_text_file(path)));
        case FileType::PARQUET: {
            // Decoding is left to the consumer
            std::string raw = FileUtils::read_text_file(path);
            return LoadedOutput(std::in_place_type<Bytes>, raw.begin(), raw.end());
        }
        case FileType::TEXT:
            return LoadedOutput(std::in_place_type<std::string>, FileUtils::read_text_file(path));
        case FileType::OTHER:
            break;
    }
    throw UnsupportedFileTypeError(path.filename().string());
}

CsvTable parse_csv(const std::string& text) {
    CsvTable rows;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool row_has_data = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                row_has_data = true;
                break;
            case ',':
                row.push_back(field);
                field.clear();
                row_has_data = true;
                break;
            case '\r':
                break;
            case '\n':
                if (row_has_data || !field.empty()) {
                    row.push_back(field);
                    rows.push_back(row);
                }
                row.clear();
                field.clear();
                row_has_data = false;
                break;
            default:
                field += c;
                row_has_data = true;
        }
    }

    if (row_has_data || !field.empty()) {
        row.push_back(field);
        rows.push_back(row);
    }
    return rows;
}

} // namespace gaprun
