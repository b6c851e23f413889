#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gaprun {

struct Dataset {
    std::string uid;
    std::string name;
    std::string owner;
    std::string summary;
    std::vector<std::string> tags;
    std::string created_at;
    std::filesystem::path mock_dir;
    std::optional<std::filesystem::path> readme_path;
};

// Datasets of one datasite root:
//
//   <root>/public/syft_datasets/<name>/{dataset.yaml, mock/, README.md}
//   <root>/private/<owner>/syft_datasets/<name>/{private_metadata.yaml, data/}
//
// Only the public half is ever replicated to the low side.
class DatasetStore {
public:
    DatasetStore(std::filesystem::path root, std::string identity);

    const std::filesystem::path& root() const { return root_; }
    const std::string& identity() const { return identity_; }

    std::filesystem::path public_datasets_dir() const;
    std::filesystem::path public_dataset_dir(const std::string& name) const;
    std::filesystem::path private_datasets_dir(const std::string& owner) const;

    // mock_source and private_source may be files or directories.
    // Throws GaprunError if the dataset exists, PathNotFoundError for missing sources
    Dataset create(const std::string& name,
                   const std::filesystem::path& mock_source,
                   const std::filesystem::path& private_source,
                   const std::optional<std::filesystem::path>& readme = std::nullopt,
                   const std::string& summary = "",
                   const std::vector<std::string>& tags = {});

    bool exists(const std::string& name) const;

    // Throws DatasetNotFoundError
    Dataset get(const std::string& name) const;

    // Sorted by name
    std::vector<Dataset> list() const;

    // Throws PermissionError unless the caller owns the dataset and this
    // side holds its private metadata
    std::filesystem::path private_dir(const std::string& name) const;

private:
    std::filesystem::path root_;
    std::string identity_;
};

} // namespace gaprun
