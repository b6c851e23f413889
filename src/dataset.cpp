#include "dataset.h"
#include "constants.h"
#include "errors.h"
#include "file_utils.h"
#include "job_model.h"
#include <algorithm>
#include <iostream>
#include <yaml-cpp/yaml.h>

namespace gaprun {

namespace fs = std::filesystem;

namespace {

constexpr const char* METADATA_FILE = "dataset.yaml";
constexpr const char* PRIVATE_METADATA_FILE = "private_metadata.yaml";

void copy_into(const fs::path& source, const fs::path& target_dir) {
    if (!fs::exists(source)) {
        throw PathNotFoundError("Path " + source.string() + " does not exist");
    }
    fs::create_directories(target_dir);
    if (fs::is_directory(source)) {
        fs::copy(source, target_dir, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
    } else {
        fs::copy_file(source, target_dir / source.filename(), fs::copy_options::overwrite_existing);
    }
}

void write_yaml(const fs::path& path, const YAML::Emitter& out) {
    if (!out.good()) {
        throw ConfigError("cannot serialise " + path.string() + ": " + out.GetLastError());
    }
    FileUtils::write_text_file(path, std::string(out.c_str()) + "\n");
}

} // namespace

DatasetStore::DatasetStore(fs::path root, std::string identity)
    : root_(std::move(root)), identity_(std::move(identity)) {}

fs::path DatasetStore::public_datasets_dir() const {
    return root_ / "public" / DATASETS_DIR_NAME;
}

fs::path DatasetStore::public_dataset_dir(const std::string& name) const {
    return public_datasets_dir() / name;
}

fs::path DatasetStore::private_datasets_dir(const std::string& owner) const {
    return root_ / "private" / owner / DATASETS_DIR_NAME;
}

Dataset DatasetStore::create(const std::string& name,
                             const fs::path& mock_source,
                             const fs::path& private_source,
                             const std::optional<fs::path>& readme,
                             const std::string& summary,
                             const std::vector<std::string>& tags) {
    if (name.empty() || name.find('/') != std::string::npos) {
        throw ValidationError("invalid dataset name '" + name + "'");
    }
    if (exists(name)) {
        throw GaprunError("Dataset '" + name + "' already exists");
    }
    if (!fs::exists(mock_source)) {
        throw PathNotFoundError("Mock data " + mock_source.string() + " does not exist");
    }
    if (!fs::exists(private_source)) {
        throw PathNotFoundError("Private data " + private_source.string() + " does not exist");
    }

    Dataset dataset;
    dataset.uid = FileUtils::random_hex(16);
    dataset.name = name;
    dataset.owner = identity_;
    dataset.summary = summary;
    dataset.tags = tags;
    dataset.created_at = current_timestamp();

    fs::path public_dir = public_dataset_dir(name);
    fs::path private_dir = private_datasets_dir(identity_) / name;

    copy_into(mock_source, public_dir / "mock");
    copy_into(private_source, private_dir / "data");
    dataset.mock_dir = public_dir / "mock";

    if (readme) {
        fs::copy_file(*readme, public_dir / "README.md", fs::copy_options::overwrite_existing);
        dataset.readme_path = public_dir / "README.md";
    }

    YAML::Emitter meta;
    meta << YAML::BeginMap;
    meta << YAML::Key << "uid" << YAML::Value << dataset.uid;
    meta << YAML::Key << "name" << YAML::Value << dataset.name;
    meta << YAML::Key << "owner" << YAML::Value << dataset.owner;
    meta << YAML::Key << "summary" << YAML::Value << dataset.summary;
    meta << YAML::Key << "tags" << YAML::Value << YAML::BeginSeq;
    for (const auto& tag : dataset.tags) {
        meta << tag;
    }
    meta << YAML::EndSeq;
    meta << YAML::Key << "created_at" << YAML::Value << dataset.created_at;
    meta << YAML::EndMap;
    write_yaml(public_dir / METADATA_FILE, meta);

    YAML::Emitter priv;
    priv << YAML::BeginMap;
    priv << YAML::Key << "uid" << YAML::Value << dataset.uid;
    priv << YAML::Key << "data_dir" << YAML::Value << fs::absolute(private_dir / "data").string();
    priv << YAML::EndMap;
    write_yaml(private_dir / PRIVATE_METADATA_FILE, priv);

    std::cout << "[Datasets] Created dataset '" << name << "' owned by " << identity_ << std::endl;
    return dataset;
}

bool DatasetStore::exists(const std::string& name) const {
    return fs::exists(public_dataset_dir(name) / METADATA_FILE);
}

Dataset DatasetStore::get(const std::string& name) const {
    fs::path dir = public_dataset_dir(name);
    if (!fs::exists(dir / METADATA_FILE)) {
        throw DatasetNotFoundError(name);
    }

    Dataset dataset;
    try {
        YAML::Node node = YAML::LoadFile((dir / METADATA_FILE).string());
        dataset.uid = node["uid"].as<std::string>("");
        dataset.name = node["name"].as<std::string>(name);
        dataset.owner = node["owner"].as<std::string>("");
        dataset.summary = node["summary"].as<std::string>("");
        if (node["tags"] && node["tags"].IsSequence()) {
            dataset.tags = node["tags"].as<std::vector<std::string>>();
        }
        dataset.created_at = node["created_at"].as<std::string>("");
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot read dataset '" + name + "': " + e.what());
    }

    dataset.mock_dir = dir / "mock";
    if (fs::exists(dir / "README.md")) {
        dataset.readme_path = dir / "README.md";
    }
    return dataset;
}

std::vector<Dataset> DatasetStore::list() const {
    std::vector<Dataset> datasets;
    if (!fs::is_directory(public_datasets_dir())) {
        return datasets;
    }
    for (const auto& entry : fs::directory_iterator(public_datasets_dir())) {
        if (entry.is_directory() && fs::exists(entry.path() / METADATA_FILE)) {
            datasets.push_back(get(entry.path().filename().string()));
        }
    }
    std::sort(datasets.begin(), datasets.end(),
              [](const Dataset& a, const Dataset& b) { return a.name < b.name; });
    return datasets;
}

fs::path DatasetStore::private_dir(const std::string& name) const {
    Dataset dataset = get(name);
    if (dataset.owner != identity_) {
        throw PermissionError("'" + identity_ + "' does not own dataset '" + name + "'");
    }

    fs::path metadata = private_datasets_dir(dataset.owner) / name / PRIVATE_METADATA_FILE;
    if (!fs::exists(metadata)) {
        throw PermissionError("private data of dataset '" + name + "' is not available on this side");
    }

    try {
        YAML::Node node = YAML::LoadFile(metadata.string());
        return fs::path(node["data_dir"].as<std::string>());
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot read private metadata of '" + name + "': " + e.what());
    }
}

} // namespace gaprun
