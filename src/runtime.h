#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <json/json.h>

namespace gaprun {

enum class RuntimeKind {
    INTERPRETER,    // "python"
    CONTAINER,      // "docker"
    CLUSTER         // "kubernetes"
};

std::string runtime_kind_to_string(RuntimeKind kind);
RuntimeKind parse_runtime_kind(const std::string& value);

struct InterpreterConfig {
    std::vector<std::string> cmd = {"python"};
    std::optional<std::string> version;
    std::optional<std::string> requirements_file;
};

struct ContainerMount {
    std::string source;
    std::string target;
    std::string mode = "ro";        // "ro" or "rw"
};

struct ContainerConfig {
    std::string dockerfile_content;
    std::optional<std::string> image_name;
    std::vector<std::string> cmd = {"python"};
    std::optional<std::string> app_name;    // selects a registered MountProvider
    std::vector<ContainerMount> extra_mounts;
};

struct ClusterConfig {
    std::string image;
    std::string namespace_name = "syft-rds";
    int num_workers = 1;
    std::vector<std::string> cmd;
};

using RuntimeConfig = std::variant<InterpreterConfig, ContainerConfig, ClusterConfig>;

// Named execution profile. Immutable once created; when no name is given it
// is derived from the configuration so identical configs share a name.
class Runtime {
public:
    Runtime() = default;

    // Validates the config and derives the name when `name` is empty.
    // Throws ValidationError, PathNotFoundError
    static Runtime create(RuntimeConfig config,
                          const std::string& name = "",
                          std::vector<std::string> tags = {},
                          std::string description = "");

    // "<kind>_<first 6 hex of sha256(canonical config json)>"
    static std::string derive_name(const RuntimeConfig& config);

    const std::string& name() const { return name_; }
    RuntimeKind kind() const;
    const RuntimeConfig& config() const { return config_; }
    const std::vector<std::string>& cmd() const;
    const std::vector<std::string>& tags() const { return tags_; }
    const std::string& description() const { return description_; }

    Json::Value to_json() const;
    static Runtime from_json(const Json::Value& json);

private:
    std::string name_;
    RuntimeConfig config_;
    std::vector<std::string> tags_;
    std::string description_;
};

RuntimeKind kind_of(const RuntimeConfig& config);
Json::Value runtime_config_to_json(const RuntimeConfig& config);
RuntimeConfig runtime_config_from_json(RuntimeKind kind, const Json::Value& json);

} // namespace gaprun
