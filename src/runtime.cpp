#include "runtime.h"
#include "errors.h"
#include "file_utils.h"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace gaprun {

namespace {

Json::Value string_array(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& v : values) {
        array.append(v);
    }
    return array;
}

std::vector<std::string> read_string_array(const Json::Value& array,
                                           std::vector<std::string> fallback) {
    if (!array.isArray()) {
        return fallback;
    }
    std::vector<std::string> values;
    for (const auto& v : array) {
        values.push_back(v.asString());
    }
    return values;
}

Json::Value optional_string(const std::optional<std::string>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

std::optional<std::string> read_optional_string(const Json::Value& value) {
    if (value.isString()) {
        return value.asString();
    }
    return std::nullopt;
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// Normalises in place and throws on invalid values
void validate_config(RuntimeConfig& config) {
    if (auto* interp = std::get_if<InterpreterConfig>(&config)) {
        if (interp->cmd.empty()) {
            throw ValidationError("interpreter runtime needs a command");
        }
    } else if (auto* container = std::get_if<ContainerConfig>(&config)) {
        container->dockerfile_content = trim(container->dockerfile_content);
        if (container->dockerfile_content.empty()) {
            throw ValidationError("Dockerfile cannot be empty");
        }
        for (const auto& mount : container->extra_mounts) {
            if (mount.mode != "ro" && mount.mode != "rw") {
                throw ValidationError("mount mode must be 'ro' or 'rw', got '" + mount.mode + "'");
            }
            if (mount.source.empty() || mount.target.empty()) {
                throw ValidationError("mount needs both source and target");
            }
        }
    } else if (auto* cluster = std::get_if<ClusterConfig>(&config)) {
        if (cluster->image.empty()) {
            throw ValidationError("cluster runtime needs an image");
        }
        if (cluster->num_workers < 1) {
            throw ValidationError("cluster runtime needs at least one worker");
        }
    }
}

} // namespace

std::string runtime_kind_to_string(RuntimeKind kind) {
    switch (kind) {
        case RuntimeKind::INTERPRETER: return "python";
        case RuntimeKind::CONTAINER: return "docker";
        case RuntimeKind::CLUSTER: return "kubernetes";
    }
    return "python";
}

RuntimeKind parse_runtime_kind(const std::string& value) {
    if (value == "python" || value == "interpreter") {
        return RuntimeKind::INTERPRETER;
    }
    if (value == "docker" || value == "container") {
        return RuntimeKind::CONTAINER;
    }
    if (value == "kubernetes" || value == "cluster") {
        return RuntimeKind::CLUSTER;
    }
    throw ValidationError("unknown runtime kind '" + value + "'");
}

RuntimeKind kind_of(const RuntimeConfig& config) {
    switch (config.index()) {
        case 1: return RuntimeKind::CONTAINER;
        case 2: return RuntimeKind::CLUSTER;
        default: return RuntimeKind::INTERPRETER;
    }
}

Json::Value runtime_config_to_json(const RuntimeConfig& config) {
    Json::Value json(Json::objectValue);

    if (const auto* interp = std::get_if<InterpreterConfig>(&config)) {
        json["cmd"] = string_array(interp->cmd);
        json["version"] = optional_string(interp->version);
        json["requirements_file"] = optional_string(interp->requirements_file);
    } else if (const auto* container = std::get_if<ContainerConfig>(&config)) {
        json["dockerfile_content"] = container->dockerfile_content;
        json["image_name"] = optional_string(container->image_name);
        json["cmd"] = string_array(container->cmd);
        json["app_name"] = optional_string(container->app_name);
        Json::Value mounts(Json::arrayValue);
        for (const auto& mount : container->extra_mounts) {
            Json::Value m;
            m["source"] = mount.source;
            m["target"] = mount.target;
            m["mode"] = mount.mode;
            mounts.append(m);
        }
        json["extra_mounts"] = mounts;
    } else if (const auto* cluster = std::get_if<ClusterConfig>(&config)) {
        json["image"] = cluster->image;
        json["namespace"] = cluster->namespace_name;
        json["num_workers"] = cluster->num_workers;
        json["cmd"] = string_array(cluster->cmd);
    }

    return json;
}

RuntimeConfig runtime_config_from_json(RuntimeKind kind, const Json::Value& json) {
    switch (kind) {
        case RuntimeKind::INTERPRETER: {
            InterpreterConfig config;
            config.cmd = read_string_array(json["cmd"], config.cmd);
            config.version = read_optional_string(json["version"]);
            config.requirements_file = read_optional_string(json["requirements_file"]);
            return config;
        }
        case RuntimeKind::CONTAINER: {
            ContainerConfig config;
            config.dockerfile_content = json.get("dockerfile_content", "").asString();
            config.image_name = read_optional_string(json["image_name"]);
            config.cmd = read_string_array(json["cmd"], config.cmd);
            config.app_name = read_optional_string(json["app_name"]);
            for (const auto& m : json["extra_mounts"]) {
                ContainerMount mount;
                mount.source = m.get("source", "").asString();
                mount.target = m.get("target", "").asString();
                mount.mode = m.get("mode", "ro").asString();
                config.extra_mounts.push_back(mount);
            }
            return config;
        }
        case RuntimeKind::CLUSTER: {
            ClusterConfig config;
            config.image = json.get("image", "").asString();
            config.namespace_name = json.get("namespace", config.namespace_name).asString();
            config.num_workers = json.get("num_workers", config.num_workers).asInt();
            config.cmd = read_string_array(json["cmd"], config.cmd);
            return config;
        }
    }
    throw ValidationError("unknown runtime kind");
}

std::string Runtime::derive_name(const RuntimeConfig& config) {
    // Compact writer; jsoncpp emits object keys in sorted order
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::string canonical = Json::writeString(builder, runtime_config_to_json(config));

    return runtime_kind_to_string(kind_of(config)) + "_" +
           FileUtils::sha256_string(canonical).substr(0, 6);
}

namespace {

// "<kind>_<6 lowercase hex>", the shape derive_name produces
bool has_derived_form(const std::string& name) {
    for (RuntimeKind kind : {RuntimeKind::INTERPRETER, RuntimeKind::CONTAINER, RuntimeKind::CLUSTER}) {
        std::string prefix = runtime_kind_to_string(kind) + "_";
        if (name.size() == prefix.size() + 6 && name.compare(0, prefix.size(), prefix) == 0) {
            return std::all_of(name.begin() + prefix.size(), name.end(), [](unsigned char c) {
                return std::isdigit(c) || (c >= 'a' && c <= 'f');
            });
        }
    }
    return false;
}

// Explicit names are free-form, but a derived-looking name must match the config
void check_name(const std::string& name, const RuntimeConfig& config) {
    if (!has_derived_form(name)) {
        return;
    }
    std::string derived = Runtime::derive_name(config);
    if (name != derived) {
        throw ValidationError("runtime name '" + name + "' does not match its configuration (expected '" +
                              derived + "')");
    }
}

} // namespace

Runtime Runtime::create(RuntimeConfig config,
                        const std::string& name,
                        std::vector<std::string> tags,
                        std::string description) {
    validate_config(config);

    if (const auto* interp = std::get_if<InterpreterConfig>(&config)) {
        if (interp->requirements_file &&
            !std::filesystem::exists(*interp->requirements_file)) {
            throw PathNotFoundError("Requirements file '" + *interp->requirements_file +
                                    "' does not exist");
        }
    }

    if (!name.empty()) {
        check_name(name, config);
    }

    Runtime runtime;
    runtime.name_ = name.empty() ? derive_name(config) : name;
    runtime.config_ = std::move(config);
    runtime.tags_ = std::move(tags);
    runtime.description_ = std::move(description);
    return runtime;
}

RuntimeKind Runtime::kind() const {
    return kind_of(config_);
}

const std::vector<std::string>& Runtime::cmd() const {
    if (const auto* container = std::get_if<ContainerConfig>(&config_)) {
        return container->cmd;
    }
    if (const auto* cluster = std::get_if<ClusterConfig>(&config_)) {
        return cluster->cmd;
    }
    return std::get<InterpreterConfig>(config_).cmd;
}

Json::Value Runtime::to_json() const {
    Json::Value json;
    json["name"] = name_;
    json["kind"] = runtime_kind_to_string(kind());
    json["config"] = runtime_config_to_json(config_);
    json["tags"] = string_array(tags_);
    json["description"] = description_;
    return json;
}

Runtime Runtime::from_json(const Json::Value& json) {
    if (!json.isObject()) {
        throw ValidationError("runtime record is not a JSON object");
    }

    Runtime runtime;
    runtime.config_ = runtime_config_from_json(
        parse_runtime_kind(json.get("kind", "python").asString()), json["config"]);
    validate_config(runtime.config_);

    runtime.name_ = json.get("name", "").asString();
    if (runtime.name_.empty()) {
        runtime.name_ = derive_name(runtime.config_);
    } else {
        check_name(runtime.name_, runtime.config_);
    }
    runtime.tags_ = read_string_array(json["tags"], {});
    runtime.description_ = json.get("description", "").asString();
    return runtime;
}

} // namespace gaprun
