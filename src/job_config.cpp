#include "job_config.h"
#include "errors.h"

namespace gaprun {

std::map<std::string, std::string> JobConfig::base_env() const {
    namespace fs = std::filesystem;

    std::string interpreter;
    for (const auto& part : runtime.cmd()) {
        if (!interpreter.empty()) {
            interpreter += " ";
        }
        interpreter += part;
    }

    return {
        {"OUTPUT_DIR", fs::absolute(output_dir()).string()},
        {"DATA_DIR", fs::absolute(data_path).string()},
        {"CODE_DIR", fs::absolute(function_folder).string()},
        {"TIMEOUT", std::to_string(timeout)},
        {"INPUT_FILE", (function_folder / (args.empty() ? "" : args[0])).string()},
        {"INTERPRETER", interpreter},
    };
}

std::map<std::string, std::string> JobConfig::env() const {
    std::map<std::string, std::string> merged = extra_env;
    for (const auto& [key, value] : base_env()) {
        merged[key] = value;
    }
    return merged;
}

void JobConfig::validate() const {
    if (args.empty()) {
        throw ValidationError("job needs at least an entrypoint argument");
    }
    if (timeout <= 0) {
        throw ValidationError("timeout must be positive");
    }
    if (job_folder.empty()) {
        throw ValidationError("job folder is not set");
    }
}

} // namespace gaprun
