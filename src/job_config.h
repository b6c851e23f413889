#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "constants.h"
#include "runtime.h"

namespace gaprun {

// Execution-time view of a job, assembled at dispatch from Job + Runtime
struct JobConfig {
    std::filesystem::path function_folder;      // code directory
    std::vector<std::string> args;              // args[0] is the entrypoint
    std::filesystem::path data_path;
    Runtime runtime;
    std::filesystem::path job_folder;           // holds logs/ and output/
    int timeout = DEFAULT_JOB_TIMEOUT_SECONDS;
    std::string data_mount_dir = CONTAINER_DATA_DIR;
    std::map<std::string, std::string> extra_env;
    bool blocking = true;

    std::filesystem::path logs_dir() const { return job_folder / "logs"; }
    std::filesystem::path output_dir() const { return job_folder / "output"; }

    // OUTPUT_DIR, DATA_DIR, CODE_DIR, TIMEOUT, INPUT_FILE, INTERPRETER
    std::map<std::string, std::string> base_env() const;

    // extra_env overlaid with base_env; derived variables win on conflict
    std::map<std::string, std::string> env() const;

    // Throws ValidationError
    void validate() const;
};

} // namespace gaprun
