#pragma once

#include <cstddef>  // for size_t

namespace gaprun {

// Job execution
constexpr int DEFAULT_JOB_TIMEOUT_SECONDS = 60;                   // Per-job wall clock
constexpr int POLL_INTERVAL_MS = 100;                             // Liveness poll while streaming
constexpr int QUEUE_SCAN_INTERVAL_MS = 1000;                      // Between jobs/ scans

// Interpreter backend rlimits
constexpr size_t MAX_JOB_FILE_SIZE = 100 * 1024 * 1024;           // 100MB per written file
constexpr int MAX_OPEN_FILES = 256;                               // Max file descriptors

// Container backend ceilings
constexpr int ENGINE_CHECK_TIMEOUT_SECONDS = 30;                  // `docker info`, `image inspect`
constexpr int IMAGE_BUILD_TIMEOUT_SECONDS = 1800;                 // `docker build`
constexpr const char* CONTAINER_MEMORY_LIMIT = "1G";
constexpr const char* CONTAINER_CPU_LIMIT = "1";
constexpr int CONTAINER_PIDS_LIMIT = 100;
constexpr const char* CONTAINER_TMPFS = "/tmp:size=16m,noexec,nosuid,nodev";
constexpr const char* CONTAINER_ULIMIT_NPROC = "nproc=4096:4096";
constexpr const char* CONTAINER_ULIMIT_NOFILE = "nofile=50:50";
constexpr const char* CONTAINER_ULIMIT_FSIZE = "fsize=10000000:10000000";

// Paths inside the container
constexpr const char* CONTAINER_WORKDIR = "/app";
constexpr const char* CONTAINER_CODE_DIR = "/app/code";
constexpr const char* CONTAINER_DATA_DIR = "/app/data";
constexpr const char* CONTAINER_OUTPUT_DIR = "/app/output";

// Replication
constexpr int DEFAULT_SYNC_TIMEOUT_SECONDS = 300;                 // 5 minutes per command
constexpr int DEFAULT_SSH_PORT = 22;

// Results
constexpr size_t MAX_LOADED_OUTPUT_BYTES = 10 * 1024 * 1024;      // 10MB max loaded output

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                         // Read buffer size

// Layout names
constexpr const char* RUNTIMES_DIR_NAME = "syft_runtimes";
constexpr const char* DATASETS_DIR_NAME = "syft_datasets";
constexpr const char* SYNC_CONFIG_FILE = "high_side_sync_config.json";
constexpr const char* RUNTIME_CONFIG_FILE = "config.yaml";
constexpr const char* RUNTIME_PROFILE_FILE = "runtime.json";        // high side only

} // namespace gaprun
