#include "sandbox.h"
#include "constants.h"
#include "errors.h"
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <seccomp.h>
#include <chrono>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <iostream>

namespace gaprun {

namespace fs = std::filesystem;

namespace {

std::string join(const std::vector<std::string>& parts) {
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) {
            joined += " ";
        }
        joined += part;
    }
    return joined;
}

// Runs in the forked child
void apply_resource_limits(int timeout_seconds) {
    struct rlimit limit;

    // CPU time limit; wall clock is enforced by the parent
    limit.rlim_cur = limit.rlim_max = static_cast<rlim_t>(timeout_seconds) + 1;
    setrlimit(RLIMIT_CPU, &limit);

    // File size limit
    limit.rlim_cur = limit.rlim_max = MAX_JOB_FILE_SIZE;
    setrlimit(RLIMIT_FSIZE, &limit);

    // File descriptor limit
    limit.rlim_cur = limit.rlim_max = MAX_OPEN_FILES;
    setrlimit(RLIMIT_NOFILE, &limit);
}

// Runs in the forked child. IPv4/IPv6 sockets fail with EACCES; local
// sockets stay available to the interpreter.
void deny_network_sockets() {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) {
        fprintf(stderr, "[Sandbox] Warning: seccomp unavailable, network not filtered\n");
        return;
    }

    int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                              SCMP_A0(SCMP_CMP_EQ, AF_INET));
    if (rc == 0) {
        rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                              SCMP_A0(SCMP_CMP_EQ, AF_INET6));
    }
    if (rc == 0) {
        rc = seccomp_load(ctx);
    }
    if (rc != 0) {
        fprintf(stderr, "[Sandbox] Warning: failed to load seccomp filter (%d)\n", rc);
    }
    seccomp_release(ctx);
}

void dispatch_lines(ChildProcess& child, const RunnerHooks& hooks, std::string& stderr_log) {
    while (true) {
        auto out_line = child.next_stdout_line();
        auto err_line = child.next_stderr_line();
        if (!out_line && !err_line) {
            return;
        }
        if (err_line) {
            stderr_log += *err_line;
        }
        for (const auto& handler : hooks.handlers) {
            handler->on_progress(out_line.value_or(""), err_line.value_or(""));
        }
    }
}

RunResult stream_to_completion(ChildProcess& child, const JobConfig& config,
                               const RunnerHooks& hooks, const std::function<void()>& on_timeout) {
    RunResult result;
    std::string stderr_log;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config.timeout);

    while (true) {
        child.read_available();
        dispatch_lines(child, hooks, stderr_log);

        if (child.poll()) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            std::cerr << "[Sandbox] Job exceeded " << config.timeout
                      << "s, killing pid " << child.pid() << std::endl;
            child.kill();
            child.wait();
            if (on_timeout) {
                on_timeout();
            }
            result.timed_out = true;
            break;
        }
        child.wait_readable(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }

    // Flush remaining output
    child.read_available();
    dispatch_lines(child, hooks, stderr_log);
    std::string rest_out = child.take_stdout();
    std::string rest_err = child.take_stderr();
    if (!rest_out.empty() || !rest_err.empty()) {
        stderr_log += rest_err;
        for (const auto& handler : hooks.handlers) {
            handler->on_progress(rest_out, rest_err);
        }
    }

    result.exit_code = child.wait();
    if (!stderr_log.empty()) {
        result.error_message = stderr_log;
    }

    for (const auto& handler : hooks.handlers) {
        handler->on_completion(result.exit_code);
    }
    return result;
}

std::string mount_arg(const std::string& source, const std::string& target, const std::string& mode) {
    return fs::absolute(source).lexically_normal().string() + ":" + target + ":" + mode;
}

} // namespace

void validate_paths(const JobConfig& config) {
    if (!fs::exists(config.function_folder)) {
        throw PathNotFoundError("Function folder " + config.function_folder.string() +
                                " does not exist");
    }
    if (!fs::exists(config.data_path)) {
        throw PathNotFoundError("Dataset folder " + config.data_path.string() +
                                " does not exist");
    }
}

void prepare_job_folders(const JobConfig& config) {
    fs::create_directories(config.logs_dir());
    fs::create_directories(config.output_dir());
    fs::permissions(config.output_dir(), fs::perms::all, fs::perm_options::replace);
}

RunResult launch_job(const ProcessOptions& options, const JobConfig& config,
                     const RunnerHooks& hooks, const std::function<void()>& on_timeout) {
    if (hooks.on_status) {
        JobUpdate update;
        update.status = JobStatus::IN_PROGRESS;
        update.error = JobErrorKind::NO_ERROR;
        hooks.on_status(update);
    }

    for (const auto& handler : hooks.handlers) {
        handler->on_start(config);
    }

    auto child = ChildProcess::spawn(options);
    std::cout << "[Sandbox] Started pid " << child->pid() << ": " << join(options.argv)
              << (config.blocking ? "" : " (non-blocking)") << std::endl;

    if (!config.blocking) {
        RunResult result;
        result.process = std::move(child);
        return result;
    }
    return stream_to_completion(*child, config, hooks, on_timeout);
}

// ============================================================================
// InterpreterRunner
// ============================================================================

InterpreterRunner::InterpreterRunner(RunnerHooks hooks) : hooks_(std::move(hooks)) {}

std::vector<std::string> InterpreterRunner::build_command(const JobConfig& config) {
    std::vector<std::string> cmd = config.runtime.cmd();
    cmd.push_back((config.function_folder / config.args.at(0)).string());
    cmd.insert(cmd.end(), config.args.begin() + 1, config.args.end());
    return cmd;
}

RunResult InterpreterRunner::run(const JobConfig& config) {
    config.validate();
    validate_paths(config);
    prepare_job_folders(config);

    ProcessOptions options;
    options.argv = build_command(config);
    options.env = config.env();
    int timeout = config.timeout;
    options.child_setup = [timeout]() {
        apply_resource_limits(timeout);
        deny_network_sockets();
    };

    return launch_job(options, config, hooks_);
}

// ============================================================================
// ContainerRunner
// ============================================================================

ContainerRunner::ContainerRunner(RunnerHooks hooks,
                                 std::shared_ptr<MountProviderRegistry> mounts,
                                 std::string engine)
    : hooks_(std::move(hooks)), mounts_(std::move(mounts)), engine_(std::move(engine)) {}

std::string ContainerRunner::image_name(const JobConfig& config) {
    const auto* container = std::get_if<ContainerConfig>(&config.runtime.config());
    if (container && container->image_name && !container->image_name->empty()) {
        return *container->image_name;
    }
    return config.runtime.name();
}

std::string ContainerRunner::container_name(const JobConfig& config) {
    std::string name = "gaprun-";
    for (char c : config.job_folder.filename().string()) {
        name += (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-') ? c : '-';
    }
    return name;
}

std::vector<std::string> ContainerRunner::build_command(
    const JobConfig& config,
    const std::vector<ContainerMount>& provider_mounts,
    const std::string& engine) {
    const std::string code_target = CONTAINER_CODE_DIR;
    const std::string entrypoint = code_target + "/" + config.args.at(0);

    std::vector<std::string> cmd = {
        engine, "run", "--rm",
        "--name", container_name(config),
        // Security constraints
        "--cap-drop", "ALL",
        "--network", "none",
        "--tmpfs", CONTAINER_TMPFS,
        // Resource limits
        "--memory", CONTAINER_MEMORY_LIMIT,
        "--cpus", CONTAINER_CPU_LIMIT,
        "--pids-limit", std::to_string(CONTAINER_PIDS_LIMIT),
        "--ulimit", CONTAINER_ULIMIT_NPROC,
        "--ulimit", CONTAINER_ULIMIT_NOFILE,
        "--ulimit", CONTAINER_ULIMIT_FSIZE,
        // Environment
        "-e", "TIMEOUT=" + std::to_string(config.timeout),
        "-e", "DATA_DIR=" + config.data_mount_dir,
        "-e", std::string("OUTPUT_DIR=") + CONTAINER_OUTPUT_DIR,
        "-e", "INTERPRETER=" + join(config.runtime.cmd()),
        "-e", "INPUT_FILE=" + entrypoint,
    };
    for (const auto& [key, value] : config.extra_env) {
        cmd.push_back("-e");
        cmd.push_back(key + "=" + value);
    }

    cmd.push_back("-v");
    cmd.push_back(mount_arg(config.function_folder.string(), code_target, "ro"));
    cmd.push_back("-v");
    cmd.push_back(mount_arg(config.data_path.string(), config.data_mount_dir, "ro"));
    cmd.push_back("-v");
    cmd.push_back(mount_arg(config.output_dir().string(), CONTAINER_OUTPUT_DIR, "rw"));

    std::vector<ContainerMount> extra;
    if (const auto* container = std::get_if<ContainerConfig>(&config.runtime.config())) {
        extra = container->extra_mounts;
    }
    extra.insert(extra.end(), provider_mounts.begin(), provider_mounts.end());
    for (const auto& mount : extra) {
        if (!fs::exists(mount.source)) {
            std::cerr << "[Sandbox] Warning: mount source does not exist: " << mount.source << std::endl;
        }
        cmd.push_back("-v");
        cmd.push_back(mount_arg(mount.source, mount.target, mount.mode));
    }

    cmd.push_back("--workdir");
    cmd.push_back(CONTAINER_WORKDIR);
    cmd.push_back(image_name(config));
    cmd.push_back(entrypoint);
    cmd.insert(cmd.end(), config.args.begin() + 1, config.args.end());
    return cmd;
}

void ContainerRunner::check_engine() const {
    CommandResult result = run_command({engine_, "info"},
                                       std::chrono::seconds(ENGINE_CHECK_TIMEOUT_SECONDS));
    if (result.exit_code != 0) {
        throw SandboxUnavailableError(engine_ + " daemon is not running: " +
                                      (result.timed_out ? std::string("timed out")
                                                        : result.stderr_output));
    }
}

void ContainerRunner::ensure_image(const JobConfig& config) const {
    std::string image = image_name(config);
    CommandResult inspect = run_command({engine_, "image", "inspect", image},
                                        std::chrono::seconds(ENGINE_CHECK_TIMEOUT_SECONDS));
    if (inspect.exit_code == 0) {
        std::cout << "[Sandbox] Image '" << image << "' already exists" << std::endl;
        return;
    }

    const auto* container = std::get_if<ContainerConfig>(&config.runtime.config());
    if (!container) {
        throw ValidationError("runtime " + config.runtime.name() + " is not a container runtime");
    }

    std::cout << "[Sandbox] Image '" << image << "' not found, building" << std::endl;
    CommandResult build = run_command({engine_, "build", "-t", image, "-f", "-", "."},
                                      std::chrono::seconds(IMAGE_BUILD_TIMEOUT_SECONDS),
                                      container->dockerfile_content);
    if (build.exit_code != 0) {
        std::cerr << "[Sandbox] Failed to build image '" << image << "': "
                  << build.stderr_output << std::endl;
        throw BuildFailureError("Failed to build image '" + image + "'.\n" + build.stderr_output);
    }
    std::cout << "[Sandbox] Built image '" << image << "'" << std::endl;
}

std::vector<ContainerMount> ContainerRunner::provider_mounts(const JobConfig& config) const {
    const auto* container = std::get_if<ContainerConfig>(&config.runtime.config());
    if (!mounts_ || !container || !container->app_name) {
        return {};
    }
    auto provider = mounts_->find(*container->app_name);
    if (!provider) {
        return {};
    }
    return provider->get_mounts(config);
}

RunResult ContainerRunner::run(const JobConfig& config) {
    config.validate();
    validate_paths(config);
    prepare_job_folders(config);

    check_engine();
    ensure_image(config);

    ProcessOptions options;
    options.argv = build_command(config, provider_mounts(config), engine_);

    // Killing the client leaves the daemon-owned container running
    std::string engine = engine_;
    std::string name = container_name(config);
    return launch_job(options, config, hooks_, [engine, name]() {
        std::cerr << "[Sandbox] Killing container " << name << std::endl;
        CommandResult killed = run_command({engine, "kill", name},
                                           std::chrono::seconds(ENGINE_CHECK_TIMEOUT_SECONDS));
        if (killed.exit_code != 0) {
            std::cerr << "[Sandbox] Failed to kill container " << name << ": "
                      << (killed.timed_out ? std::string("timed out") : killed.stderr_output) << std::endl;
        }
    });
}

// ============================================================================
// ClusterRunner
// ============================================================================

ClusterRunner::ClusterRunner(RunnerHooks hooks) : hooks_(std::move(hooks)) {}

RunResult ClusterRunner::run(const JobConfig& config) {
    config.validate();
    validate_paths(config);

    const auto* cluster = std::get_if<ClusterConfig>(&config.runtime.config());
    if (!cluster) {
        throw ValidationError("runtime " + config.runtime.name() + " is not a cluster runtime");
    }
    throw SandboxUnavailableError("cluster submission to namespace '" + cluster->namespace_name +
                                  "' is not supported by this build");
}

std::unique_ptr<JobRunner> make_runner(RuntimeKind kind, RunnerHooks hooks,
                                       std::shared_ptr<MountProviderRegistry> mounts) {
    switch (kind) {
        case RuntimeKind::INTERPRETER:
            return std::make_unique<InterpreterRunner>(std::move(hooks));
        case RuntimeKind::CONTAINER:
            return std::make_unique<ContainerRunner>(std::move(hooks), std::move(mounts));
        case RuntimeKind::CLUSTER:
            return std::make_unique<ClusterRunner>(std::move(hooks));
    }
    throw ValidationError("unsupported runtime kind");
}

} // namespace gaprun
