#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace gaprun {

// Accumulates raw pipe bytes and hands them out line by line
class LineBuffer {
public:
    void append(const char* data, size_t len) { buffer_.append(data, len); }

    // Next complete line including its '\n'
    std::optional<std::string> next_line();

    // Whatever is left, complete or not
    std::string take_rest();

    bool empty() const { return buffer_.empty(); }

private:
    std::string buffer_;
};

struct ProcessOptions {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;         // overlaid on the inherited environment
    std::optional<std::string> stdin_data;           // stdin is /dev/null otherwise
    std::filesystem::path working_dir;               // empty = inherit
    std::function<void()> child_setup;               // runs in the child before exec
};

// A forked child with non-blocking stdout/stderr pipes. The owner must
// observe completion; the destructor kills a child that is still running.
class ChildProcess {
public:
    // Throws GaprunError when pipes cannot be created or fork fails
    static std::unique_ptr<ChildProcess> spawn(const ProcessOptions& options);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    // Exit code once the child has exited (-signal when killed), non-blocking
    std::optional<int> poll();

    // Blocks until the child exits
    int wait();

    // SIGKILL to the child's process group
    void kill();

    bool running() { return !poll().has_value(); }

    // Drains whatever the pipes hold right now; true if anything was read
    bool read_available();

    // Sleeps until a pipe is readable or the timeout elapses
    void wait_readable(std::chrono::milliseconds timeout);

    std::optional<std::string> next_stdout_line() { return stdout_buffer_.next_line(); }
    std::optional<std::string> next_stderr_line() { return stderr_buffer_.next_line(); }
    std::string take_stdout() { return stdout_buffer_.take_rest(); }
    std::string take_stderr() { return stderr_buffer_.take_rest(); }

private:
    ChildProcess() = default;

    void close_pipes();

    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::optional<int> exit_code_;
    LineBuffer stdout_buffer_;
    LineBuffer stderr_buffer_;
};

struct CommandResult {
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;
};

// Runs a command to completion under a wall-clock timeout
CommandResult run_command(const std::vector<std::string>& argv,
                          std::chrono::seconds timeout,
                          const std::optional<std::string>& stdin_data = std::nullopt,
                          const std::filesystem::path& working_dir = {});

} // namespace gaprun
