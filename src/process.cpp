#include "process.h"
#include "constants.h"
#include "errors.h"
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>

namespace gaprun {

namespace {

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            // Child closed its stdin early; it will report its own failure
            break;
        }
        written += static_cast<size_t>(n);
    }
}

// Returns false once the pipe reached EOF or failed
bool drain_fd(int& fd, LineBuffer& buffer, bool& got_data) {
    char chunk[PIPE_BUFFER_SIZE];
    while (fd >= 0) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            got_data = true;
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        close_fd(fd);
        return false;
    }
    return false;
}

} // namespace

std::optional<std::string> LineBuffer::next_line() {
    size_t newline = buffer_.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    std::string line = buffer_.substr(0, newline + 1);
    buffer_.erase(0, newline + 1);
    return line;
}

std::string LineBuffer::take_rest() {
    std::string rest;
    rest.swap(buffer_);
    return rest;
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const ProcessOptions& options) {
    if (options.argv.empty()) {
        throw GaprunError("Cannot spawn an empty command");
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int stdin_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0],
                        &stderr_pipe[1], &stdin_pipe[0], &stdin_pipe[1]}) {
            close_fd(*fd);
        }
    };

    if (pipe2(stdout_pipe, O_CLOEXEC) == -1 || pipe2(stderr_pipe, O_CLOEXEC) == -1 ||
        (options.stdin_data && pipe2(stdin_pipe, O_CLOEXEC) == -1)) {
        close_all();
        throw GaprunError(std::string("Failed to create pipes: ") + std::strerror(errno));
    }

    // Prepare argv before fork
    std::vector<char*> argv;
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        close_all();
        throw GaprunError(std::string("Failed to fork process: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child process: own process group so kill() reaches grandchildren
        setpgid(0, 0);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        if (options.stdin_data) {
            dup2(stdin_pipe[0], STDIN_FILENO);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }
        }

        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            perror("chdir");
            _exit(1);
        }

        for (const auto& [key, value] : options.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        if (options.child_setup) {
            try {
                options.child_setup();
            } catch (const std::exception& e) {
                fprintf(stderr, "child setup failed: %s\n", e.what());
                _exit(126);
            }
        }

        execvp(argv[0], argv.data());
        perror("execvp");
        _exit(127);
    }

    // Parent process
    std::unique_ptr<ChildProcess> child(new ChildProcess());
    child->pid_ = pid;
    child->stdout_fd_ = stdout_pipe[0];
    child->stderr_fd_ = stderr_pipe[0];
    stdout_pipe[0] = -1;
    stderr_pipe[0] = -1;
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(stdin_pipe[0]);

    fcntl(child->stdout_fd_, F_SETFL, fcntl(child->stdout_fd_, F_GETFL) | O_NONBLOCK);
    fcntl(child->stderr_fd_, F_SETFL, fcntl(child->stderr_fd_, F_GETFL) | O_NONBLOCK);

    if (options.stdin_data) {
        signal(SIGPIPE, SIG_IGN);
        write_all(stdin_pipe[1], *options.stdin_data);
        close_fd(stdin_pipe[1]);
    }

    return child;
}

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !poll()) {
        kill();
        wait();
    }
    close_pipes();
}

std::optional<int> ChildProcess::poll() {
    if (exit_code_ || pid_ <= 0) {
        return exit_code_;
    }

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        exit_code_ = decode_status(status);
    } else if (result == -1 && errno != EINTR) {
        exit_code_ = -1;
    }
    return exit_code_;
}

int ChildProcess::wait() {
    while (!exit_code_ && pid_ > 0) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, 0);
        if (result == pid_) {
            exit_code_ = decode_status(status);
        } else if (result == -1 && errno != EINTR) {
            exit_code_ = -1;
        }
    }
    return exit_code_.value_or(-1);
}

void ChildProcess::kill() {
    if (pid_ <= 0 || exit_code_) {
        return;
    }
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
}

bool ChildProcess::read_available() {
    bool got_data = false;
    drain_fd(stdout_fd_, stdout_buffer_, got_data);
    drain_fd(stderr_fd_, stderr_buffer_, got_data);
    return got_data;
}

void ChildProcess::wait_readable(std::chrono::milliseconds timeout) {
    struct pollfd fds[2];
    nfds_t count = 0;
    for (int fd : {stdout_fd_, stderr_fd_}) {
        if (fd >= 0) {
            fds[count].fd = fd;
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            ++count;
        }
    }

    if (count == 0) {
        std::this_thread::sleep_for(timeout);
        return;
    }
    ::poll(fds, count, static_cast<int>(timeout.count()));
}

void ChildProcess::close_pipes() {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

CommandResult run_command(const std::vector<std::string>& argv,
                          std::chrono::seconds timeout,
                          const std::optional<std::string>& stdin_data,
                          const std::filesystem::path& working_dir) {
    ProcessOptions options;
    options.argv = argv;
    options.stdin_data = stdin_data;
    options.working_dir = working_dir;

    CommandResult result;
    auto child = ChildProcess::spawn(options);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        child->read_available();
        if (child->poll()) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            child->kill();
            child->wait();
            result.timed_out = true;
            break;
        }
        child->wait_readable(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }

    child->read_available();
    result.exit_code = child->wait();
    result.stdout_output = child->take_stdout();
    result.stderr_output = child->take_stderr();
    return result;
}

} // namespace gaprun
