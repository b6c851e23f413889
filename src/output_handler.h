#pragma once

#include <fstream>
#include <iostream>
#include <string>
#include "job_config.h"

namespace gaprun {

// Observer of a running job's output
class JobOutputHandler {
public:
    virtual ~JobOutputHandler() = default;

    virtual void on_start(const JobConfig& config) = 0;
    virtual void on_progress(const std::string& stdout_chunk, const std::string& stderr_chunk) = 0;
    virtual void on_completion(int exit_code) = 0;
};

// Writes logs/stdout.log and logs/stderr.log under the job folder
class FileOutputHandler : public JobOutputHandler {
public:
    void on_start(const JobConfig& config) override;
    void on_progress(const std::string& stdout_chunk, const std::string& stderr_chunk) override;
    void on_completion(int exit_code) override;

private:
    std::ofstream stdout_file_;
    std::ofstream stderr_file_;
};

// Plain console rendering
class TextOutputHandler : public JobOutputHandler {
public:
    explicit TextOutputHandler(std::ostream& out = std::cout,
                               bool show_stdout = true,
                               bool show_stderr = true);

    void on_start(const JobConfig& config) override;
    void on_progress(const std::string& stdout_chunk, const std::string& stderr_chunk) override;
    void on_completion(int exit_code) override;

private:
    std::ostream& out_;
    bool show_stdout_;
    bool show_stderr_;
    bool running_ = false;
};

} // namespace gaprun
