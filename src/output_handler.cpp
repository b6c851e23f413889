#include "output_handler.h"
#include "errors.h"
#include <filesystem>

namespace gaprun {

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

} // namespace

void FileOutputHandler::on_start(const JobConfig& config) {
    std::filesystem::create_directories(config.logs_dir());

    stdout_file_.open(config.logs_dir() / "stdout.log", std::ios::trunc);
    stderr_file_.open(config.logs_dir() / "stderr.log", std::ios::trunc);
    if (!stdout_file_.is_open() || !stderr_file_.is_open()) {
        throw GaprunError("Failed to open log files in " + config.logs_dir().string());
    }

    on_progress("Starting job...\n", "Starting job...\n");
}

void FileOutputHandler::on_progress(const std::string& stdout_chunk,
                                    const std::string& stderr_chunk) {
    if (!stdout_chunk.empty() && stdout_file_.is_open()) {
        stdout_file_ << stdout_chunk;
        stdout_file_.flush();
    }
    if (!stderr_chunk.empty() && stderr_file_.is_open()) {
        stderr_file_ << stderr_chunk;
        stderr_file_.flush();
    }
}

void FileOutputHandler::on_completion(int exit_code) {
    std::string line = "Job completed with return code " + std::to_string(exit_code) + "\n";
    on_progress(line, line);
    stdout_file_.close();
    stderr_file_.close();
}

TextOutputHandler::TextOutputHandler(std::ostream& out, bool show_stdout, bool show_stderr)
    : out_(out), show_stdout_(show_stdout), show_stderr_(show_stderr) {}

void TextOutputHandler::on_start(const JobConfig& config) {
    const std::string first_line = "================ Job Configuration ================";
    out_ << "\n" << first_line << "\n"
         << "Execution:    " << join(config.runtime.cmd()) << " " << join(config.args) << "\n"
         << "Dataset Dir.: " << config.data_path.string() << "\n"
         << "Output Dir.:  " << config.output_dir().string() << "\n"
         << "Timeout:      " << config.timeout << "s\n"
         << std::string(first_line.size(), '=') << "\n\n"
         << "[STARTING JOB]" << std::endl;
    running_ = true;
}

void TextOutputHandler::on_progress(const std::string& stdout_chunk,
                                    const std::string& stderr_chunk) {
    if (!running_) {
        return;
    }
    if (!stdout_chunk.empty() && show_stdout_) {
        out_ << stdout_chunk;
    }
    if (!stderr_chunk.empty() && show_stderr_) {
        out_ << "[STDERR] " << stderr_chunk;
    }
    out_.flush();
}

void TextOutputHandler::on_completion(int exit_code) {
    running_ = false;
    if (exit_code == 0) {
        out_ << "\n[JOB COMPLETED SUCCESSFULLY]\n" << std::endl;
    } else {
        out_ << "\n[JOB FAILED WITH RETURN CODE " << exit_code << "]\n" << std::endl;
    }
}

} // namespace gaprun
