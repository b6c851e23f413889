#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "constants.h"

namespace gaprun {

// pending_code_review -> in_progress -> {run_finished | run_failed} -> shared
// pending_code_review, run_finished, run_failed -> rejected
enum class JobStatus {
    PENDING_CODE_REVIEW,
    IN_PROGRESS,
    RUN_FINISHED,
    RUN_FAILED,
    REJECTED,   // terminal
    SHARED      // terminal
};

enum class JobErrorKind {
    NO_ERROR,
    TIMEOUT,
    CANCELLED,
    EXECUTION_FAILED,
    FAILED_CODE_REVIEW,
    FAILED_OUTPUT_REVIEW
};

std::string job_status_to_string(JobStatus status);
JobStatus parse_job_status(const std::string& value);
std::string job_error_to_string(JobErrorKind error);
JobErrorKind parse_job_error(const std::string& value);

bool is_terminal(JobStatus status);

// Marker some backends print on stderr while still exiting 0
constexpr const char* STDERR_ERROR_MARKER = "| ERROR";

struct Job {
    std::string uid;
    std::string name;
    std::string description;
    std::vector<std::string> tags;

    // Definition, immutable after submission
    std::string dataset_name;
    std::string runtime_name;
    std::string code_dir;                  // absolute, or relative to the record's folder
    std::vector<std::string> args;         // args[0] is the entrypoint inside code_dir
    int timeout_seconds = DEFAULT_JOB_TIMEOUT_SECONDS;
    std::map<std::string, std::string> extra_env;

    // Mutable status fields
    JobStatus status = JobStatus::PENDING_CODE_REVIEW;
    JobErrorKind error = JobErrorKind::NO_ERROR;
    std::optional<std::string> error_message;
    std::optional<std::string> output_location;

    std::string created_at;                // ISO-8601 UTC
};

// Result of a transition; the caller applies it (single writer per queue)
struct JobUpdate {
    std::string uid;
    std::optional<JobStatus> status;
    std::optional<JobErrorKind> error;
    std::optional<std::string> error_message;   // "" clears the message
    std::optional<std::string> output_location;
};

// Throws ValidationError
void validate(const Job& job);

JobUpdate transition_in_progress(const Job& job);

// 0 without STDERR_ERROR_MARKER => run_finished. 0 with the marker, or any
// nonzero code => run_failed/execution_failed carrying stderr. The marker
// check is a plain substring search and can misfire on jobs that print it
// for unrelated reasons.
JobUpdate transition_from_exit_code(const Job& job, int exit_code,
                                    const std::string& stderr_text);

JobUpdate transition_timeout(const Job& job, int timeout_seconds);

// For a run that was interrupted (process died with the queue).
// Throws StateTransitionError unless status is in_progress
JobUpdate transition_cancelled(const Job& job, const std::string& reason);

// Throws StateTransitionError unless status is pending_code_review,
// run_finished or run_failed
JobUpdate transition_reject(const Job& job, const std::string& reason);

// Throws StateTransitionError unless status is run_finished or run_failed
JobUpdate transition_share(const Job& job);

// Applies the update and validates the result
void apply_update(Job& job, const JobUpdate& update);

Json::Value job_to_json(const Job& job);
Job job_from_json(const Json::Value& json);

std::string current_timestamp();

} // namespace gaprun
