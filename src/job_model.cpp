#include "job_model.h"
#include "errors.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gaprun {

namespace {

const std::map<JobStatus, std::string> status_names = {
    {JobStatus::PENDING_CODE_REVIEW, "pending_code_review"},
    {JobStatus::IN_PROGRESS, "job_in_progress"},
    {JobStatus::RUN_FINISHED, "job_run_finished"},
    {JobStatus::RUN_FAILED, "job_run_failed"},
    {JobStatus::REJECTED, "rejected"},
    {JobStatus::SHARED, "shared"},
};

const std::map<JobErrorKind, std::string> error_names = {
    {JobErrorKind::NO_ERROR, "no_error"},
    {JobErrorKind::TIMEOUT, "timeout"},
    {JobErrorKind::CANCELLED, "cancelled"},
    {JobErrorKind::EXECUTION_FAILED, "execution_failed"},
    {JobErrorKind::FAILED_CODE_REVIEW, "failed_code_review"},
    {JobErrorKind::FAILED_OUTPUT_REVIEW, "failed_output_review"},
};

Json::Value string_array(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& v : values) {
        array.append(v);
    }
    return array;
}

std::vector<std::string> read_string_array(const Json::Value& array) {
    std::vector<std::string> values;
    if (!array.isArray()) {
        return values;
    }
    for (const auto& v : array) {
        values.push_back(v.asString());
    }
    return values;
}

} // namespace

std::string job_status_to_string(JobStatus status) {
    return status_names.at(status);
}

JobStatus parse_job_status(const std::string& value) {
    for (const auto& [status, name] : status_names) {
        if (name == value) {
            return status;
        }
    }
    throw ValidationError("unknown job status '" + value + "'");
}

std::string job_error_to_string(JobErrorKind error) {
    return error_names.at(error);
}

JobErrorKind parse_job_error(const std::string& value) {
    for (const auto& [error, name] : error_names) {
        if (name == value) {
            return error;
        }
    }
    throw ValidationError("unknown job error kind '" + value + "'");
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::REJECTED || status == JobStatus::SHARED;
}

void validate(const Job& job) {
    if (job.uid.empty()) {
        throw ValidationError("job has no uid");
    }
    if (job.timeout_seconds <= 0) {
        throw ValidationError("job " + job.uid + " has non-positive timeout");
    }
    if (job.status == JobStatus::RUN_FAILED && job.error == JobErrorKind::NO_ERROR) {
        throw ValidationError("job " + job.uid + " is run_failed without an error kind");
    }
    if (job.status == JobStatus::REJECTED &&
        job.error != JobErrorKind::FAILED_CODE_REVIEW &&
        job.error != JobErrorKind::FAILED_OUTPUT_REVIEW) {
        throw ValidationError("job " + job.uid + " is rejected without a review error");
    }
}

JobUpdate transition_in_progress(const Job& job) {
    if (job.status != JobStatus::PENDING_CODE_REVIEW) {
        throw StateTransitionError("cannot start job " + job.uid + " from " +
                                   job_status_to_string(job.status));
    }
    JobUpdate update;
    update.uid = job.uid;
    update.status = JobStatus::IN_PROGRESS;
    update.error = JobErrorKind::NO_ERROR;
    return update;
}

JobUpdate transition_from_exit_code(const Job& job, int exit_code,
                                    const std::string& stderr_text) {
    JobUpdate update;
    update.uid = job.uid;

    bool marker = stderr_text.find(STDERR_ERROR_MARKER) != std::string::npos;
    if (exit_code == 0 && !marker) {
        update.status = JobStatus::RUN_FINISHED;
        update.error = JobErrorKind::NO_ERROR;
        update.error_message = "";
        return update;
    }

    update.status = JobStatus::RUN_FAILED;
    update.error = JobErrorKind::EXECUTION_FAILED;
    if (!stderr_text.empty()) {
        update.error_message = stderr_text;
    } else {
        update.error_message = "Job exited with code " + std::to_string(exit_code);
    }
    return update;
}

JobUpdate transition_timeout(const Job& job, int timeout_seconds) {
    JobUpdate update;
    update.uid = job.uid;
    update.status = JobStatus::RUN_FAILED;
    update.error = JobErrorKind::TIMEOUT;
    update.error_message = "Job timed out after " + std::to_string(timeout_seconds) + " seconds";
    return update;
}

JobUpdate transition_cancelled(const Job& job, const std::string& reason) {
    if (job.status != JobStatus::IN_PROGRESS) {
        throw StateTransitionError("cannot cancel job " + job.uid + " from " +
                                   job_status_to_string(job.status));
    }
    JobUpdate update;
    update.uid = job.uid;
    update.status = JobStatus::RUN_FAILED;
    update.error = JobErrorKind::CANCELLED;
    update.error_message = reason;
    return update;
}

JobUpdate transition_reject(const Job& job, const std::string& reason) {
    JobUpdate update;
    update.uid = job.uid;
    update.status = JobStatus::REJECTED;
    update.error_message = reason;

    switch (job.status) {
        case JobStatus::PENDING_CODE_REVIEW:
            update.error = JobErrorKind::FAILED_CODE_REVIEW;
            break;
        case JobStatus::RUN_FINISHED:
        case JobStatus::RUN_FAILED:
            update.error = JobErrorKind::FAILED_OUTPUT_REVIEW;
            break;
        default:
            throw StateTransitionError("cannot reject job " + job.uid + " from " +
                                       job_status_to_string(job.status));
    }
    return update;
}

JobUpdate transition_share(const Job& job) {
    if (job.status != JobStatus::RUN_FINISHED && job.status != JobStatus::RUN_FAILED) {
        throw StateTransitionError("cannot share job " + job.uid + " from " +
                                   job_status_to_string(job.status));
    }
    JobUpdate update;
    update.uid = job.uid;
    update.status = JobStatus::SHARED;
    return update;
}

void apply_update(Job& job, const JobUpdate& update) {
    if (!update.uid.empty() && update.uid != job.uid) {
        throw ValidationError("update for " + update.uid + " applied to " + job.uid);
    }
    if (update.status) {
        job.status = *update.status;
    }
    if (update.error) {
        job.error = *update.error;
    }
    if (update.error_message) {
        if (update.error_message->empty()) {
            job.error_message.reset();
        } else {
            job.error_message = *update.error_message;
        }
    }
    if (update.output_location) {
        job.output_location = *update.output_location;
    }
    validate(job);
}

Json::Value job_to_json(const Job& job) {
    Json::Value json;
    json["uid"] = job.uid;
    json["name"] = job.name;
    json["description"] = job.description;
    json["tags"] = string_array(job.tags);
    json["dataset_name"] = job.dataset_name;
    json["runtime_name"] = job.runtime_name;
    json["code_dir"] = job.code_dir;
    json["args"] = string_array(job.args);
    json["timeout"] = job.timeout_seconds;

    Json::Value env(Json::objectValue);
    for (const auto& [key, value] : job.extra_env) {
        env[key] = value;
    }
    json["extra_env"] = env;

    json["status"] = job_status_to_string(job.status);
    json["error"] = job_error_to_string(job.error);
    json["error_message"] = job.error_message ? Json::Value(*job.error_message)
                                              : Json::Value(Json::nullValue);
    json["output_location"] = job.output_location ? Json::Value(*job.output_location)
                                                  : Json::Value(Json::nullValue);
    json["created_at"] = job.created_at;
    return json;
}

Job job_from_json(const Json::Value& json) {
    if (!json.isObject()) {
        throw ValidationError("job record is not a JSON object");
    }

    Job job;
    job.uid = json.get("uid", "").asString();
    job.name = json.get("name", "").asString();
    job.description = json.get("description", "").asString();
    job.tags = read_string_array(json["tags"]);
    job.dataset_name = json.get("dataset_name", "").asString();
    job.runtime_name = json.get("runtime_name", "").asString();
    job.code_dir = json.get("code_dir", "").asString();
    job.args = read_string_array(json["args"]);
    job.timeout_seconds = json.get("timeout", DEFAULT_JOB_TIMEOUT_SECONDS).asInt();

    const Json::Value& env = json["extra_env"];
    if (env.isObject()) {
        for (const auto& key : env.getMemberNames()) {
            job.extra_env[key] = env[key].asString();
        }
    }

    job.status = parse_job_status(json.get("status", "pending_code_review").asString());
    job.error = parse_job_error(json.get("error", "no_error").asString());
    if (json["error_message"].isString()) {
        job.error_message = json["error_message"].asString();
    }
    if (json["output_location"].isString()) {
        job.output_location = json["output_location"].asString();
    }
    job.created_at = json.get("created_at", "").asString();

    validate(job);
    return job;
}

std::string current_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace gaprun
