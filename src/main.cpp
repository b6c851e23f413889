/*
 * gaprun - Air-gapped job execution
 * High side: run reviewed jobs on private data, replicate results down
 * Low side: submit jobs against published mock data
 */

#include "constants.h"
#include "errors.h"
#include "high_low.h"
#include "job_model.h"
#include "runtime.h"
#include "sync.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace gaprun;
namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) {
    g_stop.store(true);
}

struct Args {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> flags;
    std::set<std::string> switches;

    bool has(const std::string& name) const { return flags.count(name) > 0; }

    std::string get(const std::string& name, const std::string& fallback = "") const {
        auto it = flags.find(name);
        return it == flags.end() ? fallback : it->second;
    }

    std::string require(const std::string& name) const {
        auto it = flags.find(name);
        if (it == flags.end() || it->second.empty()) {
            throw ConfigError("missing --" + name);
        }
        return it->second;
    }

    std::string arg(size_t index, const std::string& what) const {
        if (index >= positional.size()) {
            throw ConfigError("missing " + what);
        }
        return positional[index];
    }
};

const std::set<std::string> SWITCHES = {"force", "once", "help"};

Args parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; i++) {
        std::string token = argv[i];
        if (token.rfind("--", 0) == 0) {
            std::string name = token.substr(2);
            if (SWITCHES.count(name)) {
                args.switches.insert(name);
            } else if (i + 1 < argc) {
                args.flags[name] = argv[++i];
            } else {
                throw ConfigError("--" + name + " needs a value");
            }
        } else if (args.command.empty()) {
            args.command = token;
        } else {
            args.positional.push_back(token);
        }
    }
    return args;
}

fs::path root_of(const Args& args) {
    if (args.has("root")) {
        return args.get("root");
    }
    const char* env = std::getenv("GAPRUN_ROOT");
    if (env && *env) {
        return env;
    }
    throw ConfigError("no root given, pass --root or set GAPRUN_ROOT");
}

HighSideClient open_high(const Args& args) {
    return HighSideClient(fs::absolute(root_of(args)), args.require("email"), args.require("id"));
}

int report(const SyncResult& result) {
    std::cout << "Transfers: " << result.successful_syncs << " succeeded, "
              << result.failed_syncs << " failed" << std::endl;
    for (const auto& error : result.errors) {
        std::cerr << "  " << error << std::endl;
    }
    return result.success() ? 0 : 1;
}

void print_job(const Job& job) {
    std::cout << job.uid << "  " << job_status_to_string(job.status);
    if (job.error != JobErrorKind::NO_ERROR) {
        std::cout << " (" << job_error_to_string(job.error) << ")";
    }
    if (!job.dataset_name.empty()) {
        std::cout << "  dataset=" << job.dataset_name;
    }
    std::cout << std::endl;
    if (job.error_message && !job.error_message->empty()) {
        std::cout << "    " << *job.error_message << std::endl;
    }
}

void print_usage() {
    std::cout << "Usage: gaprun <command> [options]\n"
              << "\n"
              << "Common options: --root DIR (or GAPRUN_ROOT) --email PRINCIPAL --id IDENTIFIER\n"
              << "\n"
              << "High side:\n"
              << "  init-high [--cmd INTERPRETER] [--force]     Create a high side root\n"
              << "  set-runtime --cmd INTERPRETER               Interpreter every job runs with\n"
              << "  connect --low-root DIR [--transport rsync|copy] [--host H --user U\n"
              << "          [--port N] [--key FILE]] [--force]  Connect to a low side\n"
              << "  sync jobs|done|datasets|all                 Run standing transfers\n"
              << "  sync-dataset NAME                           Publish a dataset's mock data\n"
              << "  create-dataset NAME --mock PATH --private PATH [--readme FILE] [--summary TEXT]\n"
              << "  process [--once] [--interval-ms N]          Run pending jobs\n"
              << "  reject JOB_ID [--reason TEXT]               Reject code or output\n"
              << "  share JOB_ID                                Approve results for release\n"
              << "\n"
              << "Either side:\n"
              << "  status [JOB_ID]                             Show one or all jobs\n"
              << "\n"
              << "Low side:\n"
              << "  submit --dataset NAME --code DIR --entry FILE [--cmd INTERPRETER]\n"
              << "         [--timeout SECONDS]                  Submit a job\n"
              << "  datasets                                    List published datasets\n";
}

int cmd_init_high(const Args& args) {
    HighSideClient client = HighSideClient::initialize(args.require("email"), args.require("id"),
                                                       root_of(args), args.switches.count("force") > 0,
                                                       {args.get("cmd", "python")});
    std::cout << "✅ High side ready at " << client.runtime_dir() << std::endl;
    return 0;
}

int cmd_set_runtime(const Args& args) {
    HighSideClient client = open_high(args);
    InterpreterConfig interpreter;
    interpreter.cmd = {args.require("cmd")};
    client.register_runtime(Runtime::create(interpreter));
    std::cout << "✅ Jobs now run with " << client.registered_runtime().name() << std::endl;
    return 0;
}

int cmd_connect(const Args& args) {
    HighSideClient client = open_high(args);
    bool force = args.switches.count("force") > 0;

    if (args.has("host")) {
        SshConnection connection;
        connection.host = args.require("host");
        connection.user = args.require("user");
        connection.port = std::stoi(args.get("port", std::to_string(DEFAULT_SSH_PORT)));
        if (args.has("key")) {
            connection.ssh_key_path = args.get("key");
        }
        return report(client.connect_ssh(connection, args.require("low-root"), force));
    }

    SyncTransport transport = parse_sync_transport(args.get("transport", "rsync"));
    return report(client.connect_local(args.require("low-root"), transport, force));
}

int cmd_sync(const Args& args) {
    HighSideClient client = open_high(args);
    std::string what = args.arg(0, "what to sync (jobs, done, datasets, all)");

    if (what == "jobs") return report(client.sync_pending_jobs());
    if (what == "done") return report(client.sync_done_jobs());
    if (what == "datasets") return report(client.sync_datasets());
    if (what == "all") return report(client.sync_all());
    throw ConfigError("unknown sync target '" + what + "'");
}

int cmd_sync_dataset(const Args& args) {
    HighSideClient client = open_high(args);
    return report(client.sync_dataset(args.arg(0, "dataset name")));
}

int cmd_create_dataset(const Args& args) {
    HighSideClient client = open_high(args);
    std::optional<fs::path> readme;
    if (args.has("readme")) {
        readme = args.get("readme");
    }
    Dataset dataset = client.create_dataset(args.arg(0, "dataset name"), args.require("mock"),
                                            args.require("private"), readme, args.get("summary"));
    std::cout << "✅ Created dataset '" << dataset.name << "' (" << dataset.uid << ")" << std::endl;
    return 0;
}

int cmd_process(const Args& args) {
    HighSideClient client = open_high(args);
    if (args.switches.count("once")) {
        size_t n = client.run_pending_jobs();
        std::cout << "Processed " << n << " job(s)" << std::endl;
        return 0;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    auto interval = std::chrono::milliseconds(
        std::stoi(args.get("interval-ms", std::to_string(QUEUE_SCAN_INTERVAL_MS))));
    client.queue().process_queue(g_stop, interval);
    return 0;
}

int cmd_status(const Args& args) {
    LowSideClient client(fs::absolute(root_of(args)), args.require("email"), args.require("id"));
    if (!args.positional.empty()) {
        print_job(client.get_job(args.positional[0]));
        return 0;
    }
    client.refresh();
    for (const auto& job : client.queue().list_jobs()) {
        print_job(job);
    }
    return 0;
}

int cmd_reject(const Args& args) {
    HighSideClient client = open_high(args);
    print_job(client.queue().reject(args.arg(0, "job id"), args.get("reason", "rejected by reviewer")));
    return 0;
}

int cmd_share(const Args& args) {
    HighSideClient client = open_high(args);
    print_job(client.queue().share(args.arg(0, "job id")));
    return 0;
}

int cmd_submit(const Args& args) {
    LowSideClient client(fs::absolute(root_of(args)), args.require("email"), args.require("id"));

    InterpreterConfig interpreter;
    interpreter.cmd = {args.get("cmd", "python")};
    Runtime runtime = Runtime::create(interpreter);

    int timeout = std::stoi(args.get("timeout", std::to_string(DEFAULT_JOB_TIMEOUT_SECONDS)));
    std::vector<std::string> job_args = {args.require("entry")};
    job_args.insert(job_args.end(), args.positional.begin(), args.positional.end());

    std::string id = client.submit_job(args.require("dataset"), args.require("code"), job_args,
                                       runtime, timeout, {}, args.get("name"));
    std::cout << "✅ Submitted " << id << std::endl;
    return 0;
}

int cmd_datasets(const Args& args) {
    LowSideClient client(fs::absolute(root_of(args)), args.require("email"), args.require("id"));
    for (const auto& dataset : client.list_datasets()) {
        std::cout << dataset.name << "  owner=" << dataset.owner;
        if (!dataset.summary.empty()) {
            std::cout << "  " << dataset.summary;
        }
        std::cout << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        Args args = parse_args(argc, argv);
        if (args.command.empty() || args.command == "help" || args.switches.count("help")) {
            print_usage();
            return args.command.empty() ? 1 : 0;
        }

        if (args.command == "init-high") return cmd_init_high(args);
        if (args.command == "set-runtime") return cmd_set_runtime(args);
        if (args.command == "connect") return cmd_connect(args);
        if (args.command == "sync") return cmd_sync(args);
        if (args.command == "sync-dataset") return cmd_sync_dataset(args);
        if (args.command == "create-dataset") return cmd_create_dataset(args);
        if (args.command == "process") return cmd_process(args);
        if (args.command == "status") return cmd_status(args);
        if (args.command == "reject") return cmd_reject(args);
        if (args.command == "share") return cmd_share(args);
        if (args.command == "submit") return cmd_submit(args);
        if (args.command == "datasets") return cmd_datasets(args);

        std::cerr << "Unknown command: " << args.command << std::endl;
        print_usage();
        return 1;
    } catch (const GaprunError& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "❌ Unexpected error: " << e.what() << std::endl;
        return 2;
    }
}
