#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <thread>
#include <memory>

#include <cxxopts.hpp>
#include <sqlite3.h>

#include "./config/config.hpp"
#include "./db/sqlite.hpp"
#include "./deque/deque.hpp"
#include "./app_state/state.hpp"
#include "./duplicate_index/duplicate_index.hpp"
#include "./job_queue/job_queue.hpp"
#include "./relay/relay.hpp"
#include "./source/http_source.hpp"
#include "./source/resolver.hpp"
#include "./source/source_id.hpp"

#define STRING(x) #x
#define XSTRING(x) STRING(x)

#define APP_NAME XSTRING(CMAKE_PROJECT_NAME)
#define APP_VERSION XSTRING(CMAKE_PROJECT_VERSION)

#define EVENT_POLL_INTERVAL_MS 100

static void print_usage(const cxxopts::Options &options) {
    fprintf(stderr, "%s", options.help().c_str());
}

static void print_commands() {
    fprintf(stdout,
        "Commands:\n"
        "  add <locator> [id]   queue a source\n"
        "  pause <id>           pause the active download\n"
        "  resume <id>          resume the active download\n"
        "  cancel <id>          cancel the active download\n"
        "  list                 show queued jobs\n"
        "  stats                show relay statistics\n"
        "  clear-queue          drop pending jobs\n"
        "  clear-history        forget relayed sources\n"
        "  quit                 finish the current job and exit\n");
}

static void print_outcome(const job_outcome_t &outcome) {
    fprintf(stdout, "[Job %s] %s \"%s\", %s\n",
        outcome.source_id.c_str(),
        job_status_name(outcome.status),
        outcome.label.value_or("").c_str(),
        format_bytes(outcome.bytes_transferred).c_str());
    for (const auto &r : outcome.results) {
        if (r.success) {
            fprintf(stdout, "  %s: ok, %s\n", r.destination_id.c_str(), r.artifact_id.value_or("").c_str());
        } else {
            fprintf(stdout, "  %s: %s\n", r.destination_id.c_str(), r.error.has_value() ? describe_error(r.error.value()).c_str() : "failed");
        }
    }
}

static void finish_outcome(AppState &app_state, const job_outcome_t &outcome) {
    print_outcome(outcome);
    try {
        app_state.record_outcome(outcome);
    } catch (const std::exception &e) {
        fprintf(stderr, "Could not record job outcome: %s\n", e.what());
    }
}

static void print_stats(const AppState &app_state) {
    const auto stats = app_state.get_stats();
    const auto success_rate = stats.total_jobs == 0 ? 0.0 : 100.0 * stats.successful_jobs / stats.total_jobs;
    fprintf(stdout,
        "Jobs: %llu (ok %llu, failed %llu, cancelled %llu), success rate %.1f%%\n"
        "Relayed: %s, duplicates skipped: %llu\n",
        stats.total_jobs, stats.successful_jobs, stats.failed_jobs, stats.cancelled_jobs, success_rate,
        format_bytes(stats.total_bytes).c_str(), stats.duplicates_skipped);
    for (const auto &h : app_state.get_history(5)) {
        fprintf(stdout, "  %s %s \"%s\" %u/%u %s\n", job_status_name(h.status), h.source_id.c_str(), h.label.c_str(),
            h.destinations_succeeded, h.destinations_total, h.error.c_str());
    }
}

static void print_jobs(const std::vector<job_t> &jobs) {
    if (jobs.empty()) {
        fprintf(stdout, "Queue is empty\n");
        return;
    }
    unsigned int i = 1;
    for (const auto &j : jobs) {
        fprintf(stdout, "  %u. [%s] %s %s\n", i++, job_status_name(j.status), j.source_id.c_str(), j.label.value_or(j.locator).c_str());
    }
}

// admits a source unless it was relayed before and duplicates are not allowed
static bool admit_source(JobQueue &queue, AppState &app_state, const source_spec_t &source, const std::vector<std::string> &destinations, bool allow_duplicates) {
    if (!allow_duplicates && queue.is_previously_relayed(source.id)) {
        fprintf(stderr, "[Job %s] Already relayed, skipping. Use --allow-duplicates to relay it again\n", source.id.c_str());
        app_state.add_duplicate_skipped();
        return false;
    }
    const auto admitted = queue.admit(source.id, source.locator, destinations);
    switch (admitted) {
    case ADMIT_ACCEPTED:
        fprintf(stdout, "[Job %s] Queued\n", source.id.c_str());
        return true;
    case ADMIT_ALREADY_QUEUED:
        fprintf(stderr, "[Job %s] Already in the queue\n", source.id.c_str());
        return false;
    case ADMIT_NO_DESTINATIONS:
        fprintf(stderr, "[Job %s] No destinations configured\n", source.id.c_str());
        return false;
    }
    return false;
}

int main(int argc, char const* argv[]) {
    cxxopts::Options options(APP_NAME);

    options.add_options()
           ("s,source", "Source to relay: <locator> or id=<id>,url=<locator>", cxxopts::value<std::vector<std::string>>())
           ("d,destination", "Destination: id=<id>,type=graph|s3,endpoint=..,account=..,token=.. (access_key=..,secret_key=..,region=..,path=.. for s3)", cxxopts::value<std::vector<std::string>>())
           ("f,destinations-file", "File with one destination per line", cxxopts::value<std::string>())
           ("r,resolver-url", "Metadata API resolving locators, locators are fetched directly if not set", cxxopts::value<std::string>())
           ("q,state-file", std::string("Path to application state file. Default is ./") + DEFAULT_STATE_FILE, cxxopts::value<std::string>())
           ("w,job-delay", "Delay between jobs in milliseconds", cxxopts::value<unsigned int>()->default_value(std::to_string(DEFAULT_JOB_DELAY_MS)))
           ("i,interactive", "Read commands from standard input")
           ("y,allow-duplicates", "Relay sources that were relayed before")
           ("v,version", "Show version")
           ("h,help", "Show help");

    cxxopts::ParseResult args;

    try {
        args = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception &x) {
        fprintf(stderr, "%s: %s\n", APP_NAME, x.what());
        print_usage(options);
        return EXIT_FAILURE;
    }

    if (args.count("help")) {
        print_usage(options);
        return EXIT_SUCCESS;
    }

    if (args.count("version")) {
        fprintf(stderr, "%s: %s\n", APP_NAME, APP_VERSION);
        return EXIT_SUCCESS;
    }

    const auto interactive = args.count("interactive") > 0;
    const auto allow_duplicates = args.count("allow-duplicates") > 0;

    std::vector<destination_config_t> destination_configs;
    if (args.count("destination")) {
        for (const auto &spec : args["destination"].as<std::vector<std::string>>()) {
            const auto parsed = parse_destination_spec(spec);
            if (std::holds_alternative<std::string>(parsed)) {
                fprintf(stderr, "Invalid destination: %s\n", std::get<std::string>(parsed).c_str());
                return EXIT_FAILURE;
            }
            destination_configs.push_back(std::get<destination_config_t>(parsed));
        }
    }
    if (args.count("destinations-file")) {
        const auto loaded = load_destinations_file(args["destinations-file"].as<std::string>());
        if (std::holds_alternative<std::string>(loaded)) {
            fprintf(stderr, "Invalid destinations file: %s\n", std::get<std::string>(loaded).c_str());
            return EXIT_FAILURE;
        }
        for (const auto &c : std::get<std::vector<destination_config_t>>(loaded)) {
            destination_configs.push_back(c);
        }
    }
    if (destination_configs.empty()) {
        const auto from_env = destination_from_env();
        if (from_env.has_value()) {
            destination_configs.push_back(from_env.value());
        }
    }
    if (destination_configs.empty()) {
        fprintf(stderr, "No destination is set. Use --destination or %s and %s.\n", ENV_PAGE_ID, ENV_PAGE_ACCESS_TOKEN);
        print_usage(options);
        return EXIT_FAILURE;
    }

    credential_store_t credentials;
    std::vector<std::string> destination_ids;
    for (const auto &c : destination_configs) {
        if (credentials.count(c.id) > 0) {
            fprintf(stderr, "Destination \"%s\" is set more than once.\n", c.id.c_str());
            return EXIT_FAILURE;
        }
        credentials[c.id] = c;
        destination_ids.push_back(c.id);
    }

    std::vector<source_spec_t> sources;
    if (args.count("source")) {
        for (const auto &spec : args["source"].as<std::vector<std::string>>()) {
            sources.push_back(parse_source_spec(spec));
        }
    }
    if (sources.empty() && !interactive) {
        fprintf(stderr, "Source is not set.\n");
        print_usage(options);
        return EXIT_FAILURE;
    }

    std::string app_state_path = DEFAULT_STATE_FILE;
    if (args.count("state-file")) {
        app_state_path = args["state-file"].as<std::string>();
    }
    const auto job_delay = std::chrono::milliseconds(args["job-delay"].as<unsigned int>());

    std::shared_ptr<SourceResolver> resolver;
    if (args.count("resolver-url")) {
        resolver = std::make_shared<ApiResolver>(args["resolver-url"].as<std::string>());
    } else {
        resolver = std::make_shared<DirectResolver>();
    }

    fprintf(stdout, "Media relay starting with %zu destination(s)\n", destination_ids.size());

    const auto db_open_ret = db_open(app_state_path);
    if (std::holds_alternative<std::string>(db_open_ret)) {
        fprintf(stderr, "Failed to open SQLite database: %s\n", std::get<std::string>(db_open_ret).c_str());
        return EXIT_FAILURE;
    }
    const auto db = std::get<std::shared_ptr<sqlite3>>(db_open_ret);
    // the queue worker writes the index on its own connection, transactions
    // of the main thread never include its writes
    const auto index_db_open_ret = db_open(app_state_path);
    if (std::holds_alternative<std::string>(index_db_open_ret)) {
        fprintf(stderr, "Failed to open SQLite database: %s\n", std::get<std::string>(index_db_open_ret).c_str());
        return EXIT_FAILURE;
    }
    const auto index_db = std::get<std::shared_ptr<sqlite3>>(index_db_open_ret);

    std::unique_ptr<AppState> app_state;
    std::unique_ptr<DuplicateIndex> duplicate_index;
    try {
        app_state = std::make_unique<AppState>(db, false);
        duplicate_index = std::make_unique<DuplicateIndex>(index_db, false);
    } catch (const std::exception &e) {
        fprintf(stderr, "Failed to load application state: %s\n", e.what());
        return EXIT_FAILURE;
    }

    std::unique_ptr<Relay> relay;
    JobQueue queue([&relay](const job_t &job, TransferState &state) {
        return relay->run(job, state);
    }, std::move(duplicate_index), job_delay);
    relay = std::make_unique<Relay>(
        resolver,
        http_fragment_source_factory(),
        credentials,
        make_destination,
        queue.progress_sink(),
        fetch_thumbnail
    );

    unsigned int admitted = 0;
    for (const auto &source : sources) {
        try {
            if (admit_source(queue, *app_state, source, destination_ids, allow_duplicates)) {
                admitted++;
            }
        } catch (const std::exception &e) {
            fprintf(stderr, "Could not queue source %s: %s\n", source.id.c_str(), e.what());
        }
    }

    // stdin is read on its own thread, commands are handled here so that
    // the application state stays on one thread
    // the reader may outlive main while blocked on stdin, so it shares ownership
    const auto commands = std::make_shared<ThreadSafeDeque<std::string>>();
    if (interactive) {
        print_commands();
        std::thread([commands] {
            std::string line;
            while (std::getline(std::cin, line)) {
                commands->push_back(line);
            }
            commands->push_back("quit");
        }).detach();
    }

    queue.start();

    unsigned int finished = 0;
    unsigned int failed = 0;
    bool quit = false;
    while (!quit) {
        if (!interactive && finished >= admitted) {
            break;
        }

        const auto event = queue.get_event_queue().pop_front_waiting_for(std::chrono::milliseconds(EVENT_POLL_INTERVAL_MS));
        if (event.has_value()) {
            switch (event->kind) {
            case JOB_EVENT_STARTED:
                break;
            case JOB_EVENT_PROGRESS:
                fprintf(stdout, "[Job %s] %s\n", event->source_id.c_str(), format_progress(event->progress.value()).c_str());
                break;
            case JOB_EVENT_FINISHED:
                finished++;
                if (event->outcome->status != JOB_STATUS_COMPLETED) {
                    failed++;
                }
                finish_outcome(*app_state, event->outcome.value());
                break;
            }
        }

        while (true) {
            const auto command_line = commands->try_pop_front();
            if (!command_line.has_value()) {
                break;
            }
            std::istringstream stream(command_line.value());
            std::string command;
            std::string argument;
            std::string extra;
            stream >> command >> argument >> extra;
            if (command.empty()) {
                continue;
            }
            try {
                if (command == "add" && !argument.empty()) {
                    const auto source = source_spec_t { extra.empty() ? source_id_for(argument) : extra, argument };
                    if (admit_source(queue, *app_state, source, destination_ids, allow_duplicates)) {
                        admitted++;
                    }
                } else if (command == "pause" && !argument.empty()) {
                    fprintf(stdout, queue.pause(argument) ? "Paused %s\n" : "No active download %s\n", argument.c_str());
                } else if (command == "resume" && !argument.empty()) {
                    fprintf(stdout, queue.resume(argument) ? "Resumed %s\n" : "No active download %s\n", argument.c_str());
                } else if (command == "cancel" && !argument.empty()) {
                    fprintf(stdout, queue.cancel(argument) ? "Cancelling %s\n" : "No active download %s\n", argument.c_str());
                } else if (command == "list") {
                    print_jobs(queue.list());
                } else if (command == "stats") {
                    print_stats(*app_state);
                } else if (command == "clear-queue") {
                    const auto removed = queue.remove_pending();
                    admitted -= (unsigned int) removed;
                    fprintf(stdout, "Removed %zu pending job(s)\n", removed);
                } else if (command == "clear-history") {
                    queue.clear_history();
                    fprintf(stdout, "Relay history cleared\n");
                } else if (command == "quit") {
                    quit = true;
                    break;
                } else {
                    print_commands();
                }
            } catch (const std::exception &e) {
                fprintf(stderr, "Command \"%s\" failed: %s\n", command.c_str(), e.what());
            }
        }
    }

    queue.stop();
    // outcomes of a job that finished while stopping
    while (true) {
        const auto event = queue.get_event_queue().try_pop_front();
        if (!event.has_value()) {
            break;
        }
        if (event->kind != JOB_EVENT_FINISHED) {
            continue;
        }
        finished++;
        if (event->outcome->status != JOB_STATUS_COMPLETED) {
            failed++;
        }
        finish_outcome(*app_state, event->outcome.value());
    }
    fprintf(stdout, "Media relay stopped, %u job(s) finished, %u failed\n", finished, failed);
    return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
