#pragma once

#include <deque>
#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <optional>
#include <functional>
#include <condition_variable>

#include "./job.hpp"
#include "../config/config.hpp"
#include "../deque/deque.hpp"
#include "../duplicate_index/duplicate_index.hpp"
#include "../progress/progress.hpp"
#include "../transfer_state/transfer_state.hpp"

enum admit_result_t {
    ADMIT_ACCEPTED = 0,
    // a job for this source is pending or processing
    ADMIT_ALREADY_QUEUED = 1,
    ADMIT_NO_DESTINATIONS = 2
};

enum job_event_kind_t {
    JOB_EVENT_STARTED = 0,
    JOB_EVENT_PROGRESS = 1,
    JOB_EVENT_FINISHED = 2
};

struct job_event_t {
    job_event_kind_t kind;
    std::string source_id;
    // set for JOB_EVENT_PROGRESS
    std::optional<progress_event_t> progress;
    // set for JOB_EVENT_FINISHED
    std::optional<job_outcome_t> outcome;
};

// Runs one job end to end. The state is the job's download control,
// operator calls reach it while the runner is busy.
typedef std::function<job_outcome_t(const job_t &job, TransferState &state)> job_runner_t;

// FIFO of relay jobs, at most one processing at a time.
// All public methods are thread-safe.
class JobQueue {
  public:
    JobQueue(job_runner_t runner_, std::unique_ptr<DuplicateIndex> index_, std::chrono::milliseconds job_delay_ = std::chrono::milliseconds(DEFAULT_JOB_DELAY_MS));
    ~JobQueue();

    // appends a pending job and wakes the worker, never runs the job itself
    admit_result_t admit(
        const std::string &source_id,
        const std::string &locator,
        const std::vector<std::string> &destinations,
        std::optional<std::string> label = std::nullopt
    );
    // true if the source already reached a destination in an earlier job
    bool is_previously_relayed(const std::string &source_id) const;

    // Processes the oldest pending job, if nothing is processing.
    // Returns std::nullopt when no job was run.
    std::optional<job_outcome_t> advance();

    // self-driving mode: a worker thread advances the queue with a delay
    // between jobs and sleeps while the queue is empty
    void start();
    // lets the current job finish and joins the worker,
    // a paused download is cancelled instead
    void stop();

    // route to the active download; false if no live download matches
    bool pause(const std::string &source_id);
    bool resume(const std::string &source_id);
    bool cancel(const std::string &source_id);

    // drops all pending jobs, returns how many were dropped
    size_t remove_pending();
    std::vector<job_t> list() const;
    // nothing pending and nothing processing
    bool is_idle() const;
    void clear_history();

    // sink publishing progress events on the event queue
    progress_sink_t progress_sink();
    ThreadSafeDeque<job_event_t> &get_event_queue();

  private:
    bool has_pending() const;
    std::shared_ptr<TransferState> active_state_for(const std::string &source_id) const;
    void worker_loop();

    job_runner_t runner;
    std::chrono::milliseconds job_delay;

    mutable std::mutex mutex;
    std::condition_variable condition;
    std::deque<job_t> jobs;
    std::unique_ptr<DuplicateIndex> index;
    std::optional<std::string> active_source_id;
    std::shared_ptr<TransferState> active_state;
    bool stopping;
    std::thread worker;

    ThreadSafeDeque<job_event_t> events;
};
