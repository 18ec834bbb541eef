#include <cstdio>
#include <exception>

#include "./job_queue.hpp"

const char *job_status_name(job_status_t status) {
    switch (status) {
    case JOB_STATUS_PENDING:
        return "pending";
    case JOB_STATUS_PROCESSING:
        return "processing";
    case JOB_STATUS_COMPLETED:
        return "completed";
    case JOB_STATUS_FAILED:
        return "failed";
    default:
        return "<>";
    }
}

JobQueue::JobQueue(job_runner_t runner_, std::unique_ptr<DuplicateIndex> index_, std::chrono::milliseconds job_delay_) :
    runner {std::move(runner_)},
    job_delay {job_delay_},
    index {std::move(index_)},
    stopping {false} {}

JobQueue::~JobQueue() {
    stop();
}

admit_result_t JobQueue::admit(
    const std::string &source_id,
    const std::string &locator,
    const std::vector<std::string> &destinations,
    std::optional<std::string> label
) {
    if (destinations.empty()) {
        return ADMIT_NO_DESTINATIONS;
    }
    std::unique_lock<std::mutex> lock{ mutex };
    for (const auto &j : jobs) {
        if (j.source_id == source_id) {
            return ADMIT_ALREADY_QUEUED;
        }
    }
    jobs.push_back(job_t { source_id, locator, destinations, JOB_STATUS_PENDING, std::move(label), std::chrono::system_clock::now() });
    lock.unlock();
    condition.notify_all();
    return ADMIT_ACCEPTED;
}

bool JobQueue::is_previously_relayed(const std::string &source_id) const {
    std::lock_guard<std::mutex> lock{ mutex };
    return index->contains(source_id);
}

bool JobQueue::has_pending() const {
    for (const auto &j : jobs) {
        if (j.status == JOB_STATUS_PENDING) {
            return true;
        }
    }
    return false;
}

std::optional<job_outcome_t> JobQueue::advance() {
    std::unique_lock<std::mutex> lock{ mutex };
    if (active_source_id.has_value()) {
        return std::nullopt;
    }
    auto job_iter = jobs.begin();
    while (job_iter != jobs.end() && job_iter->status != JOB_STATUS_PENDING) {
        job_iter++;
    }
    if (job_iter == jobs.end()) {
        return std::nullopt;
    }
    job_iter->status = JOB_STATUS_PROCESSING;
    const auto job = *job_iter;
    const auto state = std::make_shared<TransferState>();
    active_source_id = job.source_id;
    active_state = state;
    lock.unlock();

    fprintf(stdout, "[Job %s] Processing %s\n", job.source_id.c_str(), job.locator.c_str());
    events.push_back(job_event_t { JOB_EVENT_STARTED, job.source_id, std::nullopt, std::nullopt });

    job_outcome_t outcome;
    try {
        outcome = runner(job, *state);
    } catch (const std::exception &e) {
        fprintf(stderr, "[Job %s] Unexpected error: %s\n", job.source_id.c_str(), e.what());
        outcome = job_outcome_t {
            job.source_id, job.label, JOB_STATUS_FAILED,
            relay_error_t { RELAY_ERROR_DOWNLOAD_FAILED, std::string("Unexpected error: ") + e.what() },
            {}, 0
        };
    }
    if (!outcome.label.has_value()) {
        outcome.label = job.label;
    }

    lock.lock();
    for (auto iter = jobs.begin(); iter != jobs.end(); iter++) {
        if (iter->source_id == job.source_id && iter->status == JOB_STATUS_PROCESSING) {
            jobs.erase(iter);
            break;
        }
    }
    active_source_id = std::nullopt;
    active_state.reset();
    if (any_succeeded(outcome.results)) {
        try {
            index->add(job.source_id);
        } catch (const std::exception &e) {
            fprintf(stderr, "[Job %s] Could not record relayed source: %s\n", job.source_id.c_str(), e.what());
        }
    }
    lock.unlock();

    if (outcome.status == JOB_STATUS_COMPLETED) {
        fprintf(stdout, "[Job %s] Completed\n", job.source_id.c_str());
    } else {
        fprintf(stderr, "[Job %s] Failed: %s\n", job.source_id.c_str(),
            outcome.error.has_value() ? describe_error(outcome.error.value()).c_str() : "unknown error");
    }
    events.push_back(job_event_t { JOB_EVENT_FINISHED, job.source_id, std::nullopt, outcome });
    return outcome;
}

void JobQueue::start() {
    std::lock_guard<std::mutex> lock{ mutex };
    if (worker.joinable()) {
        return;
    }
    stopping = false;
    worker = std::thread(&JobQueue::worker_loop, this);
}

void JobQueue::stop() {
    std::unique_lock<std::mutex> lock{ mutex };
    if (!worker.joinable()) {
        return;
    }
    stopping = true;
    // a paused download would never return to the worker
    if (active_state && active_state->is_paused()) {
        fprintf(stdout, "[Job %s] Cancelled paused download on stop\n", active_source_id.value_or("").c_str());
        active_state->cancel();
    }
    lock.unlock();
    condition.notify_all();
    worker.join();
}

void JobQueue::worker_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock{ mutex };
            condition.wait(lock, [this] { return stopping || has_pending(); });
            if (stopping) {
                return;
            }
        }
        advance();
        // fixed pause between jobs, cut short by stop()
        std::unique_lock<std::mutex> lock{ mutex };
        if (condition.wait_for(lock, job_delay, [this] { return stopping; })) {
            return;
        }
    }
}

std::shared_ptr<TransferState> JobQueue::active_state_for(const std::string &source_id) const {
    std::lock_guard<std::mutex> lock{ mutex };
    if (!active_source_id.has_value() || active_source_id.value() != source_id) {
        return nullptr;
    }
    return active_state;
}

bool JobQueue::pause(const std::string &source_id) {
    // under the queue lock so that stop() cannot miss a new pause
    std::lock_guard<std::mutex> lock{ mutex };
    if (stopping || !active_source_id.has_value() || active_source_id.value() != source_id) {
        return false;
    }
    return active_state->pause();
}

bool JobQueue::resume(const std::string &source_id) {
    const auto state = active_state_for(source_id);
    return state && state->resume();
}

bool JobQueue::cancel(const std::string &source_id) {
    const auto state = active_state_for(source_id);
    return state && state->cancel();
}

size_t JobQueue::remove_pending() {
    std::lock_guard<std::mutex> lock{ mutex };
    size_t removed = 0;
    for (auto iter = jobs.begin(); iter != jobs.end();) {
        if (iter->status == JOB_STATUS_PENDING) {
            iter = jobs.erase(iter);
            removed++;
        } else {
            iter++;
        }
    }
    return removed;
}

std::vector<job_t> JobQueue::list() const {
    std::lock_guard<std::mutex> lock{ mutex };
    return std::vector<job_t>(jobs.begin(), jobs.end());
}

bool JobQueue::is_idle() const {
    std::lock_guard<std::mutex> lock{ mutex };
    return jobs.empty();
}

void JobQueue::clear_history() {
    std::lock_guard<std::mutex> lock{ mutex };
    index->clear();
}

progress_sink_t JobQueue::progress_sink() {
    return [this](const progress_event_t &event) {
        events.push_back(job_event_t { JOB_EVENT_PROGRESS, event.source_id, event, std::nullopt });
    };
}

ThreadSafeDeque<job_event_t> &JobQueue::get_event_queue() {
    return events;
}
