#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include <condition_variable>

struct transfer_snapshot_t {
    unsigned long long total_bytes;
    unsigned long long downloaded_bytes;
    bool paused;
    bool cancelled;
    bool finished;
};

// State of one inbound download. pause(), resume() and cancel() may be called
// from any thread; the byte accounting is only advanced by the download itself.
class TransferState {
  public:
    explicit TransferState(unsigned long long provisional_total = 0);

    // the following return false if the download phase is already over
    bool pause();
    bool resume();
    bool cancel();

    bool is_paused() const;
    bool is_cancelled() const;
    bool is_finished() const;

    // blocks while paused; returns false when the transfer got cancelled
    bool wait_while_paused();

    // best known total before the transfer starts, ignored once corrected
    void set_provisional_total(unsigned long long provisional_total);
    // replaces the provisional total with the length declared by the
    // source, at most once
    void correct_total(unsigned long long declared_total);
    void append(std::string fragment);
    // concatenates buffered chunks in arrival order and releases them
    std::string take_buffer();
    // drops a partial payload after a cancel or a stream error
    void discard_buffer();
    // marks the end of the download phase, later control calls are ignored.
    // Check is_cancelled() after finish() to know the final verdict.
    void finish();

    unsigned long long get_total_bytes() const;
    unsigned long long get_downloaded_bytes() const;
    std::chrono::steady_clock::time_point get_started_at() const;
    size_t get_chunk_count() const;
    transfer_snapshot_t snapshot() const;

  private:
    mutable std::mutex mutex;
    std::condition_variable condition;

    unsigned long long total_bytes;
    unsigned long long downloaded_bytes;
    bool total_corrected;
    bool paused;
    bool cancelled;
    bool finished;
    const std::chrono::steady_clock::time_point started_at;
    std::vector<std::string> buffered_chunks;
};
