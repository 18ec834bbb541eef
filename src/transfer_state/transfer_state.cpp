#include "./transfer_state.hpp"

TransferState::TransferState(unsigned long long provisional_total) :
    total_bytes {provisional_total},
    downloaded_bytes {0},
    total_corrected {false},
    paused {false},
    cancelled {false},
    finished {false},
    started_at {std::chrono::steady_clock::now()} {}

bool TransferState::pause() {
    std::lock_guard<std::mutex> lock{ mutex };
    if (finished || cancelled) {
        return false;
    }
    paused = true;
    return true;
}

bool TransferState::resume() {
    std::unique_lock<std::mutex> lock{ mutex };
    if (finished || cancelled) {
        return false;
    }
    paused = false;
    lock.unlock();
    condition.notify_all();
    return true;
}

bool TransferState::cancel() {
    std::unique_lock<std::mutex> lock{ mutex };
    if (finished) {
        return false;
    }
    cancelled = true;
    lock.unlock();
    // wakes up a download suspended in wait_while_paused
    condition.notify_all();
    return true;
}

bool TransferState::is_paused() const {
    std::lock_guard<std::mutex> lock{ mutex };
    return paused;
}

bool TransferState::is_cancelled() const {
    std::lock_guard<std::mutex> lock{ mutex };
    return cancelled;
}

bool TransferState::is_finished() const {
    std::lock_guard<std::mutex> lock{ mutex };
    return finished;
}

bool TransferState::wait_while_paused() {
    std::unique_lock<std::mutex> lock{ mutex };
    condition.wait(lock, [this] { return !paused || cancelled; });
    return !cancelled;
}

void TransferState::set_provisional_total(unsigned long long provisional_total) {
    std::lock_guard<std::mutex> lock{ mutex };
    if (total_corrected) {
        return;
    }
    total_bytes = provisional_total;
}

void TransferState::correct_total(unsigned long long declared_total) {
    std::lock_guard<std::mutex> lock{ mutex };
    if (total_corrected || declared_total == 0) {
        return;
    }
    total_corrected = true;
    total_bytes = declared_total;
}

void TransferState::append(std::string fragment) {
    std::lock_guard<std::mutex> lock{ mutex };
    if (cancelled) {
        return;
    }
    downloaded_bytes += fragment.size();
    buffered_chunks.push_back(std::move(fragment));
}

std::string TransferState::take_buffer() {
    std::lock_guard<std::mutex> lock{ mutex };
    std::string buffer;
    buffer.reserve(downloaded_bytes);
    for (const auto &c : buffered_chunks) {
        buffer.append(c);
    }
    buffered_chunks.clear();
    return buffer;
}

void TransferState::discard_buffer() {
    std::lock_guard<std::mutex> lock{ mutex };
    buffered_chunks.clear();
    buffered_chunks.shrink_to_fit();
}

void TransferState::finish() {
    std::unique_lock<std::mutex> lock{ mutex };
    finished = true;
    paused = false;
    lock.unlock();
    condition.notify_all();
}

unsigned long long TransferState::get_total_bytes() const {
    std::lock_guard<std::mutex> lock{ mutex };
    return total_bytes;
}

unsigned long long TransferState::get_downloaded_bytes() const {
    std::lock_guard<std::mutex> lock{ mutex };
    return downloaded_bytes;
}

std::chrono::steady_clock::time_point TransferState::get_started_at() const {
    return started_at;
}

size_t TransferState::get_chunk_count() const {
    std::lock_guard<std::mutex> lock{ mutex };
    return buffered_chunks.size();
}

transfer_snapshot_t TransferState::snapshot() const {
    std::lock_guard<std::mutex> lock{ mutex };
    return transfer_snapshot_t { total_bytes, downloaded_bytes, paused, cancelled, finished };
}
