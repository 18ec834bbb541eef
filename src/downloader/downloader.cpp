#include <cstdio>

#include "../progress/throttle.hpp"

#include "./downloader.hpp"

Downloader::Downloader(fragment_source_factory_t source_factory_, progress_sink_t progress_sink_) :
    source_factory {std::move(source_factory_)},
    progress_sink {std::move(progress_sink_)} {}

static relay_error_t abort_download(std::unique_ptr<FragmentSource> &source, TransferState &state, relay_error_t error) {
    // release the connection before anything else
    source.reset();
    state.finish();
    state.discard_buffer();
    return error;
}

static relay_error_t cancelled_error() {
    return relay_error_t { RELAY_ERROR_CANCELLED, "Download cancelled by operator" };
}

static void report(const progress_sink_t &sink, ProgressThrottle &throttle, const std::string &source_id, const TransferState &state) {
    const auto now = std::chrono::steady_clock::now();
    const auto snapshot = state.snapshot();
    const auto percent = progress_percent(snapshot.downloaded_bytes, snapshot.total_bytes);
    if (!throttle.should_emit(percent, now)) {
        return;
    }
    const auto elapsed = std::chrono::duration<double>(now - state.get_started_at()).count();
    std::optional<double> rate;
    if (elapsed > 0) {
        rate = snapshot.downloaded_bytes / elapsed;
    }
    deliver_progress(sink, progress_event_t {
        source_id,
        PROGRESS_PHASE_DOWNLOAD,
        percent,
        snapshot.downloaded_bytes,
        snapshot.total_bytes,
        rate,
        std::nullopt,
        snapshot.paused
    });
}

std::variant<std::string, relay_error_t> Downloader::download(const std::string &source_id, const std::string &url, TransferState &state) {
    auto source = source_factory(url, [&state]() { return state.is_cancelled(); });
    if (!source) {
        state.finish();
        return relay_error_t { RELAY_ERROR_SOURCE_UNAVAILABLE, "Cannot open source " + url };
    }

    ProgressThrottle throttle(download_window());
    bool received_any = false;
    bool length_checked = false;

    while (true) {
        if (state.is_cancelled()) {
            return abort_download(source, state, cancelled_error());
        }
        auto event = source->next();
        if (std::holds_alternative<stream_error_t>(event)) {
            if (state.is_cancelled()) {
                return abort_download(source, state, cancelled_error());
            }
            const auto &error = std::get<stream_error_t>(event).error;
            const auto kind = received_any ? RELAY_ERROR_DOWNLOAD_FAILED : RELAY_ERROR_SOURCE_UNAVAILABLE;
            return abort_download(source, state, relay_error_t { kind, error });
        }
        if (std::holds_alternative<stream_end_t>(event)) {
            break;
        }
        auto &fragment = std::get<fragment_t>(event);
        if (!length_checked) {
            length_checked = true;
            const auto declared = source->declared_length();
            if (declared.has_value() && declared.value() != state.get_total_bytes()) {
                state.correct_total(declared.value());
            }
        }
        // suspends here while paused, cancel wakes it up
        if (!state.wait_while_paused()) {
            return abort_download(source, state, cancelled_error());
        }
        state.append(std::move(fragment.data));
        received_any = true;
        report(progress_sink, throttle, source_id, state);
    }

    source.reset();
    state.finish();
    // cancel could have landed after the last fragment
    if (state.is_cancelled()) {
        state.discard_buffer();
        return cancelled_error();
    }
    if (!received_any) {
        return relay_error_t { RELAY_ERROR_SOURCE_UNAVAILABLE, "Source returned an empty payload" };
    }
    const auto total = state.get_total_bytes();
    const auto received = state.get_downloaded_bytes();
    if (total > 0 && total != received) {
        fprintf(stderr, "[%s] Declared size %llu differs from received %llu bytes, using received size\n", source_id.c_str(), total, received);
    }
    return state.take_buffer();
}
