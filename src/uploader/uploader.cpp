#include <chrono>
#include <cstdio>

#include "./uploader.hpp"
#include "../progress/throttle.hpp"

MultiDestinationUploader::MultiDestinationUploader(destination_provider_t provider_, progress_sink_t sink_, unsigned long long chunk_size_) :
    provider {provider_},
    sink {sink_},
    chunk_size {chunk_size_} {}

static destination_result_t failed_result(const std::string &destination_id, relay_error_kind_t kind, const std::string &message) {
    fprintf(stderr, "[%s] Upload failed: %s\n", destination_id.c_str(), message.c_str());
    return destination_result_t { destination_id, false, relay_error_t { kind, message }, std::nullopt };
}

std::vector<destination_result_t> MultiDestinationUploader::upload(
    const std::string &source_id,
    std::string_view buffer,
    const std::vector<std::string> &destination_ids,
    const upload_metadata_t &metadata
) {
    std::vector<destination_result_t> results;
    for (const auto &destination_id : destination_ids) {
        auto destination_ret = provider(destination_id);
        if (std::holds_alternative<std::string>(destination_ret)) {
            results.push_back(failed_result(destination_id, RELAY_ERROR_DESTINATION_SESSION_FAILED, std::get<std::string>(destination_ret)));
            continue;
        }
        auto destination = std::move(std::get<std::unique_ptr<UploadDestination>>(destination_ret));
        results.push_back(upload_to(source_id, buffer, *destination, metadata));
    }
    return results;
}

destination_result_t MultiDestinationUploader::upload_to(const std::string &source_id, std::string_view buffer, UploadDestination &destination, const upload_metadata_t &metadata) {
    const auto &destination_id = destination.get_id();

    const auto session_ret = destination.start(buffer.size(), metadata);
    if (std::holds_alternative<std::string>(session_ret)) {
        return failed_result(destination_id, RELAY_ERROR_DESTINATION_SESSION_FAILED, "Start failed: " + std::get<std::string>(session_ret));
    }
    const auto session = std::get<upload_session_t>(session_ret);

    ProgressThrottle throttle(upload_window());
    const auto started_at = std::chrono::steady_clock::now();
    ChunkCursor cursor(buffer, chunk_size);
    while (cursor.has_next()) {
        const auto chunk = cursor.next();
        const auto transfer_ret = destination.transfer(session, chunk.offset, chunk.data);
        if (transfer_ret.has_value()) {
            destination.abandon(session);
            return failed_result(destination_id, RELAY_ERROR_DESTINATION_SESSION_FAILED,
                "Transfer at offset " + std::to_string(chunk.offset) + " failed: " + transfer_ret.value());
        }

        const auto now = std::chrono::steady_clock::now();
        const auto percent = cursor.percent();
        if (!throttle.should_emit(percent, now)) {
            continue;
        }
        const auto elapsed = std::chrono::duration<double>(now - started_at).count();
        std::optional<double> rate;
        if (elapsed > 0) {
            rate = (double) cursor.offset() / elapsed;
        }
        deliver_progress(sink, progress_event_t {
            source_id, PROGRESS_PHASE_UPLOAD, percent, cursor.offset(), cursor.length(), rate, destination_id, false
        });
    }

    auto finish_ret = destination.finish(session, metadata);
    if (std::holds_alternative<finish_error_t>(finish_ret)) {
        const auto finish_error = std::get<finish_error_t>(finish_ret);
        if (!finish_error.secondary_artifact || !metadata.thumbnail.has_value()) {
            return failed_result(destination_id, RELAY_ERROR_DESTINATION_SESSION_FAILED, "Finish failed: " + finish_error.error);
        }
        fprintf(stderr, "[%s] Finish with thumbnail failed, retrying without it: %s\n", destination_id.c_str(), finish_error.error.c_str());
        auto without_thumbnail = metadata;
        without_thumbnail.thumbnail = std::nullopt;
        finish_ret = destination.finish(session, without_thumbnail);
        if (std::holds_alternative<finish_error_t>(finish_ret)) {
            return failed_result(destination_id, RELAY_ERROR_SECONDARY_ARTIFACT_FAILED,
                "Finish failed with and without thumbnail: " + std::get<finish_error_t>(finish_ret).error);
        }
    }

    const auto artifact = std::get<remote_artifact_t>(finish_ret);
    fprintf(stdout, "[%s] Upload of %s finished as %s\n", destination_id.c_str(), source_id.c_str(), artifact.id.c_str());
    return destination_result_t { destination_id, true, std::nullopt, artifact.id };
}

bool any_succeeded(const std::vector<destination_result_t> &results) {
    for (const auto &result : results) {
        if (result.success) {
            return true;
        }
    }
    return false;
}
