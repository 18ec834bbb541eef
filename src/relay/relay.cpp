#include <cctype>
#include <cstdio>

#include "./relay.hpp"
#include "../curl/curl.hpp"
#include "../downloader/downloader.hpp"
#include "../uploader/uploader.hpp"

Relay::Relay(
    std::shared_ptr<SourceResolver> resolver_,
    fragment_source_factory_t source_factory_,
    credential_store_t credentials_,
    destination_factory_t destination_factory_,
    progress_sink_t progress_sink_,
    thumbnail_fetcher_t thumbnail_fetcher_,
    unsigned long long chunk_size_
) :
    resolver {resolver_},
    source_factory {std::move(source_factory_)},
    credentials {std::move(credentials_)},
    destination_factory {std::move(destination_factory_)},
    progress_sink {std::move(progress_sink_)},
    thumbnail_fetcher {std::move(thumbnail_fetcher_)},
    chunk_size {chunk_size_} {}

std::optional<std::string> fetch_thumbnail(const std::string &url) {
    const auto ret = http_get(url);
    if (std::holds_alternative<std::string>(ret)) {
        fprintf(stderr, "Could not fetch thumbnail %s: %s\n", url.c_str(), std::get<std::string>(ret).c_str());
        return std::nullopt;
    }
    const auto &response = std::get<http_response_t>(ret);
    if (response.status >= 400 || response.body.empty()) {
        fprintf(stderr, "Could not fetch thumbnail %s: HTTP status %ld\n", url.c_str(), response.status);
        return std::nullopt;
    }
    return response.body;
}

std::string object_name_for(const std::string &source_id) {
    std::string name;
    for (const auto c : source_id) {
        if (std::isalnum((unsigned char) c) || c == '-' || c == '_' || c == '.') {
            name.push_back(c);
        } else {
            name.push_back('_');
        }
    }
    if (name.empty()) {
        name = "payload";
    }
    return name + OBJECT_EXTENSION;
}

static job_outcome_t failed_outcome(const job_t &job, const std::optional<std::string> &label, relay_error_t error) {
    return job_outcome_t { job.source_id, label, JOB_STATUS_FAILED, std::move(error), {}, 0 };
}

job_outcome_t Relay::run(const job_t &job, TransferState &state) {
    const auto resolve_ret = resolver->resolve(job.locator);
    if (std::holds_alternative<std::string>(resolve_ret)) {
        state.finish();
        return failed_outcome(job, job.label, relay_error_t { RELAY_ERROR_SOURCE_UNAVAILABLE, std::get<std::string>(resolve_ret) });
    }
    const auto &resolved = std::get<resolved_source_t>(resolve_ret);
    // an operator supplied label doubles as the caption
    const auto title = job.label.value_or(resolved.title);
    fprintf(stdout, "[Job %s] Resolved \"%s\"\n", job.source_id.c_str(), title.c_str());

    state.set_provisional_total(resolved.declared_size);
    Downloader downloader(source_factory, progress_sink);
    auto download_ret = downloader.download(job.source_id, resolved.url, state);
    if (std::holds_alternative<relay_error_t>(download_ret)) {
        return failed_outcome(job, title, std::get<relay_error_t>(download_ret));
    }
    const auto payload = std::move(std::get<std::string>(download_ret));
    fprintf(stdout, "[Job %s] Downloaded %s\n", job.source_id.c_str(), format_bytes(payload.size()).c_str());

    upload_metadata_t metadata { object_name_for(job.source_id), title, title, std::nullopt };
    if (resolved.thumbnail_url.has_value() && thumbnail_fetcher) {
        metadata.thumbnail = thumbnail_fetcher(resolved.thumbnail_url.value());
    }

    const auto &store = credentials;
    const auto &factory = destination_factory;
    MultiDestinationUploader uploader([&store, &factory](const std::string &destination_id) -> std::variant<std::unique_ptr<UploadDestination>, std::string> {
        const auto config_iter = store.find(destination_id);
        if (config_iter == store.end()) {
            return std::string("No credentials for destination \"") + destination_id + "\"";
        }
        return factory(config_iter->second);
    }, progress_sink, chunk_size);
    auto results = uploader.upload(job.source_id, payload, job.destinations, metadata);

    if (!any_succeeded(results)) {
        return job_outcome_t {
            job.source_id, title, JOB_STATUS_FAILED,
            relay_error_t { RELAY_ERROR_ALL_DESTINATIONS_FAILED, "None of " + std::to_string(results.size()) + " destinations accepted the payload" },
            std::move(results), payload.size()
        };
    }
    return job_outcome_t { job.source_id, title, JOB_STATUS_COMPLETED, std::nullopt, std::move(results), payload.size() };
}
