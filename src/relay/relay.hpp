#pragma once

#include <memory>
#include <string>
#include <variant>
#include <optional>
#include <functional>

#include "../config/config.hpp"
#include "../destination/destination.hpp"
#include "../job_queue/job.hpp"
#include "../progress/progress.hpp"
#include "../source/fragment_source.hpp"
#include "../source/resolver.hpp"
#include "../transfer_state/transfer_state.hpp"

#define OBJECT_EXTENSION ".mp4"

typedef std::function<std::variant<std::unique_ptr<UploadDestination>, std::string>(const destination_config_t &config)> destination_factory_t;
// returns the image bytes or std::nullopt
typedef std::function<std::optional<std::string>(const std::string &url)> thumbnail_fetcher_t;

// The job pipeline: resolve the locator, download the payload, upload it
// to every destination of the job and fold the results into an outcome.
class Relay {
  public:
    Relay(
        std::shared_ptr<SourceResolver> resolver_,
        fragment_source_factory_t source_factory_,
        credential_store_t credentials_,
        destination_factory_t destination_factory_ = make_destination,
        progress_sink_t progress_sink_ = nullptr,
        thumbnail_fetcher_t thumbnail_fetcher_ = nullptr,
        unsigned long long chunk_size_ = UPLOAD_CHUNK_SIZE
    );

    job_outcome_t run(const job_t &job, TransferState &state);

  private:
    std::shared_ptr<SourceResolver> resolver;
    fragment_source_factory_t source_factory;
    credential_store_t credentials;
    destination_factory_t destination_factory;
    progress_sink_t progress_sink;
    thumbnail_fetcher_t thumbnail_fetcher;
    unsigned long long chunk_size;
};

// GET of the thumbnail URL, std::nullopt (with a warning) on any failure
std::optional<std::string> fetch_thumbnail(const std::string &url);

// destination object name derived from a source id
std::string object_name_for(const std::string &source_id);
