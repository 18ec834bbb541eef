#pragma once

#include <vector>
#include <memory>
#include <string>
#include <optional>
#include <variant>
#include <functional>
#include <string_view>

#include "../chunk_cursor/chunk_cursor.hpp"
#include "../destination/destination.hpp"
#include "../errors/errors.hpp"
#include "../progress/progress.hpp"

struct destination_result_t {
    std::string destination_id;
    bool success;
    // set iff !success
    std::optional<relay_error_t> error;
    // set iff success
    std::optional<std::string> artifact_id;
};

// Builds the destination for an id, or tells why it cannot. The destination
// is destroyed right after its upload, so credentials do not outlive it.
typedef std::function<std::variant<std::unique_ptr<UploadDestination>, std::string>(const std::string &destination_id)> destination_provider_t;

class MultiDestinationUploader {
  public:
    MultiDestinationUploader(destination_provider_t provider_, progress_sink_t sink_ = nullptr, unsigned long long chunk_size_ = UPLOAD_CHUNK_SIZE);

    // one result per destination id, in the given order
    std::vector<destination_result_t> upload(
        const std::string &source_id,
        std::string_view buffer,
        const std::vector<std::string> &destination_ids,
        const upload_metadata_t &metadata
    );

  private:
    destination_result_t upload_to(const std::string &source_id, std::string_view buffer, UploadDestination &destination, const upload_metadata_t &metadata);

    destination_provider_t provider;
    progress_sink_t sink;
    unsigned long long chunk_size;
};

bool any_succeeded(const std::vector<destination_result_t> &results);
