#pragma once

#include <string>
#include <variant>

#include "../errors/errors.hpp"
#include "../progress/progress.hpp"
#include "../source/fragment_source.hpp"
#include "../transfer_state/transfer_state.hpp"

// Pulls a source stream into a TransferState and yields the whole payload.
class Downloader {
  public:
    Downloader(fragment_source_factory_t source_factory_, progress_sink_t progress_sink_ = nullptr);

    // Returns the payload, byte-for-byte identical to the inbound stream, or
    // SOURCE_UNAVAILABLE / DOWNLOAD_FAILED / CANCELLED. The state is finished
    // when this returns. A partial payload is never returned.
    std::variant<std::string, relay_error_t> download(const std::string &source_id, const std::string &url, TransferState &state);

  private:
    fragment_source_factory_t source_factory;
    progress_sink_t progress_sink;
};
