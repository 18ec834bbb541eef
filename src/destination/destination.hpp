#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <optional>

#include "../config/config.hpp"

struct upload_metadata_t {
    // stable name of the payload on the destination
    std::string object_name;
    std::string title;
    std::string description;
    // optional secondary artifact (thumbnail image bytes)
    std::optional<std::string> thumbnail;
};

struct upload_session_t {
    std::string handle;
};

struct remote_artifact_t {
    std::string id;
};

struct finish_error_t {
    std::string error;
    // true when the failure is attributed to the secondary artifact and a
    // finish without it may still succeed
    bool secondary_artifact;
};

// One upload target speaking a 3-phase session protocol:
// start -> transfer (chunks in strictly increasing offset order) -> finish.
class UploadDestination {
  public:
    virtual ~UploadDestination() = default;

    virtual const std::string &get_id() const = 0;

    virtual std::variant<upload_session_t, std::string> start(unsigned long long total_length, const upload_metadata_t &metadata) = 0;

    // optionally returns an error
    virtual std::optional<std::string> transfer(const upload_session_t &session, unsigned long long offset, std::string_view chunk) = 0;

    virtual std::variant<remote_artifact_t, finish_error_t> finish(const upload_session_t &session, const upload_metadata_t &metadata) = 0;

    // releases server side resources of a session that will not be finished
    virtual void abandon(const upload_session_t &session) {}
};

std::variant<std::unique_ptr<UploadDestination>, std::string> make_destination(const destination_config_t &config);
