#pragma once

#include <unordered_map>

#include <nlohmann/json.hpp>

#include "../curl/curl.hpp"
#include "./destination.hpp"

// Chunked video upload through a Graph-style endpoint:
// POST <endpoint>/<account>/videos with upload_phase=start|transfer|finish.
class GraphDestination : public UploadDestination {
  public:
    GraphDestination(
        const std::string &id_,
        const std::string &endpoint_,
        const std::string &account_,
        const std::string &access_token_
    );

    const std::string &get_id() const override;
    std::variant<upload_session_t, std::string> start(unsigned long long total_length, const upload_metadata_t &metadata) override;
    std::optional<std::string> transfer(const upload_session_t &session, unsigned long long offset, std::string_view chunk) override;
    std::variant<remote_artifact_t, finish_error_t> finish(const upload_session_t &session, const upload_metadata_t &metadata) override;

  private:
    // posts the form, retrying throttled and transport failures
    std::variant<nlohmann::json, std::string> call(const std::vector<form_field_t> &fields);

    const std::string id;
    const std::string endpoint;
    const std::string account;
    const std::string access_token;

    // upload session -> video id announced by the start phase
    std::unordered_map<std::string, std::string> video_ids;
};

// error.message of a Graph error body, or a generic HTTP status message
std::string graph_error_message(long status, const std::string &body);
