#include <cstdio>

#include <backoffxx/backoffxx.h>

#include "./graph_destination.hpp"

using json = nlohmann::json;

#define RETRIES 5
#define INITIAL_DELAY_SECONDS 5
#define MAX_DELAY_SECONDS 60

#define CHUNK_FILE_NAME "video.mp4"
#define CHUNK_CONTENT_TYPE "video/mp4"
#define THUMB_FILE_NAME "thumb.jpg"
#define THUMB_CONTENT_TYPE "image/jpeg"

GraphDestination::GraphDestination(
    const std::string &id_,
    const std::string &endpoint_,
    const std::string &account_,
    const std::string &access_token_
) :
    id {id_},
    endpoint {endpoint_},
    account {account_},
    access_token {access_token_} {}

const std::string &GraphDestination::get_id() const {
    return id;
}

std::string graph_error_message(long status, const std::string &body) {
    try {
        const auto doc = json::parse(body);
        if (doc.contains("error") && doc["error"].is_object()) {
            const auto &error = doc["error"];
            if (error.contains("message") && error["message"].is_string()) {
                return error["message"].get<std::string>();
            }
        }
    } catch (const json::exception &) {
        // not a JSON body, fall through to the status message
    }
    return std::string("HTTP status ") + std::to_string(status);
}

std::variant<json, std::string> GraphDestination::call(const std::vector<form_field_t> &fields) {
    const auto url = endpoint + "/" + account + "/videos";
    std::string error = "Retry limit reached";
    json body;
    const auto result = backoffxx::attempt(backoffxx::make_exponential(std::chrono::seconds(INITIAL_DELAY_SECONDS), RETRIES, std::chrono::seconds(MAX_DELAY_SECONDS)), [&] {
        const auto ret = http_post_form(url, fields);
        if (std::holds_alternative<std::string>(ret)) {
            // transport failure, no status - make retry
            error = std::get<std::string>(ret);
            return backoffxx::attempt_rc::failure;
        }
        const auto &response = std::get<http_response_t>(ret);
        if (response.status >= 400) {
            error = graph_error_message(response.status, response.body);
            // throttling - make retry
            if (is_transient_status(response.status)) {
                return backoffxx::attempt_rc::failure;
            }
            return backoffxx::attempt_rc::hard_error;
        }
        try {
            body = json::parse(response.body);
        } catch (const json::exception &e) {
            error = std::string("Malformed response: ") + e.what();
            return backoffxx::attempt_rc::hard_error;
        }
        return backoffxx::attempt_rc::success;
    });

    if (!result.ok()) {
        return error;
    }
    return body;
}

std::variant<upload_session_t, std::string> GraphDestination::start(unsigned long long total_length, const upload_metadata_t &metadata) {
    const auto file_size = std::to_string(total_length);
    const auto ret = call({
        {"access_token", access_token},
        {"upload_phase", "start"},
        {"file_size", file_size}
    });
    if (std::holds_alternative<std::string>(ret)) {
        return std::get<std::string>(ret);
    }
    const auto &body = std::get<json>(ret);
    if (!body.contains("upload_session_id")) {
        return std::string("Start response has no upload_session_id");
    }
    const auto &session_id = body["upload_session_id"];
    upload_session_t session { session_id.is_string() ? session_id.get<std::string>() : session_id.dump() };
    if (body.contains("video_id")) {
        const auto &video_id = body["video_id"];
        video_ids[session.handle] = video_id.is_string() ? video_id.get<std::string>() : video_id.dump();
    }
    fprintf(stdout, "[%s] Upload session %s started\n", id.c_str(), session.handle.c_str());
    return session;
}

std::optional<std::string> GraphDestination::transfer(const upload_session_t &session, unsigned long long offset, std::string_view chunk) {
    const auto start_offset = std::to_string(offset);
    const auto ret = call({
        {"access_token", access_token},
        {"upload_phase", "transfer"},
        {"upload_session_id", session.handle},
        {"start_offset", start_offset},
        {"video_file_chunk", chunk, CHUNK_FILE_NAME, CHUNK_CONTENT_TYPE}
    });
    if (std::holds_alternative<std::string>(ret)) {
        return std::get<std::string>(ret);
    }
    return std::nullopt;
}

std::variant<remote_artifact_t, finish_error_t> GraphDestination::finish(const upload_session_t &session, const upload_metadata_t &metadata) {
    std::vector<form_field_t> fields = {
        {"access_token", access_token},
        {"upload_phase", "finish"},
        {"upload_session_id", session.handle},
        {"title", metadata.title},
        {"description", metadata.description}
    };
    const auto with_thumbnail = metadata.thumbnail.has_value();
    if (with_thumbnail) {
        fields.push_back({"thumb", metadata.thumbnail.value(), THUMB_FILE_NAME, THUMB_CONTENT_TYPE});
    }
    const auto ret = call(fields);
    if (std::holds_alternative<std::string>(ret)) {
        // the endpoint does not tell which part failed, blame the optional one first
        return finish_error_t { std::get<std::string>(ret), with_thumbnail };
    }
    const auto &body = std::get<json>(ret);
    if (body.contains("success") && body["success"].is_boolean() && !body["success"].get<bool>()) {
        return finish_error_t { "Finish rejected by destination", with_thumbnail };
    }
    std::string artifact_id;
    if (body.contains("id")) {
        artifact_id = body["id"].is_string() ? body["id"].get<std::string>() : body["id"].dump();
    } else if (video_ids.count(session.handle) > 0) {
        artifact_id = video_ids.at(session.handle);
    } else {
        artifact_id = session.handle;
    }
    video_ids.erase(session.handle);
    return remote_artifact_t { artifact_id };
}
