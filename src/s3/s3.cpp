#include <cstdio>
#include <sstream>

#include <backoffxx/backoffxx.h>

#include "./s3.hpp"

#define RETRIES 5
#define INITIAL_DELAY_SECONDS 5
#define MAX_DELAY_SECONDS 60

S3Destination::S3Destination(
    const std::string &id_,
    const std::string &url_,
    const std::string &access_key_,
    const std::string &secret_key_,
    const std::string &bucket_,
    const std::string &region_,
    const std::filesystem::path &path_to_
) :
    id {id_},
    bucket {bucket_},
    region {region_},
    path_to {path_to_} {
    base_url = std::make_unique<minio::s3::BaseUrl>(url_);
    provider = std::make_unique<minio::creds::StaticProvider>(access_key_, secret_key_);
    client = std::make_unique<minio::s3::Client>(*base_url, provider.get());
}

static std::string replace(std::string subject, const std::string& search, const std::string& replace) {
    size_t pos = 0;
    while((pos = subject.find(search, pos)) != std::string::npos) {
        subject.replace(pos, search.length(), replace);
        pos += replace.length();
    }
    return subject;
}

// runs a minio call, retrying throttled and connection failures.
// call returns the response, error is filled on hard failure.
template<class Call>
static bool with_retries(Call call, std::string &error) {
    error = "Retry limit reached";
    const auto result = backoffxx::attempt(backoffxx::make_exponential(std::chrono::seconds(INITIAL_DELAY_SECONDS), RETRIES, std::chrono::seconds(MAX_DELAY_SECONDS)), [&] {
        const auto resp = call();
        if (!resp) {
            // throttling - make retry
            if (resp.status_code == 429 || resp.status_code == 0) {
                return backoffxx::attempt_rc::failure;
            }
            error = resp.Error().String();
            return backoffxx::attempt_rc::hard_error;
        }
        return backoffxx::attempt_rc::success;
    });
    return result.ok();
}

const std::string &S3Destination::get_id() const {
    return id;
}

std::string S3Destination::object_key(const std::string &object_name) const {
    return replace((path_to / object_name).lexically_normal().string(), "\\", "/");
}

std::variant<upload_session_t, std::string> S3Destination::start(unsigned long long total_length, const upload_metadata_t &metadata) {
    minio::s3::CreateMultipartUploadArgs args;
    args.bucket = bucket;
    args.object = object_key(metadata.object_name);
    if (!region.empty()) {
        args.region = region;
    }

    std::string error;
    minio::s3::CreateMultipartUploadResponse response;
    const auto ok = with_retries([&] {
        response = client->CreateMultipartUpload(args);
        return response;
    }, error);
    if (!ok) {
        return error;
    }
    uploads[response.upload_id] = multipart_t { args.object, 0, {} };
    fprintf(stdout, "[%s] Multipart upload of %llu bytes to \"%s\" started\n", id.c_str(), total_length, args.object.c_str());
    return upload_session_t { response.upload_id };
}

std::optional<std::string> S3Destination::transfer(const upload_session_t &session, unsigned long long offset, std::string_view chunk) {
    const auto upload_iter = uploads.find(session.handle);
    if (upload_iter == uploads.end()) {
        return std::string("Unknown upload session ") + session.handle;
    }
    auto &upload = upload_iter->second;
    // parts are numbered, so chunks must arrive in offset order without gaps
    if (offset != upload.next_offset) {
        return std::string("Out of order chunk at offset ") + std::to_string(offset) + ", expected " + std::to_string(upload.next_offset);
    }

    minio::s3::UploadPartArgs args;
    args.bucket = bucket;
    args.object = upload.object;
    args.upload_id = session.handle;
    args.part_number = (unsigned int) upload.parts.size() + 1;
    args.data = chunk;
    if (!region.empty()) {
        args.region = region;
    }

    std::string error;
    minio::s3::UploadPartResponse response;
    const auto ok = with_retries([&] {
        response = client->UploadPart(args);
        return response;
    }, error);
    if (!ok) {
        return error;
    }
    minio::s3::Part part;
    part.number = args.part_number;
    part.etag = response.etag;
    upload.parts.push_back(part);
    upload.next_offset += chunk.size();
    return std::nullopt;
}

static std::optional<std::string> write_content_s3(const std::string &content, minio::s3::Client &client, const std::string &bucket, const std::string &region, const std::string &object) {
    std::stringstream stream(content);
    minio::s3::PutObjectArgs args(stream, (long) content.size(), 0);
    args.bucket = bucket;
    args.object = object;
    if (!region.empty()) {
        args.region = region;
    }

    std::string error;
    const auto ok = with_retries([&] {
        args.stream.clear();
        args.stream.seekg(0);
        return client.PutObject(args);
    }, error);
    if (!ok) {
        return error;
    }
    return std::nullopt;
}

std::variant<remote_artifact_t, finish_error_t> S3Destination::finish(const upload_session_t &session, const upload_metadata_t &metadata) {
    const auto upload_iter = uploads.find(session.handle);
    if (upload_iter == uploads.end()) {
        return finish_error_t { std::string("Unknown upload session ") + session.handle, false };
    }
    const auto &upload = upload_iter->second;

    // the thumbnail goes first so that a retry without it completes the same session
    if (metadata.thumbnail.has_value()) {
        const auto thumbnail_ret = write_content_s3(metadata.thumbnail.value(), *client, bucket, region, upload.object + THUMBNAIL_SUFFIX);
        if (thumbnail_ret.has_value()) {
            return finish_error_t { "Could not upload thumbnail: " + thumbnail_ret.value(), true };
        }
    }

    minio::s3::CompleteMultipartUploadArgs args;
    args.bucket = bucket;
    args.object = upload.object;
    args.upload_id = session.handle;
    args.parts = upload.parts;
    if (!region.empty()) {
        args.region = region;
    }

    std::string error;
    const auto ok = with_retries([&] {
        return client->CompleteMultipartUpload(args);
    }, error);
    if (!ok) {
        return finish_error_t { error, false };
    }
    const auto object = upload.object;
    uploads.erase(upload_iter);
    return remote_artifact_t { object };
}

void S3Destination::abandon(const upload_session_t &session) {
    const auto upload_iter = uploads.find(session.handle);
    if (upload_iter == uploads.end()) {
        return;
    }
    minio::s3::AbortMultipartUploadArgs args;
    args.bucket = bucket;
    args.object = upload_iter->second.object;
    args.upload_id = session.handle;
    if (!region.empty()) {
        args.region = region;
    }
    const auto resp = client->AbortMultipartUpload(args);
    if (!resp) {
        fprintf(stderr, "[%s] Could not abort multipart upload %s: %s\n", id.c_str(), session.handle.c_str(), resp.Error().String().c_str());
    }
    uploads.erase(upload_iter);
}
