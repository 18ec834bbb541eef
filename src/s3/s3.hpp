#pragma once

#include <list>
#include <memory>
#include <filesystem>
#include <unordered_map>

#include <miniocpp/client.h>

#include "../destination/destination.hpp"

#define THUMBNAIL_SUFFIX ".thumb.jpg"

// S3 multipart upload as a session destination:
// start = CreateMultipartUpload, transfer = UploadPart,
// finish = optional thumbnail PutObject + CompleteMultipartUpload.
class S3Destination : public UploadDestination {
  public:
    // path_to_ - key prefix of uploaded objects
    S3Destination(
        const std::string &id_,
        const std::string &url_,
        const std::string &access_key_,
        const std::string &secret_key_,
        const std::string &bucket_,
        const std::string &region_,
        const std::filesystem::path &path_to_
    );

    const std::string &get_id() const override;
    std::variant<upload_session_t, std::string> start(unsigned long long total_length, const upload_metadata_t &metadata) override;
    std::optional<std::string> transfer(const upload_session_t &session, unsigned long long offset, std::string_view chunk) override;
    std::variant<remote_artifact_t, finish_error_t> finish(const upload_session_t &session, const upload_metadata_t &metadata) override;
    void abandon(const upload_session_t &session) override;

    // object key a payload with this name is stored under
    std::string object_key(const std::string &object_name) const;

  private:
    struct multipart_t {
        std::string object;
        unsigned long long next_offset;
        std::list<minio::s3::Part> parts;
    };

    const std::string id;
    const std::string bucket;
    const std::string region;
    const std::filesystem::path path_to;
    std::unique_ptr<minio::s3::BaseUrl> base_url;
    std::unique_ptr<minio::creds::Provider> provider;
    std::unique_ptr<minio::s3::Client> client;

    // upload id -> parts uploaded so far
    std::unordered_map<std::string, multipart_t> uploads;
};
