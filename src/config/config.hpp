#pragma once

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <unordered_map>

#define DEFAULT_GRAPH_ENDPOINT "https://graph.facebook.com/v18.0"
#define DEFAULT_STATE_FILE "media-relay.sqlite"
#define DEFAULT_JOB_DELAY_MS 2000

// environment fallback for a single Graph destination
#define ENV_PAGE_ID "PAGE_ID"
#define ENV_PAGE_ACCESS_TOKEN "PAGE_ACCESS_TOKEN"
#define ENV_DESTINATION_ID "page"

enum destination_kind_t {
    DESTINATION_KIND_GRAPH = 0,
    DESTINATION_KIND_S3 = 1
};

// Credentials and endpoint identity of one destination. Only lives as long
// as the upload that needs it, never persisted.
struct destination_config_t {
    std::string id;
    destination_kind_t kind;
    // Graph API base or S3 service URL
    std::string endpoint;
    // page id for Graph, bucket for S3
    std::string account;
    // bearer token for Graph, access key for S3
    std::string credential;
    // S3 secret key
    std::string secret;
    std::string region;
    // S3 key prefix
    std::string path;
};

typedef std::unordered_map<std::string, destination_config_t> credential_store_t;

// "id=fb,type=graph,account=123,token=abc" or
// "id=archive,type=s3,endpoint=play.min.io,account=bucket,access_key=..,secret_key=.."
std::variant<destination_config_t, std::string> parse_destination_spec(const std::string &spec);

// one spec per line, empty lines and lines starting with '#' are skipped
std::variant<std::vector<destination_config_t>, std::string> load_destinations_file(const std::string &path);

std::optional<destination_config_t> destination_from_env();

struct source_spec_t {
    std::string id;
    std::string locator;
};

// "id=abc,url=https://..." or a bare locator. Without an explicit id the
// id is derived from the locator, see source_id_for.
source_spec_t parse_source_spec(const std::string &spec);
