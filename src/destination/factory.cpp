#include "./destination.hpp"
#include "./graph_destination.hpp"
#include "../s3/s3.hpp"

std::variant<std::unique_ptr<UploadDestination>, std::string> make_destination(const destination_config_t &config) {
    switch (config.kind) {
        case DESTINATION_KIND_GRAPH:
            if (config.account.empty() || config.credential.empty()) {
                return std::string("Graph destination \"") + config.id + "\" needs an account and a token";
            }
            return std::unique_ptr<UploadDestination>(std::make_unique<GraphDestination>(
                config.id, config.endpoint.empty() ? DEFAULT_GRAPH_ENDPOINT : config.endpoint, config.account, config.credential));
        case DESTINATION_KIND_S3:
            if (config.endpoint.empty() || config.account.empty()) {
                return std::string("S3 destination \"") + config.id + "\" needs an endpoint and a bucket";
            }
            return std::unique_ptr<UploadDestination>(std::make_unique<S3Destination>(
                config.id, config.endpoint, config.credential, config.secret, config.account, config.region, config.path));
    }
    return std::string("Unknown destination kind for \"") + config.id + "\"";
}
