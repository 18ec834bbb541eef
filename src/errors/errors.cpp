#include "./errors.hpp"

const char *relay_error_name(relay_error_kind_t kind) {
    switch (kind) {
    case RELAY_ERROR_SOURCE_UNAVAILABLE:
        return "SourceUnavailable";
    case RELAY_ERROR_DOWNLOAD_FAILED:
        return "DownloadFailed";
    case RELAY_ERROR_CANCELLED:
        return "Cancelled";
    case RELAY_ERROR_DESTINATION_SESSION_FAILED:
        return "DestinationSessionFailed";
    case RELAY_ERROR_SECONDARY_ARTIFACT_FAILED:
        return "SecondaryArtifactFailed";
    case RELAY_ERROR_ALL_DESTINATIONS_FAILED:
        return "AllDestinationsFailed";
    default:
        return "<>";
    }
}

std::string describe_error(const relay_error_t &error) {
    if (error.message.empty()) {
        return relay_error_name(error.kind);
    }
    return std::string(relay_error_name(error.kind)) + ": " + error.message;
}
