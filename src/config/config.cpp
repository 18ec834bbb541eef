#include <cstdlib>
#include <fstream>
#include <sstream>

#include "./config.hpp"
#include "../source/source_id.hpp"

static std::string trim(const std::string &value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

static std::unordered_map<std::string, std::string> split_pairs(const std::string &spec) {
    std::unordered_map<std::string, std::string> pairs;
    std::stringstream stream(spec);
    std::string item;
    while (std::getline(stream, item, ',')) {
        const auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        pairs[trim(item.substr(0, eq))] = trim(item.substr(eq + 1));
    }
    return pairs;
}

static std::string first_of(const std::unordered_map<std::string, std::string> &pairs, std::initializer_list<const char *> keys) {
    for (const auto k : keys) {
        const auto it = pairs.find(k);
        if (it != pairs.end()) {
            return it->second;
        }
    }
    return "";
}

std::variant<destination_config_t, std::string> parse_destination_spec(const std::string &spec) {
    const auto pairs = split_pairs(spec);
    destination_config_t config;
    config.id = first_of(pairs, {"id"});
    if (config.id.empty()) {
        return std::string("Destination id is not set in \"") + spec + "\"";
    }
    const auto type = first_of(pairs, {"type"});
    if (type == "graph" || type.empty()) {
        config.kind = DESTINATION_KIND_GRAPH;
    } else if (type == "s3") {
        config.kind = DESTINATION_KIND_S3;
    } else {
        return std::string("Unknown destination type \"") + type + "\"";
    }
    config.endpoint = first_of(pairs, {"endpoint", "url"});
    config.account = first_of(pairs, {"account", "page", "bucket"});
    config.credential = first_of(pairs, {"token", "access_key"});
    config.secret = first_of(pairs, {"secret", "secret_key"});
    config.region = first_of(pairs, {"region"});
    config.path = first_of(pairs, {"path"});

    if (config.account.empty()) {
        return std::string("Destination \"") + config.id + "\" has no account";
    }
    if (config.credential.empty()) {
        return std::string("Destination \"") + config.id + "\" has no credential";
    }
    if (config.kind == DESTINATION_KIND_GRAPH && config.endpoint.empty()) {
        config.endpoint = DEFAULT_GRAPH_ENDPOINT;
    }
    if (config.kind == DESTINATION_KIND_S3) {
        if (config.endpoint.empty()) {
            return std::string("S3 destination \"") + config.id + "\" has no endpoint";
        }
        if (config.secret.empty()) {
            return std::string("S3 destination \"") + config.id + "\" has no secret key";
        }
    }
    return config;
}

std::variant<std::vector<destination_config_t>, std::string> load_destinations_file(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::string("Cannot open destinations file \"") + path + "\"";
    }
    std::vector<destination_config_t> ret;
    std::string line;
    unsigned int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        const auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        const auto parsed = parse_destination_spec(trimmed);
        if (std::holds_alternative<std::string>(parsed)) {
            return path + ":" + std::to_string(line_number) + ": " + std::get<std::string>(parsed);
        }
        ret.push_back(std::get<destination_config_t>(parsed));
    }
    return ret;
}

std::optional<destination_config_t> destination_from_env() {
    const char *page_id = std::getenv(ENV_PAGE_ID);
    const char *token = std::getenv(ENV_PAGE_ACCESS_TOKEN);
    if (page_id == nullptr || token == nullptr || *page_id == '\0' || *token == '\0') {
        return std::nullopt;
    }
    destination_config_t config;
    config.id = ENV_DESTINATION_ID;
    config.kind = DESTINATION_KIND_GRAPH;
    config.endpoint = DEFAULT_GRAPH_ENDPOINT;
    config.account = page_id;
    config.credential = token;
    return config;
}

source_spec_t parse_source_spec(const std::string &spec) {
    const auto pairs = split_pairs(spec);
    const auto url = first_of(pairs, {"url", "locator"});
    if (url.empty()) {
        const auto locator = trim(spec);
        return source_spec_t { source_id_for(locator), locator };
    }
    auto id = first_of(pairs, {"id"});
    if (id.empty()) {
        id = source_id_for(url);
    }
    return source_spec_t { id, url };
}
