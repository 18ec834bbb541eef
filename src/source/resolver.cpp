#include <nlohmann/json.hpp>

#include "../curl/curl.hpp"

#include "./resolver.hpp"

using json = nlohmann::json;

std::string title_from_locator(const std::string &locator) {
    auto end = locator.find_first_of("?#");
    if (end == std::string::npos) {
        end = locator.size();
    }
    auto path = locator.substr(0, end);
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash + 1 >= path.size()) {
        return locator;
    }
    return path.substr(slash + 1);
}

std::variant<resolved_source_t, std::string> DirectResolver::resolve(const std::string &locator) {
    if (locator.empty()) {
        return std::string("Empty source locator");
    }
    return resolved_source_t { locator, 0, title_from_locator(locator), std::nullopt };
}

ApiResolver::ApiResolver(const std::string &base_url_) : base_url {base_url_} {}

std::variant<resolved_source_t, std::string> ApiResolver::resolve(const std::string &locator) {
    const auto separator = base_url.find('?') == std::string::npos ? "?" : "&";
    const auto request_url = base_url + separator + "url=" + escape_url_component(locator);
    const auto ret = http_get(request_url);
    if (std::holds_alternative<std::string>(ret)) {
        return std::get<std::string>(ret);
    }
    const auto &response = std::get<http_response_t>(ret);
    if (response.status >= 400) {
        return std::string("Resolver returned HTTP ") + std::to_string(response.status);
    }
    return parse_resolver_response(response.body);
}

std::variant<resolved_source_t, std::string> parse_resolver_response(const std::string &body) {
    try {
        const auto doc = json::parse(body);
        if (!doc.value("status", false)) {
            return std::string("Source not found");
        }
        const auto &data = doc.at("data");
        const auto &download = data.at("download");
        resolved_source_t source;
        source.url = download.at("url").get<std::string>();
        source.declared_size = 0;
        if (download.contains("size") && download["size"].is_number()) {
            source.declared_size = download["size"].get<unsigned long long>();
        }
        source.title = title_from_locator(source.url);
        if (data.contains("metadata")) {
            const auto &metadata = data["metadata"];
            if (metadata.contains("title") && metadata["title"].is_string()) {
                source.title = metadata["title"].get<std::string>();
            }
            if (metadata.contains("thumbnail") && metadata["thumbnail"].is_string()) {
                source.thumbnail_url = metadata["thumbnail"].get<std::string>();
            }
        }
        return source;
    } catch (const json::exception &e) {
        return std::string("Malformed resolver response: ") + e.what();
    }
}
