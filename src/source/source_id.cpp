#include <regex>

#include "./source_id.hpp"

#define VIDEO_ID_PATTERN "([A-Za-z0-9_-]{11})"

static std::string trim(const std::string &value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string source_id_for(const std::string &locator) {
    // also covers www. and m. hosts
    static const std::regex video_url(
        "(?:youtube\\.com/watch\\?v=|youtube\\.com/shorts/|youtu\\.be/)" VIDEO_ID_PATTERN,
        std::regex::ECMAScript | std::regex::icase
    );
    const auto trimmed = trim(locator);
    std::smatch match;
    if (std::regex_search(trimmed, match, video_url)) {
        return match[1].str();
    }
    return trimmed;
}
