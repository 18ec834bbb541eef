#include <memory>

#include <curl/curl.h>

#include "./curl.hpp"

#define CONNECT_TIMEOUT_SECONDS 30
#define USER_AGENT "media-relay"

typedef std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_handle_t;
typedef std::unique_ptr<curl_mime, decltype(&curl_mime_free)> curl_mime_handle_t;

static size_t write_buffer_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto& mem = *static_cast<std::string*>(userp);
    mem.append(static_cast<char*>(contents), realsize);
    return realsize;
}

static std::variant<http_response_t, std::string> perform(CURL *curl) {
    http_response_t response { 0, "" };
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_buffer_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, (long) CONNECT_TIMEOUT_SECONDS);
    const auto res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        return std::string("Curl error: ") + std::string(curl_easy_strerror(res));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::variant<http_response_t, std::string> http_get(const std::string &url) {
    curl_handle_t curl { curl_easy_init(), &curl_easy_cleanup };
    if (!curl) {
        return std::string("Cannot start Curl");
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    return perform(curl.get());
}

std::variant<http_response_t, std::string> http_post_form(const std::string &url, const std::vector<form_field_t> &fields) {
    curl_handle_t curl { curl_easy_init(), &curl_easy_cleanup };
    if (!curl) {
        return std::string("Cannot start Curl");
    }
    curl_mime_handle_t mime { curl_mime_init(curl.get()), &curl_mime_free };
    if (!mime) {
        return std::string("Cannot create multipart form");
    }
    for (const auto &f : fields) {
        curl_mimepart *part = curl_mime_addpart(mime.get());
        curl_mime_name(part, f.name.c_str());
        curl_mime_data(part, f.value.data(), f.value.size());
        if (f.file_name.has_value()) {
            curl_mime_filename(part, f.file_name.value().c_str());
        }
        if (f.content_type.has_value()) {
            curl_mime_type(part, f.content_type.value().c_str());
        }
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    return perform(curl.get());
}

std::string escape_url_component(const std::string &value) {
    char *escaped = curl_easy_escape(nullptr, value.c_str(), (int) value.size());
    if (escaped == nullptr) {
        return value;
    }
    std::string ret(escaped);
    curl_free(escaped);
    return ret;
}

bool is_transient_status(long status) {
    return status == 429 || status == 0;
}
