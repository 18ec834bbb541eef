#include "./http_source.hpp"

#define CONNECT_TIMEOUT_SECONDS 30

HttpFragmentSource::HttpFragmentSource(const std::string &url_, abort_check_t should_abort_) :
    url {url_},
    should_abort {std::move(should_abort_)},
    multi {curl_multi_init()},
    easy {curl_easy_init()},
    done {false},
    result {CURLE_OK} {
    if (multi == nullptr || easy == nullptr) {
        done = true;
        result = CURLE_FAILED_INIT;
        return;
    }
    curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &HttpFragmentSource::write_callback);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, (long) CONNECT_TIMEOUT_SECONDS);
    // no overall timeout, large media takes as long as it takes
    curl_easy_setopt(easy, CURLOPT_TIMEOUT, 0L);
    curl_multi_add_handle(multi, easy);
}

HttpFragmentSource::~HttpFragmentSource() {
    if (multi != nullptr && easy != nullptr) {
        curl_multi_remove_handle(multi, easy);
    }
    if (easy != nullptr) {
        curl_easy_cleanup(easy);
    }
    if (multi != nullptr) {
        curl_multi_cleanup(multi);
    }
}

size_t HttpFragmentSource::write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
    size_t realsize = size * nmemb;
    auto self = static_cast<HttpFragmentSource *>(userp);
    self->pending.emplace_back(static_cast<char *>(contents), realsize);
    return realsize;
}

// runs the transfer until at least one fragment is buffered or it completes
std::optional<std::string> HttpFragmentSource::pump() {
    while (pending.empty() && !done) {
        if (should_abort && should_abort()) {
            return std::string("Transfer aborted");
        }
        int running = 0;
        const auto mc = curl_multi_perform(multi, &running);
        if (mc != CURLM_OK) {
            return std::string("Curl multi error: ") + curl_multi_strerror(mc);
        }
        int left = 0;
        while (CURLMsg *msg = curl_multi_info_read(multi, &left)) {
            if (msg->msg == CURLMSG_DONE) {
                done = true;
                result = msg->data.result;
            }
        }
        if (!pending.empty() || done) {
            break;
        }
        const auto pc = curl_multi_poll(multi, nullptr, 0, SOURCE_POLL_INTERVAL_MS, nullptr);
        if (pc != CURLM_OK) {
            return std::string("Curl multi error: ") + curl_multi_strerror(pc);
        }
    }
    return std::nullopt;
}

stream_event_t HttpFragmentSource::next() {
    const auto pump_error = pump();
    if (pump_error.has_value()) {
        return stream_error_t { pump_error.value() };
    }
    if (!pending.empty()) {
        fragment_t fragment { std::move(pending.front()) };
        pending.pop_front();
        return fragment;
    }
    if (result != CURLE_OK) {
        return stream_error_t { std::string("Download with Curl error: ") + curl_easy_strerror(result) };
    }
    return stream_end_t {};
}

std::optional<unsigned long long> HttpFragmentSource::declared_length() const {
    if (easy == nullptr) {
        return std::nullopt;
    }
    curl_off_t length = -1;
    if (curl_easy_getinfo(easy, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK || length < 0) {
        return std::nullopt;
    }
    return (unsigned long long) length;
}

fragment_source_factory_t http_fragment_source_factory() {
    return [](const std::string &url, abort_check_t should_abort) -> std::unique_ptr<FragmentSource> {
        return std::make_unique<HttpFragmentSource>(url, std::move(should_abort));
    };
}
