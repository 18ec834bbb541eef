#pragma once

#include <deque>

#include <curl/curl.h>

#include "./fragment_source.hpp"

// how long a single wait for socket activity may block
#define SOURCE_POLL_INTERVAL_MS 100

// Streams an HTTP body fragment by fragment. Drives a curl multi handle
// from next(), so the transfer only advances while the consumer pulls.
class HttpFragmentSource : public FragmentSource {
  public:
    HttpFragmentSource(const std::string &url_, abort_check_t should_abort_ = nullptr);
    ~HttpFragmentSource() override;

    HttpFragmentSource(const HttpFragmentSource &) = delete;
    HttpFragmentSource &operator=(const HttpFragmentSource &) = delete;

    stream_event_t next() override;
    std::optional<unsigned long long> declared_length() const override;

  private:
    static size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp);
    std::optional<std::string> pump();

    const std::string url;
    abort_check_t should_abort;
    CURLM *multi;
    CURL *easy;
    std::deque<std::string> pending;
    bool done;
    CURLcode result;
};

fragment_source_factory_t http_fragment_source_factory();
