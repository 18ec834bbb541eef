#pragma once

#include <memory>
#include <string>
#include <variant>
#include <optional>
#include <functional>

struct fragment_t {
    std::string data;
};

struct stream_end_t {};

struct stream_error_t {
    std::string error;
};

typedef std::variant<fragment_t, stream_end_t, stream_error_t> stream_event_t;

// Pull-style inbound stream. The consumer asks for the next fragment; not
// asking is what suspends the transfer, destroying the source releases it.
class FragmentSource {
  public:
    virtual ~FragmentSource() = default;

    // blocks until a fragment, the end of the stream or an error is available
    virtual stream_event_t next() = 0;

    // length announced by the transport, once known
    virtual std::optional<unsigned long long> declared_length() const = 0;
};

// checked by a source while it waits for data, true aborts the wait
typedef std::function<bool()> abort_check_t;

typedef std::function<std::unique_ptr<FragmentSource>(const std::string &url, abort_check_t should_abort)> fragment_source_factory_t;
