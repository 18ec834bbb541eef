#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>

struct http_response_t {
    long status;
    std::string body;
};

// one part of a multipart/form-data body. value is not copied by the
// struct, the caller keeps it alive for the duration of the request.
struct form_field_t {
    std::string name;
    std::string_view value;
    // set for file parts
    std::optional<std::string> file_name;
    std::optional<std::string> content_type;
};

// returns the response (including HTTP error statuses) or a transport error
std::variant<http_response_t, std::string> http_get(const std::string &url);

std::variant<http_response_t, std::string> http_post_form(const std::string &url, const std::vector<form_field_t> &fields);

std::string escape_url_component(const std::string &value);

// true for statuses that are worth retrying: throttling and no response at all
bool is_transient_status(long status);
