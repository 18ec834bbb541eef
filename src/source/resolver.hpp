#pragma once

#include <string>
#include <variant>
#include <optional>

struct resolved_source_t {
    // fetchable URL of the payload
    std::string url;
    // provisional size, 0 if unknown. Advisory only.
    unsigned long long declared_size;
    std::string title;
    std::optional<std::string> thumbnail_url;
};

class SourceResolver {
  public:
    virtual ~SourceResolver() = default;
    virtual std::variant<resolved_source_t, std::string> resolve(const std::string &locator) = 0;
};

// The locator is the payload URL itself.
class DirectResolver : public SourceResolver {
  public:
    std::variant<resolved_source_t, std::string> resolve(const std::string &locator) override;
};

// Asks a metadata API for the payload URL, size and title:
// GET <base_url>?url=<locator>
class ApiResolver : public SourceResolver {
  public:
    explicit ApiResolver(const std::string &base_url_);
    std::variant<resolved_source_t, std::string> resolve(const std::string &locator) override;

  private:
    const std::string base_url;
};

// parses {status, data: {metadata: {title, thumbnail}, download: {url, size}}}
std::variant<resolved_source_t, std::string> parse_resolver_response(const std::string &body);

// last path segment of a URL without query, or the whole locator
std::string title_from_locator(const std::string &locator);
